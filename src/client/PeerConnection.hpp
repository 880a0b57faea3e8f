#pragma once

#include "common/Protocol.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace portal::client {

enum class PeerState { New, Connecting, Connected, Disconnected, Failed, Closed };

inline const char* to_string(PeerState state) {
    switch (state) {
        case PeerState::New:          return "new";
        case PeerState::Connecting:   return "connecting";
        case PeerState::Connected:    return "connected";
        case PeerState::Disconnected: return "disconnected";
        case PeerState::Failed:       return "failed";
        case PeerState::Closed:       return "closed";
    }
    return "unknown";
}

// Media received from a remote peer (a track handle in the WebRTC stack).
class RemoteMedia {
public:
    virtual ~RemoteMedia() = default;
    virtual std::string mid() const = 0;
};

// One encoded access unit of the local camera stream (H.264 Annex-B).
struct EncodedVideoFrame {
    std::vector<std::byte> data;
    std::chrono::duration<double> timestamp{0.0};  // since the stream started
    bool keyframe = false;
};

// One WebRTC connection to one remote peer.
//
// Every operation completes asynchronously through its callbacks, and all
// callbacks are delivered on the owner's event loop. After close() returns no
// further callback is delivered.
class PeerConnection {
public:
    using DescriptionCallback = std::function<void(common::SessionDescription)>;
    using DoneCallback        = std::function<void()>;
    using ErrorCallback       = std::function<void(const std::string& what)>;
    using CandidateCallback   = std::function<void(common::IceCandidate)>;
    using StateCallback       = std::function<void(PeerState)>;
    using MediaCallback       = std::function<void(std::shared_ptr<RemoteMedia>)>;

    virtual ~PeerConnection() = default;

    // Creates an offer and installs it as the local description.
    virtual void create_offer(DescriptionCallback on_offer, ErrorCallback on_error) = 0;

    // Installs the remote offer, then creates and installs the answer.
    virtual void accept_offer(const common::SessionDescription& offer,
                              DescriptionCallback on_answer, ErrorCallback on_error) = 0;

    virtual void accept_answer(const common::SessionDescription& answer,
                               DoneCallback on_done, ErrorCallback on_error) = 0;

    virtual void add_remote_candidate(const common::IceCandidate& candidate) = 0;

    // Sends on the outgoing video track; dropped while the track is not open.
    virtual void send_video(const EncodedVideoFrame& frame) = 0;

    virtual void close() = 0;

    virtual void set_on_local_candidate(CandidateCallback cb) = 0;
    virtual void set_on_state_change(StateCallback cb) = 0;
    virtual void set_on_remote_media(MediaCallback cb) = 0;
    // Outgoing video track became writable.
    virtual void set_on_video_open(DoneCallback cb) = 0;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;
    virtual std::unique_ptr<PeerConnection> create(const std::string& peer_id) = 0;
};

} // namespace portal::client
