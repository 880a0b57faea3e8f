#pragma once

#include "client/PeerConnection.hpp"
#include "common/Protocol.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace portal::client {

// Keeps one PeerConnection per remote participant of the call roster.
//
// Only the side whose id sorts first sends the offer, so each pair negotiates
// exactly once. Offers from devices outside the roster are dropped. Each link
// carries a serial; asynchronous continuations check that their peer is still
// in the roster and their link is still the live one before touching it.
class PeerMeshOrchestrator {
public:
    using SendFn = std::function<void(const common::Envelope&)>;
    // media is null when the peer's media went away
    using MediaObserver = std::function<void(const std::string& peer_id, std::shared_ptr<RemoteMedia> media)>;
    using KeyframeRequest = std::function<void()>;

    PeerMeshOrchestrator(std::string self_id, PeerConnectionFactory& factory, SendFn send);
    ~PeerMeshOrchestrator();

    PeerMeshOrchestrator(const PeerMeshOrchestrator&) = delete;
    PeerMeshOrchestrator& operator=(const PeerMeshOrchestrator&) = delete;

    void set_media_observer(MediaObserver observer) { media_observer_ = std::move(observer); }
    // Called when a peer's video track opens and needs a fresh keyframe.
    void set_keyframe_request(KeyframeRequest request) { keyframe_request_ = std::move(request); }

    // The list may contain our own id; it is ignored.
    void update_roster(const std::vector<std::string>& participants);

    void handle_offer(const std::string& from, const common::SessionDescription& offer);
    void handle_answer(const std::string& from, const common::SessionDescription& answer);
    void handle_ice_candidate(const std::string& from, const common::IceCandidate& candidate);

    // Local camera stream to every open link.
    void send_video(const EncodedVideoFrame& frame);

    // Leave the call: every link is closed and the roster emptied.
    void close_all();

    const std::string& self_id() const noexcept { return self_id_; }
    const std::set<std::string>& roster() const noexcept { return roster_; }
    bool has_link(const std::string& peer_id) const { return links_.count(peer_id) != 0; }
    std::vector<std::string> linked_peers() const;
    std::shared_ptr<RemoteMedia> remote_media(const std::string& peer_id) const;

private:
    struct PeerLink {
        std::string peer_id;
        std::uint64_t serial = 0;
        std::unique_ptr<PeerConnection> connection;
        std::shared_ptr<RemoteMedia> remote_media;
    };

    bool is_initiator_for(const std::string& peer_id) const { return self_id_ < peer_id; }
    bool is_live(const std::string& peer_id, std::uint64_t serial) const;

    PeerLink* open_link(const std::string& peer_id);
    void close_link(const std::string& peer_id, const char* reason);
    void start_offer(const std::string& peer_id);
    void send_signal(common::MessageType type, const std::string& peer_id, boost::json::object body);

    std::string self_id_;
    PeerConnectionFactory& factory_;
    SendFn send_;
    MediaObserver media_observer_;
    KeyframeRequest keyframe_request_;

    std::set<std::string> roster_;
    std::map<std::string, PeerLink> links_;
    std::uint64_t next_serial_ = 1;
};

} // namespace portal::client
