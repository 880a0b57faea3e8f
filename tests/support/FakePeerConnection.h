#pragma once

#include "client/PeerConnection.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace portal::test {

// Records what the orchestrator asked of a connection and lets the test
// deliver the completions later, the way the event loop would.
struct FakePeerRecord {
    std::string peer_id;
    bool closed = false;

    bool offer_requested = false;
    std::optional<common::SessionDescription> remote_offer;
    std::optional<common::SessionDescription> remote_answer;
    std::vector<common::IceCandidate> remote_candidates;
    std::vector<client::EncodedVideoFrame> sent_video;

    client::PeerConnection::DescriptionCallback on_description;
    client::PeerConnection::DoneCallback on_done;
    client::PeerConnection::ErrorCallback on_error;
    client::PeerConnection::CandidateCallback on_candidate;
    client::PeerConnection::StateCallback on_state;
    client::PeerConnection::MediaCallback on_media;
    client::PeerConnection::DoneCallback on_video_open;

    void complete_description(const std::string& type) {
        auto cb = on_description;
        if (cb) cb(common::SessionDescription{type, "v=0 " + peer_id});
    }

    void complete_done() {
        auto cb = on_done;
        if (cb) cb();
    }

    void fail(const std::string& what) {
        auto cb = on_error;
        if (cb) cb(what);
    }

    void emit_candidate(const std::string& candidate) {
        auto cb = on_candidate;
        if (cb) cb(common::IceCandidate{candidate, "0"});
    }

    void emit_state(client::PeerState state) {
        auto cb = on_state;
        if (cb) cb(state);
    }

    void emit_media(std::shared_ptr<client::RemoteMedia> media) {
        auto cb = on_media;
        if (cb) cb(std::move(media));
    }

    void emit_video_open() {
        auto cb = on_video_open;
        if (cb) cb();
    }
};

class FakeRemoteMedia : public client::RemoteMedia {
public:
    explicit FakeRemoteMedia(std::string mid) : mid_(std::move(mid)) {}
    std::string mid() const override { return mid_; }

private:
    std::string mid_;
};

class FakePeerConnection : public client::PeerConnection {
public:
    explicit FakePeerConnection(std::shared_ptr<FakePeerRecord> record) : record_(std::move(record)) {}

    void create_offer(DescriptionCallback on_offer, ErrorCallback on_error) override {
        record_->offer_requested = true;
        record_->on_description = std::move(on_offer);
        record_->on_error = std::move(on_error);
    }

    void accept_offer(const common::SessionDescription& offer,
                      DescriptionCallback on_answer, ErrorCallback on_error) override {
        record_->remote_offer = offer;
        record_->on_description = std::move(on_answer);
        record_->on_error = std::move(on_error);
    }

    void accept_answer(const common::SessionDescription& answer,
                       DoneCallback on_done, ErrorCallback on_error) override {
        record_->remote_answer = answer;
        record_->on_done = std::move(on_done);
        record_->on_error = std::move(on_error);
    }

    void add_remote_candidate(const common::IceCandidate& candidate) override {
        record_->remote_candidates.push_back(candidate);
    }

    void send_video(const client::EncodedVideoFrame& frame) override { record_->sent_video.push_back(frame); }

    void close() override { record_->closed = true; }

    void set_on_local_candidate(CandidateCallback cb) override { record_->on_candidate = std::move(cb); }
    void set_on_state_change(StateCallback cb) override { record_->on_state = std::move(cb); }
    void set_on_remote_media(MediaCallback cb) override { record_->on_media = std::move(cb); }
    void set_on_video_open(DoneCallback cb) override { record_->on_video_open = std::move(cb); }

private:
    std::shared_ptr<FakePeerRecord> record_;
};

class FakePeerConnectionFactory : public client::PeerConnectionFactory {
public:
    std::unique_ptr<client::PeerConnection> create(const std::string& peer_id) override {
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("no ICE transport");
        }
        auto record = std::make_shared<FakePeerRecord>();
        record->peer_id = peer_id;
        created.push_back(record);
        return std::make_unique<FakePeerConnection>(std::move(record));
    }

    // Most recent connection created for the peer.
    std::shared_ptr<FakePeerRecord> last_for(const std::string& peer_id) const {
        for (auto it = created.rbegin(); it != created.rend(); ++it) {
            if ((*it)->peer_id == peer_id) return *it;
        }
        return nullptr;
    }

    std::size_t count_for(const std::string& peer_id) const {
        std::size_t n = 0;
        for (const auto& r : created) {
            if (r->peer_id == peer_id) ++n;
        }
        return n;
    }

    bool fail_next = false;
    std::vector<std::shared_ptr<FakePeerRecord>> created;
};

} // namespace portal::test
