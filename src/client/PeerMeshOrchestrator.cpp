#include "client/PeerMeshOrchestrator.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace portal::client {

namespace json = boost::json;
using common::MessageType;
using common::SessionDescription;

PeerMeshOrchestrator::PeerMeshOrchestrator(std::string self_id, PeerConnectionFactory& factory, SendFn send)
    : self_id_(std::move(self_id)),
      factory_(factory),
      send_(std::move(send)) {}

PeerMeshOrchestrator::~PeerMeshOrchestrator() {
    // No observer calls while tearing down.
    media_observer_ = nullptr;
    keyframe_request_ = nullptr;
    close_all();
}

void PeerMeshOrchestrator::update_roster(const std::vector<std::string>& participants) {
    std::set<std::string> next;
    for (const auto& id : participants) {
        if (!id.empty() && id != self_id_) next.insert(id);
    }

    std::vector<std::string> gone;
    for (const auto& [peer_id, link] : links_) {
        if (next.count(peer_id) == 0) gone.push_back(peer_id);
    }
    for (const auto& peer_id : gone) close_link(peer_id, "left the roster");

    roster_ = std::move(next);

    for (const auto& peer_id : roster_) {
        if (has_link(peer_id)) continue;
        if (is_initiator_for(peer_id)) {
            start_offer(peer_id);
        } else {
            spdlog::debug("[Mesh] waiting for offer from {}", peer_id);
        }
    }
}

void PeerMeshOrchestrator::handle_offer(const std::string& from, const SessionDescription& offer) {
    if (from.empty() || from == self_id_) return;
    if (roster_.count(from) == 0) {
        spdlog::debug("[Mesh] ignoring offer from {} outside the call", from);
        return;
    }

    if (has_link(from)) close_link(from, "peer restarted negotiation");

    PeerLink* link = open_link(from);
    if (!link) return;

    const auto serial = link->serial;
    link->connection->accept_offer(
        offer,
        [this, from, serial](SessionDescription answer) {
            if (!is_live(from, serial)) return;
            send_signal(MessageType::Answer, from, json::object{{"sdp", common::to_json(answer)}});
        },
        [this, from, serial](const std::string& what) {
            if (!is_live(from, serial)) return;
            spdlog::error("[Mesh] error handling offer from {}: {}", from, what);
            close_link(from, "answer failed");
        });
}

void PeerMeshOrchestrator::handle_answer(const std::string& from, const SessionDescription& answer) {
    auto it = links_.find(from);
    if (it == links_.end()) {
        spdlog::warn("[Mesh] no peer connection for answer from {}", from);
        return;
    }

    const auto serial = it->second.serial;
    it->second.connection->accept_answer(
        answer,
        [this, from, serial] {
            if (!is_live(from, serial)) return;
            spdlog::debug("[Mesh] negotiated with {}", from);
        },
        [this, from, serial](const std::string& what) {
            if (!is_live(from, serial)) return;
            spdlog::error("[Mesh] error handling answer from {}: {}", from, what);
            close_link(from, "answer rejected");
        });
}

void PeerMeshOrchestrator::handle_ice_candidate(const std::string& from, const common::IceCandidate& candidate) {
    auto it = links_.find(from);
    if (it == links_.end()) {
        spdlog::debug("[Mesh] dropping ICE candidate from {}", from);
        return;
    }
    it->second.connection->add_remote_candidate(candidate);
}

void PeerMeshOrchestrator::send_video(const EncodedVideoFrame& frame) {
    for (auto& [peer_id, link] : links_) link.connection->send_video(frame);
}

void PeerMeshOrchestrator::close_all() {
    roster_.clear();
    while (!links_.empty()) close_link(links_.begin()->first, "left the call");
}

std::vector<std::string> PeerMeshOrchestrator::linked_peers() const {
    std::vector<std::string> peers;
    peers.reserve(links_.size());
    for (const auto& [peer_id, link] : links_) peers.push_back(peer_id);
    return peers;
}

std::shared_ptr<RemoteMedia> PeerMeshOrchestrator::remote_media(const std::string& peer_id) const {
    auto it = links_.find(peer_id);
    return it == links_.end() ? nullptr : it->second.remote_media;
}

bool PeerMeshOrchestrator::is_live(const std::string& peer_id, std::uint64_t serial) const {
    if (roster_.count(peer_id) == 0) return false;
    auto it = links_.find(peer_id);
    return it != links_.end() && it->second.serial == serial;
}

PeerMeshOrchestrator::PeerLink* PeerMeshOrchestrator::open_link(const std::string& peer_id) {
    PeerLink link;
    link.peer_id = peer_id;
    link.serial = next_serial_++;
    try {
        link.connection = factory_.create(peer_id);
    } catch (const std::exception& e) {
        spdlog::error("[Mesh] cannot create peer connection for {}: {}", peer_id, e.what());
        return nullptr;
    }
    if (!link.connection) return nullptr;

    const auto serial = link.serial;
    link.connection->set_on_local_candidate([this, peer_id, serial](common::IceCandidate candidate) {
        if (!is_live(peer_id, serial)) return;
        send_signal(MessageType::IceCandidate, peer_id, json::object{{"candidate", common::to_json(candidate)}});
    });

    link.connection->set_on_state_change([this, peer_id, serial](PeerState state) {
        if (!is_live(peer_id, serial)) return;
        spdlog::info("[Mesh] connection state with {}: {}", peer_id, to_string(state));
        if (state == PeerState::Failed || state == PeerState::Closed) close_link(peer_id, to_string(state));
    });

    link.connection->set_on_remote_media([this, peer_id, serial](std::shared_ptr<RemoteMedia> media) {
        if (!is_live(peer_id, serial)) return;
        spdlog::info("[Mesh] received remote media from {}", peer_id);
        links_.at(peer_id).remote_media = media;
        if (media_observer_) media_observer_(peer_id, std::move(media));
    });

    link.connection->set_on_video_open([this, peer_id, serial] {
        if (!is_live(peer_id, serial)) return;
        spdlog::debug("[Mesh] video track to {} is open", peer_id);
        if (keyframe_request_) keyframe_request_();
    });

    auto result = links_.insert_or_assign(peer_id, std::move(link));
    spdlog::info("[Mesh] opened connection to {}", peer_id);
    return &result.first->second;
}

void PeerMeshOrchestrator::close_link(const std::string& peer_id, const char* reason) {
    auto it = links_.find(peer_id);
    if (it == links_.end()) return;

    // Unlink first so that callbacks raised by close() see a dead link.
    PeerLink link = std::move(it->second);
    links_.erase(it);

    spdlog::info("[Mesh] closing connection to {} ({})", peer_id, reason);
    link.connection->close();

    if (link.remote_media && media_observer_) media_observer_(peer_id, nullptr);
}

void PeerMeshOrchestrator::start_offer(const std::string& peer_id) {
    PeerLink* link = open_link(peer_id);
    if (!link) return;

    const auto serial = link->serial;
    link->connection->create_offer(
        [this, peer_id, serial](SessionDescription offer) {
            if (!is_live(peer_id, serial)) return;
            send_signal(MessageType::Offer, peer_id, json::object{{"sdp", common::to_json(offer)}});
        },
        [this, peer_id, serial](const std::string& what) {
            if (!is_live(peer_id, serial)) return;
            spdlog::error("[Mesh] error creating offer for {}: {}", peer_id, what);
            close_link(peer_id, "offer failed");
        });
}

void PeerMeshOrchestrator::send_signal(MessageType type, const std::string& peer_id, json::object body) {
    body["from"] = self_id_;
    body["to"] = peer_id;

    auto env = common::make_envelope(type, std::move(body));
    env.from = self_id_;
    env.to = peer_id;
    if (send_) send_(env);
}

} // namespace portal::client
