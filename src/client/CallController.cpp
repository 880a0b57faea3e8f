#include "client/CallController.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace portal::client {

namespace json = boost::json;
using common::Envelope;
using common::MessageType;

CallController::CallController(Identity identity, PeerMeshOrchestrator& mesh, JoinCredentialIssuer& issuer,
                               SendFn send)
    : identity_(std::move(identity)),
      mesh_(mesh),
      issuer_(issuer),
      send_(std::move(send)) {}

void CallController::on_connected() {
    spdlog::info("[Device] connected to signaling server, registering {}", identity_.device_id);
    send(common::make_envelope(MessageType::Register, json::object{
        {"deviceId", identity_.device_id},
        {"groupId", identity_.group_id},
        {"deviceName", identity_.device_name}
    }));
}

void CallController::on_disconnected() {
    spdlog::warn("[Device] disconnected from signaling server");
    registered_ = false;
    present_ids_.clear();
    if (in_call_) leave_call("signaling lost");
}

void CallController::handle_message(const std::string& text) {
    try {
        dispatch(common::parse_envelope(text));
    } catch (const common::ProtocolError& e) {
        spdlog::warn("[Device] ignoring message: {}", e.what());
    }
}

void CallController::dispatch(const Envelope& env) {
    const auto& payload = env.payload;

    switch (env.type) {
        case MessageType::RegisterAck:
            registered_ = true;
            spdlog::info("[Device] registered in group {}", identity_.group_id);
            if (motion_check_ && motion_check_()) report_motion_detected();
            break;

        case MessageType::PresenceUpdate:
            on_presence_update(payload);
            break;

        case MessageType::Offer: {
            const std::string from = common::find_string(payload, "from").value_or(env.from.value_or(""));
            mesh_.handle_offer(from, common::description_from_json(common::require_object(payload, "sdp")));
            break;
        }

        case MessageType::Answer: {
            const std::string from = common::find_string(payload, "from").value_or(env.from.value_or(""));
            mesh_.handle_answer(from, common::description_from_json(common::require_object(payload, "sdp")));
            break;
        }

        case MessageType::IceCandidate: {
            const std::string from = common::find_string(payload, "from").value_or(env.from.value_or(""));
            mesh_.handle_ice_candidate(from, common::candidate_from_json(common::require_object(payload, "candidate")));
            break;
        }

        case MessageType::Error:
            spdlog::warn("[Device] server error {}: {}",
                         common::find_string(payload, "code").value_or("?"),
                         common::find_string(payload, "message").value_or(""));
            break;

        case MessageType::ConferenceStart:
        case MessageType::ConferenceEnd:
        case MessageType::PeerJoined:
        case MessageType::PeerLeft:
            spdlog::info("[Device] {} {}", common::to_string(env.type), json::serialize(payload));
            break;

        default:
            spdlog::debug("[Device] unexpected {}", common::to_string(env.type));
            break;
    }
}

void CallController::on_presence_update(const json::object& payload) {
    const std::string group_id = common::require_string(payload, "groupId");
    if (group_id != identity_.group_id) return;

    const auto* list = payload.if_contains("presentDevices");
    if (!list || !list->is_array()) {
        throw common::ProtocolError(common::error_code::kInvalidPayload, "missing presentDevices");
    }

    std::vector<std::string> ids;
    for (const auto& item : list->get_array()) {
        if (!item.is_object()) continue;
        ids.push_back(common::device_from_json(item.get_object()).id);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    present_ids_ = std::move(ids);

    spdlog::info("[Device] {} devices present in {}", present_ids_.size(), group_id);

    const bool self_present =
        std::binary_search(present_ids_.begin(), present_ids_.end(), identity_.device_id);
    const bool quorum = self_present && present_ids_.size() >= kQuorum;

    if (quorum) {
        if (!in_call_) join_call();
        mesh_.update_roster(present_ids_);
    } else if (in_call_) {
        leave_call(self_present ? "not enough participants" : "no longer present");
    }
}

void CallController::join_call() {
    in_call_ = true;
    try {
        credential_ = issuer_.issue(identity_.group_id, identity_.device_name, identity_.device_id);
    } catch (const std::exception& e) {
        credential_.reset();
        spdlog::error("[Device] could not obtain a join credential: {}", e.what());
    }
    spdlog::info("[Device] joining call in {}", identity_.group_id);
}

void CallController::leave_call(const char* reason) {
    spdlog::info("[Device] leaving call ({})", reason);
    in_call_ = false;
    credential_.reset();
    mesh_.close_all();
}

void CallController::report_motion_detected() {
    send(common::make_envelope(MessageType::MotionDetected, json::object{
        {"deviceId", identity_.device_id},
        {"timestamp", common::now_ms()}
    }));
}

void CallController::report_motion_stopped() {
    send(common::make_envelope(MessageType::MotionStopped, json::object{
        {"deviceId", identity_.device_id},
        {"timestamp", common::now_ms()}
    }));
}

void CallController::send(const Envelope& env) {
    if (send_) send_(common::serialize(env));
}

} // namespace portal::client
