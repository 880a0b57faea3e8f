#include "server/SignalingHub.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace portal::server {

namespace json = boost::json;
using common::Envelope;
using common::MessageType;
using networking::ConnectionId;
namespace error_code = common::error_code;

namespace {

std::vector<std::string> ids_of(const std::vector<common::Device>& devices) {
    std::vector<std::string> ids;
    ids.reserve(devices.size());
    for (const auto& d : devices) ids.push_back(d.id);
    return ids;
}

std::vector<std::string> difference(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

std::vector<std::string> intersection(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

json::array to_json_array(const std::vector<std::string>& ids) {
    json::array arr;
    for (const auto& id : ids) arr.emplace_back(id);
    return arr;
}

} // namespace

SignalingHub::SignalingHub(DeviceStore& store, common::TimerService& timers, Options options, SendFn send)
    : store_(store),
      options_(options),
      send_(std::move(send)),
      bindings_(timers),
      presence_(timers, options.presence_timeout,
                [this](const std::string& group_id) { on_presence_changed(group_id); }) {}

void SignalingHub::handle_connect(ConnectionId connection) {
    spdlog::info("[Hub] client connected: {}", connection);
}

void SignalingHub::handle_message(ConnectionId connection, const std::string& text) {
    bindings_.touch(connection);

    Envelope env;
    try {
        env = common::parse_envelope(text);
    } catch (const common::ProtocolError& e) {
        spdlog::warn("[Hub] bad message from {}: {}", connection, e.what());
        send_error(connection, e.code(), e.what());
        return;
    }

    spdlog::debug("[Hub] {} from {}", common::to_string(env.type), connection);

    try {
        dispatch(connection, env);
    } catch (const common::ProtocolError& e) {
        spdlog::warn("[Hub] rejected {} from {}: {}",
                     common::to_string(env.type), connection, e.what());
        send_error(connection, e.code(), e.what());
    } catch (const StoreError& e) {
        spdlog::error("[Hub] device store failure: {}", e.what());
        send_error(connection, error_code::kStoreUnavailable, "Device store unavailable");
    }
}

void SignalingHub::dispatch(ConnectionId connection, const Envelope& env) {
    switch (env.type) {
        case MessageType::Register:
            on_register(connection, env.payload);
            break;
        case MessageType::MotionDetected:
            on_motion_detected(connection, env.payload);
            break;
        case MessageType::MotionStopped:
            on_motion_stopped(env.payload);
            break;
        case MessageType::Offer:
        case MessageType::Answer:
            relay(connection, env, true);
            break;
        case MessageType::IceCandidate:
            // Candidates race with teardown; a missing peer is not an error.
            relay(connection, env, false);
            break;
        default:
            throw common::ProtocolError(error_code::kUnknownType,
                                        "unexpected type: " + std::string(common::to_string(env.type)));
    }
}

void SignalingHub::on_register(ConnectionId connection, const json::object& payload) {
    const std::string device_id = common::require_string(payload, "deviceId");
    const std::string group_id = common::require_string(payload, "groupId");
    const std::string name = common::sanitize_device_name(common::find_string(payload, "deviceName").value_or(""));

    try {
        if (!store_.find_group(group_id)) {
            spdlog::info("[Hub] creating group {}", group_id);
            store_.create_group(group_id, "Family Group");
        }
    } catch (const StoreError& e) {
        spdlog::error("[Hub] failed to create group {}: {}", group_id, e.what());
        send_error(connection, error_code::kGroupCreationFailed, "Failed to create group");
        return;
    }

    try {
        auto existing = store_.find_device(device_id);
        if (!existing) {
            store_.create_device(device_id, group_id, name);
        } else if (existing->group_id != group_id) {
            try {
                store_.move_device(device_id, group_id);
            } catch (const StoreError& e) {
                spdlog::error("[Hub] failed to move {} to {}: {}", device_id, group_id, e.what());
            }
        }
    } catch (const StoreError& e) {
        spdlog::error("[Hub] failed to register {}: {}", device_id, e.what());
        send_error(connection, error_code::kRegisterFailed, "Failed to register device");
        return;
    }

    if (auto previous = bindings_.bind(device_id, connection)) {
        spdlog::info("[Hub] {} moved from connection {} to {}", device_id, *previous, connection);
    }

    send(connection, common::make_envelope(MessageType::RegisterAck, json::object{
        {"success", true},
        {"deviceId", device_id},
        {"groupId", group_id}
    }));

    spdlog::info("[Hub] device registered: {} ({}) in group {}", device_id, name, group_id);

    send(connection, presence_update(group_id));
}

void SignalingHub::on_motion_detected(ConnectionId connection, const json::object& payload) {
    const std::string device_id = common::require_string(payload, "deviceId");

    auto device = store_.find_device(device_id);
    if (!device) {
        send_error(connection, error_code::kDeviceNotFound, "Device not registered");
        return;
    }

    spdlog::debug("[Hub] motion detected for {}", device_id);
    presence_.mark_present(std::move(*device));
}

void SignalingHub::on_motion_stopped(const json::object& payload) {
    const std::string device_id = common::require_string(payload, "deviceId");
    spdlog::debug("[Hub] motion stopped for {}", device_id);
    presence_.mark_not_present(device_id);
}

void SignalingHub::relay(ConnectionId connection, const Envelope& env, bool report_missing) {
    const auto& payload = env.payload;
    const std::string to = common::require_string(payload, "to");
    if (env.type == MessageType::IceCandidate) {
        common::require_object(payload, "candidate");
    } else {
        common::require_object(payload, "sdp");
    }

    std::string from = common::find_string(payload, "from")
                           .value_or(bindings_.device_of(connection).value_or(""));

    auto target = bindings_.connection_of(to);
    if (!target) {
        if (report_missing) {
            send_error(connection, error_code::kPeerNotFound, "Device " + to + " not connected");
        } else {
            spdlog::debug("[Hub] dropping {} for unbound {}", common::to_string(env.type), to);
        }
        return;
    }

    json::object forwarded = payload;
    forwarded["from"] = from;
    forwarded["to"] = to;

    Envelope out = common::make_envelope(env.type, std::move(forwarded));
    out.from = std::move(from);
    out.to = to;
    send(*target, out);
}

void SignalingHub::handle_disconnect(ConnectionId connection) {
    const auto result = bindings_.release(connection);
    switch (result.outcome) {
        case BindingRegistry::Release::Released:
            spdlog::info("[Hub] device disconnected: {} (bound {} ms, idle {} ms)",
                         result.device_id, result.bound_for.count(), result.idle_for.count());
            presence_.mark_not_present(result.device_id);
            break;
        case BindingRegistry::Release::Superseded:
            spdlog::info("[Hub] ignoring disconnect for replaced connection {} (device {}, idle {} ms)",
                         connection, result.device_id, result.idle_for.count());
            break;
        case BindingRegistry::Release::NotBound:
            break;
    }
    spdlog::info("[Hub] client disconnected: {}", connection);
}

void SignalingHub::shutdown() {
    presence_.clear();
    conferences_.clear();
}

void SignalingHub::on_presence_changed(const std::string& group_id) {
    const auto present = presence_.present_in_group(group_id);

    spdlog::info("[Hub] presence changed for group {}: {} devices present", group_id, present.size());

    broadcast_to_group(group_id, common::make_envelope(MessageType::PresenceUpdate, json::object{
        {"groupId", group_id},
        {"presentDevices", common::to_json(present)}
    }));

    if (options_.announce_conferences) update_conference(group_id, present);
}

void SignalingHub::update_conference(const std::string& group_id, const std::vector<common::Device>& present) {
    auto it = conferences_.find(group_id);

    if (present.size() < 2) {
        if (it == conferences_.end()) return;
        conferences_.erase(it);

        spdlog::info("[Hub] ending conference for group {}", group_id);
        broadcast_to_group(group_id, common::make_envelope(MessageType::ConferenceEnd, json::object{
            {"conferenceId", group_id},
            {"reason", "Insufficient participants"}
        }));
        return;
    }

    auto participants = ids_of(present);
    std::vector<std::string> previous;
    if (it != conferences_.end()) {
        if (it->second == participants) return;
        previous = it->second;
    }
    conferences_[group_id] = participants;

    spdlog::info("[Hub] starting conference for group {} with {} participants",
                 group_id, participants.size());

    const auto start = common::make_envelope(MessageType::ConferenceStart, json::object{
        {"conferenceId", group_id},
        {"participants", to_json_array(participants)}
    });
    for (const auto& id : participants) send_to_device(id, start);

    if (previous.empty()) return;

    // Participants that were already in the call hear about the roster delta.
    const auto staying = intersection(participants, previous);
    for (const auto& joined : difference(participants, previous)) {
        const auto evt = common::make_envelope(MessageType::PeerJoined, json::object{
            {"deviceId", joined},
            {"deviceName", display_name(joined)}
        });
        for (const auto& id : staying) send_to_device(id, evt);
    }
    for (const auto& left : difference(previous, participants)) {
        const auto evt = common::make_envelope(MessageType::PeerLeft, json::object{
            {"deviceId", left},
            {"deviceName", display_name(left)}
        });
        for (const auto& id : staying) send_to_device(id, evt);
    }
}

Envelope SignalingHub::presence_update(const std::string& group_id) const {
    return common::make_envelope(MessageType::PresenceUpdate, json::object{
        {"groupId", group_id},
        {"presentDevices", common::to_json(presence_.present_in_group(group_id))}
    });
}

std::string SignalingHub::display_name(const std::string& device_id) const {
    try {
        if (auto device = store_.find_device(device_id)) return device->name;
    } catch (const StoreError& e) {
        spdlog::warn("[Hub] name lookup failed for {}: {}", device_id, e.what());
    }
    return device_id;
}

void SignalingHub::send(ConnectionId connection, const Envelope& env) {
    if (send_) send_(connection, common::serialize(env));
}

void SignalingHub::send_to_device(const std::string& device_id, const Envelope& env) {
    if (auto connection = bindings_.connection_of(device_id)) send(*connection, env);
}

void SignalingHub::send_error(ConnectionId connection, std::string_view code, const std::string& message) {
    send(connection, common::make_error(code, message));
}

void SignalingHub::broadcast_to_group(const std::string& group_id, const Envelope& env) {
    std::vector<std::string> members;
    try {
        members = store_.group_device_ids(group_id);
    } catch (const StoreError& e) {
        spdlog::error("[Hub] cannot list group {}: {}", group_id, e.what());
        return;
    }

    // Unbound members are skipped, not queued.
    for (const auto& device_id : members) send_to_device(device_id, env);
}

} // namespace portal::server
