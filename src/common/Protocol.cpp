#include "common/Protocol.h"

#include <array>
#include <chrono>
#include <utility>

namespace portal::common {

namespace json = boost::json;

namespace {

struct TypeName {
    MessageType type;
    std::string_view name;
};

constexpr std::array<TypeName, 13> kTypeNames{{
    {MessageType::Register,        "register"},
    {MessageType::RegisterAck,     "register_ack"},
    {MessageType::MotionDetected,  "motion_detected"},
    {MessageType::MotionStopped,   "motion_stopped"},
    {MessageType::PresenceUpdate,  "presence_update"},
    {MessageType::Offer,           "offer"},
    {MessageType::Answer,          "answer"},
    {MessageType::IceCandidate,    "ice_candidate"},
    {MessageType::ConferenceStart, "conference_start"},
    {MessageType::ConferenceEnd,   "conference_end"},
    {MessageType::PeerJoined,      "peer_joined"},
    {MessageType::PeerLeft,        "peer_left"},
    {MessageType::Error,           "error"},
}};

std::string to_std(const json::string& s) {
    return std::string(s.data(), s.size());
}

} // namespace

std::string_view to_string(MessageType type) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "error";
}

std::optional<MessageType> parse_message_type(std::string_view text) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.name == text) return entry.type;
    }
    return std::nullopt;
}

std::int64_t to_epoch_ms(Device::WallClock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

std::int64_t now_ms() {
    return to_epoch_ms(Device::WallClock::now());
}

Envelope make_envelope(MessageType type, json::object payload) {
    Envelope env;
    env.type = type;
    env.payload = std::move(payload);
    env.timestamp = now_ms();
    return env;
}

Envelope make_error(std::string_view code, const std::string& message) {
    return make_envelope(MessageType::Error, json::object{
        {"code", std::string(code)},
        {"message", message}
    });
}

std::string serialize(const Envelope& env) {
    json::object obj{
        {"type", std::string(to_string(env.type))},
        {"payload", env.payload},
        {"timestamp", env.timestamp}
    };
    if (env.from) obj["from"] = *env.from;
    if (env.to) obj["to"] = *env.to;
    return json::serialize(obj);
}

Envelope parse_envelope(const std::string& text) {
    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) throw ProtocolError(error_code::kInvalidMessage, "invalid json: " + ec.message());

    auto* obj = v.if_object();
    if (!obj) throw ProtocolError(error_code::kInvalidMessage, "message is not an object");

    const auto* type_value = obj->if_contains("type");
    if (!type_value || !type_value->is_string()) {
        throw ProtocolError(error_code::kUnknownType, "missing type");
    }
    const std::string type_name = to_std(type_value->get_string());
    const auto type = parse_message_type(type_name);
    if (!type) throw ProtocolError(error_code::kUnknownType, "unknown type: " + type_name);

    Envelope env;
    env.type = *type;

    if (const auto* payload = obj->if_contains("payload")) {
        if (payload->is_object()) {
            env.payload = payload->get_object();
        } else if (!payload->is_null()) {
            throw ProtocolError(error_code::kInvalidMessage, "payload is not an object");
        }
    }

    if (const auto* ts = obj->if_contains("timestamp")) {
        if (ts->is_int64()) env.timestamp = ts->get_int64();
        else if (ts->is_uint64()) env.timestamp = static_cast<std::int64_t>(ts->get_uint64());
        else if (ts->is_double()) env.timestamp = static_cast<std::int64_t>(ts->get_double());
    }

    env.from = find_string(*obj, "from");
    env.to = find_string(*obj, "to");
    return env;
}

std::string require_string(const json::object& obj, json::string_view key) {
    auto value = find_string(obj, key);
    if (!value || value->empty()) {
        throw ProtocolError(error_code::kInvalidPayload, "missing " + std::string(key.data(), key.size()));
    }
    return std::move(*value);
}

std::optional<std::string> find_string(const json::object& obj, json::string_view key) {
    const auto* v = obj.if_contains(key);
    if (!v || !v->is_string()) return std::nullopt;
    return to_std(v->get_string());
}

const json::object& require_object(const json::object& obj, json::string_view key) {
    const auto* v = obj.if_contains(key);
    if (!v || !v->is_object()) {
        throw ProtocolError(error_code::kInvalidPayload, "missing " + std::string(key.data(), key.size()));
    }
    return v->get_object();
}

json::object to_json(const Device& device) {
    json::object obj{
        {"id", device.id},
        {"groupId", device.group_id},
        {"name", device.name},
        {"isPresent", device.is_present}
    };
    if (device.last_motion_at) obj["lastMotionAt"] = to_epoch_ms(*device.last_motion_at);
    return obj;
}

Device device_from_json(const json::object& obj) {
    Device device;
    device.id = require_string(obj, "id");
    device.group_id = find_string(obj, "groupId").value_or("");
    device.name = find_string(obj, "name").value_or("");
    if (const auto* p = obj.if_contains("isPresent"); p && p->is_bool()) {
        device.is_present = p->get_bool();
    }
    if (const auto* ts = obj.if_contains("lastMotionAt"); ts && ts->is_int64()) {
        device.last_motion_at = Device::WallClock::time_point(std::chrono::milliseconds(ts->get_int64()));
    }
    return device;
}

json::array to_json(const std::vector<Device>& devices) {
    json::array arr;
    arr.reserve(devices.size());
    for (const auto& d : devices) arr.emplace_back(to_json(d));
    return arr;
}

json::object to_json(const SessionDescription& desc) {
    return json::object{{"type", desc.type}, {"sdp", desc.sdp}};
}

SessionDescription description_from_json(const json::object& obj) {
    SessionDescription desc;
    desc.type = require_string(obj, "type");
    desc.sdp = require_string(obj, "sdp");
    return desc;
}

json::object to_json(const IceCandidate& candidate) {
    return json::object{{"candidate", candidate.candidate}, {"sdpMid", candidate.mid}};
}

IceCandidate candidate_from_json(const json::object& obj) {
    IceCandidate candidate;
    candidate.candidate = require_string(obj, "candidate");
    candidate.mid = find_string(obj, "sdpMid").value_or("");
    return candidate;
}

} // namespace portal::common
