#pragma once

#include "common/Device.h"

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portal::common {

enum class MessageType {
    Register,
    RegisterAck,
    MotionDetected,
    MotionStopped,
    PresenceUpdate,
    Offer,
    Answer,
    IceCandidate,
    ConferenceStart,
    ConferenceEnd,
    PeerJoined,
    PeerLeft,
    Error
};

std::string_view to_string(MessageType type) noexcept;
std::optional<MessageType> parse_message_type(std::string_view text) noexcept;

// Codes carried in ERROR payloads.
namespace error_code {
inline constexpr std::string_view kInvalidMessage      = "INVALID_MESSAGE";
inline constexpr std::string_view kUnknownType         = "UNKNOWN_TYPE";
inline constexpr std::string_view kInvalidPayload      = "INVALID_PAYLOAD";
inline constexpr std::string_view kPeerNotFound        = "PEER_NOT_FOUND";
inline constexpr std::string_view kDeviceNotFound      = "DEVICE_NOT_FOUND";
inline constexpr std::string_view kRegisterFailed      = "REGISTER_FAILED";
inline constexpr std::string_view kGroupCreationFailed = "GROUP_CREATION_FAILED";
inline constexpr std::string_view kStoreUnavailable    = "STORE_UNAVAILABLE";
} // namespace error_code

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(std::string_view code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

struct Envelope {
    MessageType type = MessageType::Error;
    boost::json::object payload;
    std::int64_t timestamp = 0;  // ms since the Unix epoch
    std::optional<std::string> from;
    std::optional<std::string> to;
};

struct SessionDescription {
    std::string type;  // "offer" | "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string mid;
};

std::int64_t now_ms();
std::int64_t to_epoch_ms(Device::WallClock::time_point tp);

Envelope make_envelope(MessageType type, boost::json::object payload = {});
Envelope make_error(std::string_view code, const std::string& message);

std::string serialize(const Envelope& env);

// Throws ProtocolError on malformed JSON, a non-object payload or an unknown type.
Envelope parse_envelope(const std::string& text);

// Payload field access. The require_* variants throw ProtocolError(INVALID_PAYLOAD).
std::string require_string(const boost::json::object& obj, boost::json::string_view key);
std::optional<std::string> find_string(const boost::json::object& obj, boost::json::string_view key);
const boost::json::object& require_object(const boost::json::object& obj, boost::json::string_view key);

boost::json::object to_json(const Device& device);
Device device_from_json(const boost::json::object& obj);
boost::json::array to_json(const std::vector<Device>& devices);

boost::json::object to_json(const SessionDescription& desc);
SessionDescription description_from_json(const boost::json::object& obj);

boost::json::object to_json(const IceCandidate& candidate);
IceCandidate candidate_from_json(const boost::json::object& obj);

} // namespace portal::common
