#pragma once

#include "common/TimerService.hpp"
#include "networking/Session.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace portal::server {

// Bidirectional device id <-> connection map. A device has at most one bound
// connection; a newer bind supersedes the older one, and the superseded
// connection keeps a record so that its late disconnect can be recognised.
class BindingRegistry {
public:
    enum class Release {
        NotBound,    // connection never registered
        Released,    // connection was the device's current binding
        Superseded   // device has re-registered on another connection since
    };

    struct ReleaseResult {
        Release outcome = Release::NotBound;
        std::string device_id;
        std::chrono::milliseconds bound_for{0};  // since the last bind
        std::chrono::milliseconds idle_for{0};   // since the last message
    };

    explicit BindingRegistry(common::TimerService& timers);

    // Returns the connection that was bound to the device before, if any.
    std::optional<networking::ConnectionId> bind(const std::string& device_id,
                                                 networking::ConnectionId connection);

    ReleaseResult release(networking::ConnectionId connection);

    std::optional<networking::ConnectionId> connection_of(const std::string& device_id) const;
    std::optional<std::string> device_of(networking::ConnectionId connection) const;

    // Records traffic on a bound connection; unbound connections are ignored.
    void touch(networking::ConnectionId connection);

    std::size_t bound_devices() const noexcept { return devices_.size(); }

private:
    common::TimerService& timers_;
    std::unordered_map<std::string, networking::ConnectionId> devices_;
    std::unordered_map<networking::ConnectionId, networking::Session> sessions_;
};

} // namespace portal::server
