#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace portal::networking {

using ConnectionId = std::uint64_t;

// A connection that has registered as a device.
struct Session {
    using Clock = std::chrono::steady_clock;

    ConnectionId connection_id{};
    std::string device_id;

    Clock::time_point bound_at{};
    Clock::time_point last_seen{};

    void touch(Clock::time_point now) noexcept { last_seen = now; }
};

} // namespace portal::networking
