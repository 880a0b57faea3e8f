#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace portal::common {

// Snapshot of a device as seen by the presence layer. Identity and group come
// from the device store; presence fields are only ever set by the registry.
struct Device {
    using WallClock = std::chrono::system_clock;

    static constexpr std::size_t kMaxNameLen = 48;

    std::string id;
    std::string group_id;
    std::string name;
    bool is_present = false;
    std::optional<WallClock::time_point> last_motion_at;
};

// Trims surrounding whitespace and clips to kMaxNameLen; empty -> "Portal Device".
std::string sanitize_device_name(std::string name);

std::string trim_copy(std::string s);

} // namespace portal::common
