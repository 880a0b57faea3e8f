#include "common/Device.h"

#include <utility>

namespace portal::common {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

std::string sanitize_device_name(std::string name) {
    name = trim_copy(std::move(name));

    if (name.size() > Device::kMaxNameLen) {
        name.resize(Device::kMaxNameLen);
        name = trim_copy(std::move(name));
    }

    if (name.empty()) name = "Portal Device";
    return name;
}

} // namespace portal::common
