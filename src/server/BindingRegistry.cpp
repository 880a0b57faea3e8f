#include "server/BindingRegistry.h"

namespace portal::server {

BindingRegistry::BindingRegistry(common::TimerService& timers)
    : timers_(timers) {}

std::optional<networking::ConnectionId> BindingRegistry::bind(const std::string& device_id,
                                                              networking::ConnectionId connection) {
    // A connection speaks for one device: drop its claim on any other id.
    auto sit = sessions_.find(connection);
    if (sit != sessions_.end() && sit->second.device_id != device_id) {
        auto dit = devices_.find(sit->second.device_id);
        if (dit != devices_.end() && dit->second == connection) devices_.erase(dit);
    }

    std::optional<networking::ConnectionId> previous;
    auto dit = devices_.find(device_id);
    if (dit != devices_.end() && dit->second != connection) previous = dit->second;
    devices_[device_id] = connection;

    const auto now = timers_.now();
    auto& session = sessions_[connection];
    session.connection_id = connection;
    session.device_id = device_id;
    session.bound_at = now;
    session.last_seen = now;
    return previous;
}

BindingRegistry::ReleaseResult BindingRegistry::release(networking::ConnectionId connection) {
    ReleaseResult result;

    auto sit = sessions_.find(connection);
    if (sit == sessions_.end()) return result;

    const auto now = timers_.now();
    result.device_id = std::move(sit->second.device_id);
    result.bound_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - sit->second.bound_at);
    result.idle_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - sit->second.last_seen);
    sessions_.erase(sit);

    auto dit = devices_.find(result.device_id);
    if (dit != devices_.end() && dit->second == connection) {
        devices_.erase(dit);
        result.outcome = Release::Released;
    } else {
        result.outcome = Release::Superseded;
    }
    return result;
}

std::optional<networking::ConnectionId> BindingRegistry::connection_of(const std::string& device_id) const {
    auto it = devices_.find(device_id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> BindingRegistry::device_of(networking::ConnectionId connection) const {
    auto it = sessions_.find(connection);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.device_id;
}

void BindingRegistry::touch(networking::ConnectionId connection) {
    auto it = sessions_.find(connection);
    if (it != sessions_.end()) it->second.touch(timers_.now());
}

} // namespace portal::server
