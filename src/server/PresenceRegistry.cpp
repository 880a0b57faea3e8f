#include "server/PresenceRegistry.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace portal::server {

PresenceRegistry::PresenceRegistry(common::TimerService& timers,
                                   std::chrono::milliseconds presence_timeout,
                                   PresenceChanged on_changed)
    : timers_(timers),
      presence_timeout_(presence_timeout),
      on_changed_(std::move(on_changed)) {}

void PresenceRegistry::mark_present(common::Device device) {
    device.is_present = true;
    device.last_motion_at = timers_.wall_now();

    const std::string id = device.id;
    const std::string group_id = device.group_id;

    std::string previous_group;
    auto it = entries_.find(id);
    const bool was_present = it != entries_.end();
    if (was_present) {
        previous_group = it->second.device.group_id;
        it->second.lease.reset();
        it->second.device = std::move(device);
    } else {
        it = entries_.emplace(id, Entry{std::move(device), nullptr}).first;
    }

    it->second.lease = timers_.schedule(presence_timeout_, [this, id] {
        spdlog::info("[Presence] lease expired for {}", id);
        mark_not_present(id);
    });

    if (!was_present) {
        notify(group_id);
    } else if (previous_group != group_id) {
        notify(previous_group);
        notify(group_id);
    }
}

void PresenceRegistry::mark_not_present(const std::string& device_id) {
    auto it = entries_.find(device_id);
    if (it == entries_.end()) return;

    const std::string group_id = it->second.device.group_id;
    // Erasing destroys the lease, which cancels it.
    entries_.erase(it);
    notify(group_id);
}

std::vector<common::Device> PresenceRegistry::present_in_group(const std::string& group_id) const {
    std::vector<common::Device> devices;
    for (const auto& [id, entry] : entries_) {
        if (entry.device.group_id == group_id) devices.push_back(entry.device);
    }
    return devices;
}

bool PresenceRegistry::is_present(const std::string& device_id) const {
    return entries_.count(device_id) != 0;
}

void PresenceRegistry::clear() {
    entries_.clear();
}

void PresenceRegistry::notify(const std::string& group_id) {
    if (on_changed_) on_changed_(group_id);
}

} // namespace portal::server
