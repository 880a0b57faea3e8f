#pragma once

#include "common/Device.h"
#include "common/TimerService.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace portal::server {

// Soft-state presence: a device is present from mark_present() until its lease
// runs out or mark_not_present() is called. Each id owns at most one lease timer.
class PresenceRegistry {
public:
    using PresenceChanged = std::function<void(const std::string& group_id)>;

    PresenceRegistry(common::TimerService& timers,
                     std::chrono::milliseconds presence_timeout,
                     PresenceChanged on_changed);

    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;

    // Upserts the snapshot and restarts the lease. Notifies only when the
    // device was not already present.
    void mark_present(common::Device device);

    // Notifies only when an entry existed.
    void mark_not_present(const std::string& device_id);

    // Ordered by device id.
    std::vector<common::Device> present_in_group(const std::string& group_id) const;

    bool is_present(const std::string& device_id) const;
    std::size_t size() const noexcept { return entries_.size(); }
    std::chrono::milliseconds presence_timeout() const noexcept { return presence_timeout_; }

    // Drops every entry and lease without notifying.
    void clear();

private:
    struct Entry {
        common::Device device;
        std::unique_ptr<common::Timer> lease;
    };

    void notify(const std::string& group_id);

    common::TimerService& timers_;
    std::chrono::milliseconds presence_timeout_;
    PresenceChanged on_changed_;

    std::map<std::string, Entry> entries_;
};

} // namespace portal::server
