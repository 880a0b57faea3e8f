#include "server/InMemoryDeviceStore.h"

namespace portal::server {

std::optional<GroupRecord> InMemoryDeviceStore::find_group(const std::string& group_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = groups_.find(group_id);
    if (it == groups_.end()) return std::nullopt;

    GroupRecord group{it->first, it->second, {}};
    for (const auto& [id, row] : devices_) {
        if (row.group_id == group_id) group.device_ids.push_back(id);
    }
    return group;
}

void InMemoryDeviceStore::create_group(const std::string& group_id, const std::string& name) {
    if (group_id.empty()) throw StoreError("group id must not be empty");

    std::lock_guard<std::mutex> lk(mu_);
    if (!groups_.emplace(group_id, name).second) {
        throw StoreError("group " + group_id + " already exists");
    }
}

std::optional<common::Device> InMemoryDeviceStore::find_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) return std::nullopt;

    common::Device device;
    device.id = it->first;
    device.group_id = it->second.group_id;
    device.name = it->second.name;
    return device;
}

void InMemoryDeviceStore::create_device(const std::string& device_id, const std::string& group_id,
                                        const std::string& name) {
    if (device_id.empty()) throw StoreError("device id must not be empty");

    std::lock_guard<std::mutex> lk(mu_);
    if (groups_.count(group_id) == 0) throw StoreError("unknown group " + group_id);
    if (!devices_.emplace(device_id, DeviceRow{group_id, common::sanitize_device_name(name)}).second) {
        throw StoreError("device " + device_id + " already exists");
    }
}

void InMemoryDeviceStore::move_device(const std::string& device_id, const std::string& group_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) throw StoreError("unknown device " + device_id);
    if (groups_.count(group_id) == 0) throw StoreError("unknown group " + group_id);
    it->second.group_id = group_id;
}

std::vector<std::string> InMemoryDeviceStore::group_device_ids(const std::string& group_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> ids;
    for (const auto& [id, row] : devices_) {
        if (row.group_id == group_id) ids.push_back(id);
    }
    return ids;
}

bool InMemoryDeviceStore::is_member(const std::string& device_id, const std::string& group_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(device_id);
    return it != devices_.end() && it->second.group_id == group_id;
}

} // namespace portal::server
