#pragma once

#include "server/DeviceStore.h"

#include <map>
#include <mutex>

namespace portal::server {

class InMemoryDeviceStore : public DeviceStore {
public:
    InMemoryDeviceStore() = default;

    std::optional<GroupRecord> find_group(const std::string& group_id) const override;
    void create_group(const std::string& group_id, const std::string& name) override;

    std::optional<common::Device> find_device(const std::string& device_id) const override;
    void create_device(const std::string& device_id, const std::string& group_id,
                       const std::string& name) override;
    void move_device(const std::string& device_id, const std::string& group_id) override;

    std::vector<std::string> group_device_ids(const std::string& group_id) const override;
    bool is_member(const std::string& device_id, const std::string& group_id) const override;

private:
    struct DeviceRow {
        std::string group_id;
        std::string name;
    };

    mutable std::mutex mu_;
    std::map<std::string, std::string> groups_;  // id -> name
    std::map<std::string, DeviceRow> devices_;
};

} // namespace portal::server
