#pragma once

#include "common/Device.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace portal::server {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GroupRecord {
    std::string id;
    std::string name;
    std::vector<std::string> device_ids;
};

// Identity and group membership of devices. Owned outside the signaling core;
// implementations throw StoreError when the backing store is unavailable.
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::optional<GroupRecord> find_group(const std::string& group_id) const = 0;
    virtual void create_group(const std::string& group_id, const std::string& name) = 0;

    // Returned devices carry identity only; presence fields are left unset.
    virtual std::optional<common::Device> find_device(const std::string& device_id) const = 0;
    virtual void create_device(const std::string& device_id, const std::string& group_id,
                               const std::string& name) = 0;
    virtual void move_device(const std::string& device_id, const std::string& group_id) = 0;

    virtual std::vector<std::string> group_device_ids(const std::string& group_id) const = 0;
    virtual bool is_member(const std::string& device_id, const std::string& group_id) const = 0;
};

} // namespace portal::server
