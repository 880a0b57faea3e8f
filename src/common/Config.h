#pragma once

#include <boost/json.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace portal::common {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{3001};
    std::chrono::milliseconds presence_timeout{70000};
    bool announce_conferences{false};
    std::string log_level{"info"};
};

struct DeviceConfig {
    std::string server_host{"127.0.0.1"};
    std::uint16_t server_port{3001};
    std::string server_path{"/"};

    std::string device_id;  // generated when left empty
    std::string group_id{"default-group"};
    std::string device_name{"Portal Device"};

    int motion_threshold{60};
    std::chrono::milliseconds motion_timeout{60000};
    std::chrono::milliseconds heartbeat_interval{0};  // 0 -> motion_timeout / 2
    std::chrono::milliseconds sample_interval{100};
    int frame_width{320};
    int frame_height{240};
    int camera_index{0};
    int video_bitrate_kbps{500};

    std::vector<std::string> ice_servers{
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302"
    };
    std::chrono::milliseconds reconnect_delay{2000};
    std::string log_level{"info"};

    std::chrono::milliseconds effective_heartbeat() const {
        return heartbeat_interval.count() > 0 ? heartbeat_interval : motion_timeout / 2;
    }
};

using EnvLookup = std::function<const char*(const char*)>;

// Individual layers, lowest precedence first: defaults, config file, environment,
// command line. Each throws ConfigError on malformed input.
void apply_json(const boost::json::object& obj, ServerConfig& config);
void apply_json(const boost::json::object& obj, DeviceConfig& config);
void apply_env(const EnvLookup& env, ServerConfig& config);
void apply_env(const EnvLookup& env, DeviceConfig& config);

boost::json::object read_json_file(const std::string& path);

// Case-insensitive spdlog level name ("debug", "info", "warn", ...).
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

void validate(const ServerConfig& config);
void validate(const DeviceConfig& config);

// Full load from argv. Returns nullopt when --help was requested (usage is
// printed to stdout).
std::optional<ServerConfig> load_server_config(int argc, const char* const argv[],
                                               const EnvLookup& env);
std::optional<DeviceConfig> load_device_config(int argc, const char* const argv[],
                                               const EnvLookup& env);

} // namespace portal::common
