#include "common/Config.h"

#include "common/IDGenerator.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace portal::common {

namespace json = boost::json;
namespace po = boost::program_options;

namespace {

const json::value* field(const json::object& obj, const char* key) {
    const auto* v = obj.if_contains(key);
    if (v && v->is_null()) return nullptr;
    return v;
}

std::int64_t read_int(const json::value& v, const char* key) {
    if (v.is_int64()) return v.get_int64();
    if (v.is_uint64() && v.get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(v.get_uint64());
    }
    throw ConfigError(std::string("'") + key + "' must be an integer");
}

void read_string(const json::object& obj, const char* key, std::string& out) {
    if (const auto* v = field(obj, key)) {
        if (!v->is_string()) throw ConfigError(std::string("'") + key + "' must be a string");
        out.assign(v->get_string().data(), v->get_string().size());
    }
}

void read_bool(const json::object& obj, const char* key, bool& out) {
    if (const auto* v = field(obj, key)) {
        if (!v->is_bool()) throw ConfigError(std::string("'") + key + "' must be a boolean");
        out = v->get_bool();
    }
}

void read_int(const json::object& obj, const char* key, int& out) {
    if (const auto* v = field(obj, key)) {
        const auto value = read_int(*v, key);
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw ConfigError(std::string("'") + key + "' is out of range");
        }
        out = static_cast<int>(value);
    }
}

void read_port(const json::object& obj, const char* key, std::uint16_t& out) {
    if (const auto* v = field(obj, key)) {
        const auto value = read_int(*v, key);
        if (value < 1 || value > 65535) throw ConfigError(std::string("'") + key + "' must be 1-65535");
        out = static_cast<std::uint16_t>(value);
    }
}

void read_ms(const json::object& obj, const char* key, std::chrono::milliseconds& out) {
    if (const auto* v = field(obj, key)) out = std::chrono::milliseconds(read_int(*v, key));
}

void read_string_list(const json::object& obj, const char* key, std::vector<std::string>& out) {
    const auto* v = field(obj, key);
    if (!v) return;
    if (!v->is_array()) throw ConfigError(std::string("'") + key + "' must be an array of strings");

    std::vector<std::string> values;
    for (const auto& item : v->get_array()) {
        if (!item.is_string()) throw ConfigError(std::string("'") + key + "' must be an array of strings");
        values.emplace_back(item.get_string().data(), item.get_string().size());
    }
    out = std::move(values);
}

std::int64_t parse_env_int(const char* name, const char* text) {
    try {
        std::size_t used = 0;
        const std::string s(text);
        const long long value = std::stoll(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return value;
    } catch (const std::exception&) {
        throw ConfigError(std::string("environment variable ") + name + " is not an integer");
    }
}

std::uint16_t to_port(std::int64_t value, const char* what) {
    if (value < 1 || value > 65535) throw ConfigError(std::string(what) + " must be 1-65535");
    return static_cast<std::uint16_t>(value);
}

int to_int_in(std::int64_t value, int lo, int hi, const char* what) {
    if (value < lo || value > hi) {
        throw ConfigError(std::string(what) + " must be " + std::to_string(lo) + "-" + std::to_string(hi));
    }
    return static_cast<int>(value);
}

void check_log_level(const std::string& level) {
    if (!parse_log_level(level)) throw ConfigError("unknown log level '" + level + "'");
}

po::variables_map parse_args(int argc, const char* const argv[], const po::options_description& desc) {
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }
    return vm;
}

} // namespace

void apply_json(const json::object& obj, ServerConfig& config) {
    read_string(obj, "bind_address", config.bind_address);
    read_port(obj, "port", config.port);
    read_ms(obj, "presence_timeout_ms", config.presence_timeout);
    read_bool(obj, "announce_conferences", config.announce_conferences);
    read_string(obj, "log_level", config.log_level);
}

void apply_json(const json::object& obj, DeviceConfig& config) {
    read_string(obj, "server_host", config.server_host);
    read_port(obj, "server_port", config.server_port);
    read_string(obj, "server_path", config.server_path);
    read_string(obj, "device_id", config.device_id);
    read_string(obj, "group_id", config.group_id);
    read_string(obj, "device_name", config.device_name);
    read_int(obj, "motion_threshold", config.motion_threshold);
    read_ms(obj, "motion_timeout_ms", config.motion_timeout);
    read_ms(obj, "heartbeat_interval_ms", config.heartbeat_interval);
    read_ms(obj, "sample_interval_ms", config.sample_interval);
    read_int(obj, "frame_width", config.frame_width);
    read_int(obj, "frame_height", config.frame_height);
    read_int(obj, "camera_index", config.camera_index);
    read_int(obj, "video_bitrate_kbps", config.video_bitrate_kbps);
    read_string_list(obj, "ice_servers", config.ice_servers);
    read_ms(obj, "reconnect_delay_ms", config.reconnect_delay);
    read_string(obj, "log_level", config.log_level);
}

void apply_env(const EnvLookup& env, ServerConfig& config) {
    if (const char* v = env("PORT")) config.port = to_port(parse_env_int("PORT", v), "PORT");
    if (const char* v = env("PRESENCE_TIMEOUT")) {
        config.presence_timeout = std::chrono::milliseconds(parse_env_int("PRESENCE_TIMEOUT", v));
    }
}

void apply_env(const EnvLookup& env, DeviceConfig& config) {
    if (const char* v = env("DEVICE_ID")) config.device_id = v;
    if (const char* v = env("GROUP_ID")) config.group_id = v;
    if (const char* v = env("DEVICE_NAME")) config.device_name = v;
    if (const char* v = env("MOTION_THRESHOLD")) {
        config.motion_threshold = to_int_in(parse_env_int("MOTION_THRESHOLD", v), 0, 255, "MOTION_THRESHOLD");
    }
    if (const char* v = env("MOTION_TIMEOUT")) {
        config.motion_timeout = std::chrono::milliseconds(parse_env_int("MOTION_TIMEOUT", v));
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // from_str maps unknown names to off
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") return std::nullopt;
    return level;
}

json::object read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);

    std::ostringstream buffer;
    buffer << in.rdbuf();

    json::error_code ec;
    json::value v = json::parse(buffer.str(), ec);
    if (ec) throw ConfigError("invalid json in " + path + ": " + ec.message());
    if (!v.is_object()) throw ConfigError(path + ": top level must be an object");
    return std::move(v.get_object());
}

void validate(const ServerConfig& config) {
    if (config.presence_timeout.count() <= 0) throw ConfigError("presence_timeout_ms must be positive");
    if (config.bind_address.empty()) throw ConfigError("bind_address must not be empty");
    check_log_level(config.log_level);
}

void validate(const DeviceConfig& config) {
    if (config.server_host.empty()) throw ConfigError("server_host must not be empty");
    if (config.group_id.empty()) throw ConfigError("group_id must not be empty");
    if (config.motion_threshold < 0 || config.motion_threshold > 255) {
        throw ConfigError("motion_threshold must be 0-255");
    }
    if (config.motion_timeout.count() <= 0) throw ConfigError("motion_timeout_ms must be positive");
    if (config.heartbeat_interval.count() < 0) throw ConfigError("heartbeat_interval_ms must not be negative");
    if (config.effective_heartbeat() >= config.motion_timeout) {
        throw ConfigError("heartbeat_interval_ms must be shorter than motion_timeout_ms");
    }
    if (config.sample_interval.count() <= 0) throw ConfigError("sample_interval_ms must be positive");
    if (config.frame_width <= 0 || config.frame_height <= 0) throw ConfigError("frame size must be positive");
    if (config.video_bitrate_kbps <= 0) throw ConfigError("video_bitrate_kbps must be positive");
    if (config.reconnect_delay.count() <= 0) throw ConfigError("reconnect_delay_ms must be positive");
    check_log_level(config.log_level);
}

std::optional<ServerConfig> load_server_config(int argc, const char* const argv[], const EnvLookup& env) {
    po::options_description desc("portal_server options");
    desc.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("bind", po::value<std::string>(), "listen address")
        ("port,p", po::value<int>(), "listen port")
        ("presence-timeout-ms", po::value<long long>(), "presence TTL in milliseconds")
        ("announce-conferences", po::value<bool>(), "send CONFERENCE_START/END from the hub")
        ("log-level", po::value<std::string>(), "debug | info | warn | error");

    const auto vm = parse_args(argc, argv, desc);
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return std::nullopt;
    }

    ServerConfig config;
    if (vm.count("config")) apply_json(read_json_file(vm["config"].as<std::string>()), config);
    apply_env(env, config);

    if (vm.count("bind")) config.bind_address = vm["bind"].as<std::string>();
    if (vm.count("port")) config.port = to_port(vm["port"].as<int>(), "--port");
    if (vm.count("presence-timeout-ms")) {
        config.presence_timeout = std::chrono::milliseconds(vm["presence-timeout-ms"].as<long long>());
    }
    if (vm.count("announce-conferences")) config.announce_conferences = vm["announce-conferences"].as<bool>();
    if (vm.count("log-level")) config.log_level = vm["log-level"].as<std::string>();

    validate(config);
    return config;
}

std::optional<DeviceConfig> load_device_config(int argc, const char* const argv[], const EnvLookup& env) {
    po::options_description desc("portal_device options");
    desc.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("server", po::value<std::string>(), "signaling server host")
        ("port,p", po::value<int>(), "signaling server port")
        ("device-id", po::value<std::string>(), "stable device identifier")
        ("group-id", po::value<std::string>(), "family group identifier")
        ("device-name", po::value<std::string>(), "display name")
        ("camera", po::value<int>(), "camera index")
        ("motion-threshold", po::value<int>(), "per-pixel intensity threshold (0-255)")
        ("motion-timeout-ms", po::value<long long>(), "local motion timeout")
        ("log-level", po::value<std::string>(), "debug | info | warn | error");

    const auto vm = parse_args(argc, argv, desc);
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return std::nullopt;
    }

    DeviceConfig config;
    if (vm.count("config")) apply_json(read_json_file(vm["config"].as<std::string>()), config);
    apply_env(env, config);

    if (vm.count("server")) config.server_host = vm["server"].as<std::string>();
    if (vm.count("port")) config.server_port = to_port(vm["port"].as<int>(), "--port");
    if (vm.count("device-id")) config.device_id = vm["device-id"].as<std::string>();
    if (vm.count("group-id")) config.group_id = vm["group-id"].as<std::string>();
    if (vm.count("device-name")) config.device_name = vm["device-name"].as<std::string>();
    if (vm.count("camera")) config.camera_index = vm["camera"].as<int>();
    if (vm.count("motion-threshold")) config.motion_threshold = vm["motion-threshold"].as<int>();
    if (vm.count("motion-timeout-ms")) {
        config.motion_timeout = std::chrono::milliseconds(vm["motion-timeout-ms"].as<long long>());
    }
    if (vm.count("log-level")) config.log_level = vm["log-level"].as<std::string>();

    if (config.device_id.empty()) {
        IDGenerator idgen;
        config.device_id = idgen.device_id();
        spdlog::warn("[Config] no device_id configured, generated {} "
                     "(set it in the config file to keep it across restarts)", config.device_id);
    }

    validate(config);
    return config;
}

} // namespace portal::common
