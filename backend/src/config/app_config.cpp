/**
 * Configuration loading.
 *
 * config.json layout:
 *   {
 *     "server": { "bind_address": "0.0.0.0", "port": 3001, "threads": 1,
 *                 "static_dir": "dist", "max_body_bytes": 102400 },
 *     "log_level": "info"
 *   }
 */

#include "config/app_config.h"

#include <charconv>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

std::int64_t read_integer(const json& object, const char* key, std::int64_t fallback,
                          std::int64_t min, std::int64_t max) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw std::runtime_error(std::string("config: ") + key + " must be an integer");
    }
    auto value = it->get<std::int64_t>();
    if (value < min || value > max) {
        throw std::runtime_error(std::string("config: ") + key + " out of range");
    }
    return value;
}

std::string read_string(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("config: ") + key + " must be a string");
    }
    return it->get<std::string>();
}

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("config: unknown log_level " + name);
    }
    return level;
}

} // namespace

AppConfig config_from_json(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("config: top level must be an object");
    }
    AppConfig config;

    auto server = root.find("server");
    if (server != root.end()) {
        if (!server->is_object()) {
            throw std::runtime_error("config: server must be an object");
        }
        config.bind_address = read_string(*server, "bind_address", config.bind_address);
        config.port = static_cast<std::uint16_t>(read_integer(*server, "port", config.port, 1, 65535));
        config.threads = static_cast<std::size_t>(read_integer(*server, "threads", 1, 1, 256));
        config.static_dir = read_string(*server, "static_dir", config.static_dir);
        config.max_body_bytes = static_cast<std::size_t>(
            read_integer(*server, "max_body_bytes", static_cast<std::int64_t>(config.max_body_bytes), 0, 64 * 1024 * 1024));
    }

    config.log_level = parse_level(read_string(root, "log_level", "info"));
    return config;
}

AppConfig load_config(const std::string& path, bool required) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        spdlog::info("No config file at {}, using defaults", path);
        return AppConfig{};
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        throw std::runtime_error("Config file is not valid JSON: " + path);
    }
    spdlog::info("Loaded config from {}", path);
    return config_from_json(root);
}

void apply_env_overrides(AppConfig& config, const char* port_env) {
    if (port_env == nullptr || *port_env == '\0') {
        return;
    }
    config.port = parse_port(port_env);
}

std::uint16_t parse_port(const std::string& value) {
    unsigned int result = 0;
    auto first = value.data();
    auto last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last || result == 0 || result > 65535U) {
        throw std::runtime_error("invalid port value: " + value);
    }
    return static_cast<std::uint16_t>(result);
}
