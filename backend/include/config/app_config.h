#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

/**
 * Runtime settings. Every field has a default so the server runs with no
 * config file at all.
 */
struct AppConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 3001;
    std::size_t threads = 1;
    std::string static_dir = "dist";
    std::size_t max_body_bytes = 100 * 1024;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/// Throws std::runtime_error on a wrongly typed or out-of-range key.
AppConfig config_from_json(const nlohmann::json& root);

/// Reads and parses `path`. A missing file yields defaults unless `required`.
AppConfig load_config(const std::string& path, bool required);

/// Applies the PORT environment value (pass std::getenv("PORT")). Null or
/// empty leaves the port unchanged; anything that is not a valid port throws.
void apply_env_overrides(AppConfig& config, const char* port_env);

std::uint16_t parse_port(const std::string& value);
