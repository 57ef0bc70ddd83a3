#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace serveit {

struct ServerConfig {
    std::string interface = "127.0.0.1";
    uint16_t port = 8080;
    std::string root;                  // empty = current working directory
    size_t max_request_bytes = 8192;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Load configuration from YAML file. Throws std::runtime_error on a missing
// or malformed file.
AppConfig load_config(const std::string& path);

// Apply SERVEIT_* / LOG_* environment variable overrides in place.
void apply_env_overrides(AppConfig& cfg);

// Parse a TCP port ("0".."65535"). Throws std::runtime_error otherwise.
uint16_t parse_port(const std::string& text);

} // namespace serveit
