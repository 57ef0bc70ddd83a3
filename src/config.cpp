#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace serveit {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

uint16_t parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid port: '" + text + "'");
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        throw std::runtime_error("Invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.interface = s["interface"].as<std::string>(cfg.server.interface);
            if (s["port"]) {
                cfg.server.port = parse_port(s["port"].as<std::string>());
            }
            cfg.server.root = s["root"].as<std::string>(cfg.server.root);
            if (s["max_request_bytes"]) {
                long long bytes = s["max_request_bytes"].as<long long>();
                if (bytes <= 0) {
                    throw std::runtime_error("server.max_request_bytes must be positive");
                }
                cfg.server.max_request_bytes = static_cast<size_t>(bytes);
            }
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    if (cfg.logging.max_file_size_mb <= 0) {
        throw std::runtime_error("logging.max_file_size_mb must be positive");
    }
    if (cfg.logging.max_files < 0) {
        throw std::runtime_error("logging.max_files must not be negative");
    }

    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    cfg.server.interface = env_or("SERVEIT_INTERFACE", cfg.server.interface);
    if (const char* port = std::getenv("SERVEIT_PORT")) {
        cfg.server.port = parse_port(port);
    }
    cfg.server.root = env_or("SERVEIT_DIR", cfg.server.root);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
    cfg.logging.file = env_or("LOG_FILE", cfg.logging.file);
}

} // namespace serveit
