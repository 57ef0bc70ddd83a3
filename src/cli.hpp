#pragma once

#include "config.hpp"
#include "http_server.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace serveit {

constexpr int kExitUsage = 2;

struct CliOptions {
    std::optional<std::string> interface;
    std::optional<std::string> port;
    std::optional<std::string> dir;
    std::optional<std::string> config;
    std::optional<std::string> log_level;
    bool help = false;
};

// Returns false on an unknown flag or a flag missing its value, with the
// reason in error.
bool parse_args(int argc, const char* const argv[], CliOptions& opts, std::string& error);

// Defaults < config file < environment < command line. Throws
// std::runtime_error on an unreadable config or an invalid port.
AppConfig build_config(const CliOptions& opts);

struct StartupPlan {
    std::filesystem::path root;   // canonical
    ListenAddress address;
};

// Canonicalize the root (empty = current directory) and validate the
// interface literal. Throws std::runtime_error on either failure.
StartupPlan prepare_startup(const AppConfig& cfg);

} // namespace serveit
