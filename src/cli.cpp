#include "cli.hpp"
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace serveit {

bool parse_args(int argc, const char* const argv[], CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto take = [&](std::optional<std::string>& slot) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            slot = argv[++i];
            return true;
        };

        if (arg == "--interface" || arg == "-i") {
            if (!take(opts.interface)) return false;
        } else if (arg == "--port" || arg == "-p") {
            if (!take(opts.port)) return false;
        } else if (arg == "--dir" || arg == "-d") {
            if (!take(opts.dir)) return false;
        } else if (arg == "--config" || arg == "-c") {
            if (!take(opts.config)) return false;
        } else if (arg == "--log-level" || arg == "-l") {
            if (!take(opts.log_level)) return false;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            error = "unknown option " + arg;
            return false;
        }
    }
    return true;
}

AppConfig build_config(const CliOptions& opts) {
    AppConfig config;
    if (opts.config) {
        config = load_config(*opts.config);
    }
    apply_env_overrides(config);

    if (opts.interface) config.server.interface = *opts.interface;
    if (opts.port) config.server.port = parse_port(*opts.port);
    if (opts.dir) config.server.root = *opts.dir;
    if (opts.log_level) config.logging.level = *opts.log_level;
    return config;
}

StartupPlan prepare_startup(const AppConfig& cfg) {
    StartupPlan plan;

    std::error_code ec;
    fs::path root = cfg.server.root.empty() ? fs::current_path(ec) : fs::path(cfg.server.root);
    if (!ec) {
        root = fs::canonical(root, ec);
    }
    if (ec) {
        throw std::runtime_error("Cannot canonicalize dir '" + cfg.server.root + "': " + ec.message());
    }
    plan.root = root;

    if (!parse_listen_address(cfg.server.interface, cfg.server.port, plan.address)) {
        throw std::runtime_error("Invalid interface/port: " + cfg.server.interface + ":" +
                                 std::to_string(cfg.server.port));
    }
    return plan;
}

} // namespace serveit
