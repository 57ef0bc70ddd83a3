#include "cli.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "filesystem.hpp"
#include "request_handler.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifndef SERVEIT_VERSION
#define SERVEIT_VERSION "dev"
#endif

namespace fs = std::filesystem;

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage(std::ostream& os) {
    os << "Usage: serveit [options]\n"
       << "Serve a directory over HTTP (with directory listings)\n"
       << "\nOptions:\n"
       << "  -i, --interface <addr>  Interface to bind (default: 127.0.0.1)\n"
       << "  -p, --port <port>       Port to bind (default: 8080)\n"
       << "  -d, --dir <path>        Directory to serve (default: current directory)\n"
       << "  -c, --config <path>     Optional YAML config file\n"
       << "  -l, --log-level <level> trace/debug/info/warn/error/critical\n"
       << "  -h, --help              Show this help\n"
       << "\nEnvironment variables:\n"
       << "  SERVEIT_INTERFACE       Interface to bind\n"
       << "  SERVEIT_PORT            Port to bind\n"
       << "  SERVEIT_DIR             Directory to serve\n"
       << "  LOG_LEVEL               Log level\n"
       << "  LOG_FILE                Rotating log file path\n";
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    serveit::CliOptions opts;
    std::string arg_error;
    if (!serveit::parse_args(argc, argv, opts, arg_error)) {
        std::cerr << "ERROR: " << arg_error << std::endl;
        print_usage(std::cerr);
        return serveit::kExitUsage;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    serveit::AppConfig config;
    try {
        config = serveit::build_config(opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    try {
        serveit::init_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }

    // ─── Resolve root directory and address ───────────────────────────────────
    serveit::StartupPlan plan;
    try {
        plan = serveit::prepare_startup(config);
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
    const fs::path& root = plan.root;

    spdlog::info("serveit v{}", SERVEIT_VERSION);
    spdlog::info("  Serving   : {}", root.string());
    spdlog::info("  Interface : {}", config.server.interface);
    spdlog::info("  Port      : {}", config.server.port);
    spdlog::info("  Log level : {}", config.logging.level);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Create components ────────────────────────────────────────────────────
    std::shared_ptr<const serveit::RequestHandler> handler =
        std::make_shared<serveit::RequestHandler>(root, std::make_shared<serveit::LocalFileSystem>());
    serveit::HttpServer http_server(config.server.interface, config.server.port,
                                    handler, config.server.max_request_bytes);

    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on {}:{}",
                         config.server.interface, config.server.port);
        return 1;
    }

    spdlog::info("Listening on: http://{}:{}/", config.server.interface, http_server.port());

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete");

    return 0;
}
