#include "config.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace serveit;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnvVars) unsetenv(name);
        path_ = fs::temp_directory_path() /
                ("serveit-config-" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override {
        for (const char* name : kEnvVars) unsetenv(name);
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& yaml) {
        std::ofstream out(path_);
        out << yaml;
    }

    static constexpr const char* kEnvVars[] = {
        "SERVEIT_INTERFACE", "SERVEIT_PORT", "SERVEIT_DIR", "LOG_LEVEL", "LOG_FILE",
    };
    fs::path path_;
};

} // namespace

TEST(ParsePort, AcceptsFullRange) {
    EXPECT_EQ(parse_port("0"), 0);
    EXPECT_EQ(parse_port("8080"), 8080);
    EXPECT_EQ(parse_port("65535"), 65535);
}

TEST(ParsePort, RejectsGarbage) {
    EXPECT_THROW(parse_port(""), std::runtime_error);
    EXPECT_THROW(parse_port("http"), std::runtime_error);
    EXPECT_THROW(parse_port("-1"), std::runtime_error);
    EXPECT_THROW(parse_port("65536"), std::runtime_error);
    EXPECT_THROW(parse_port("80a"), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsMatchCommandLineDefaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.server.interface, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_TRUE(cfg.server.root.empty());
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST_F(ConfigTest, LoadsYaml) {
    write(
        "server:\n"
        "  interface: 0.0.0.0\n"
        "  port: 9000\n"
        "  root: /srv/files\n"
        "logging:\n"
        "  level: debug\n"
        "  max_files: 5\n");

    AppConfig cfg = load_config(path_.string());
    EXPECT_EQ(cfg.server.interface, "0.0.0.0");
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.root, "/srv/files");
    EXPECT_EQ(cfg.server.max_request_bytes, 8192u);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.max_files, 5);
    EXPECT_EQ(cfg.logging.max_file_size_mb, 10);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config((path_.string() + ".nope")), std::runtime_error);
}

TEST_F(ConfigTest, BadPortInYamlThrows) {
    write("server:\n  port: 70000\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, NonPositiveRequestLimitThrows) {
    write("server:\n  max_request_bytes: 0\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);

    write("server:\n  max_request_bytes: -5\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, NegativeLogRotationThrows) {
    write("logging:\n  max_file_size_mb: -1\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);

    write("logging:\n  max_file_size_mb: 0\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);

    write("logging:\n  max_files: -2\n");
    EXPECT_THROW(load_config(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write("server:\n  port: 9000\n  root: /from/file\n");
    setenv("SERVEIT_PORT", "9100", 1);
    setenv("SERVEIT_DIR", "/from/env", 1);
    setenv("LOG_LEVEL", "warn", 1);

    AppConfig cfg = load_config(path_.string());
    apply_env_overrides(cfg);
    EXPECT_EQ(cfg.server.port, 9100);
    EXPECT_EQ(cfg.server.root, "/from/env");
    EXPECT_EQ(cfg.server.interface, "127.0.0.1");
    EXPECT_EQ(cfg.logging.level, "warn");
}

TEST_F(ConfigTest, BadEnvironmentPortThrows) {
    setenv("SERVEIT_PORT", "eighty", 1);
    AppConfig cfg;
    EXPECT_THROW(apply_env_overrides(cfg), std::runtime_error);
}

TEST(LogLevel, ParsesNamesWithInfoFallback) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("nonsense"), spdlog::level::info);
}
