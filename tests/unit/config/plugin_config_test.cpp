#include <catch2/catch_test_macros.hpp>

#include <scriptor/config/config_helpers.h>
#include <scriptor/config/plugin_config.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "tests/support/env_guard.hpp"
#include "tests/support/temp_dir_scope.hpp"

using scriptor::config::parse_config_value;
using scriptor::config::resolvePluginSettings;
using scriptor::test_support::EnvGuard;
using scriptor::test_support::TempDirScope;

namespace fs = std::filesystem;

namespace {

struct ConfigFixture {
    ConfigFixture()
        : scope(TempDirScope::unique_under("scriptor-config-test")),
          pluginDirEnv("SCRIPTOR_PLUGIN_DIR", std::nullopt),
          logLevelEnv("SCRIPTOR_LOG_LEVEL", std::nullopt),
          configEnv("SCRIPTOR_CONFIG", std::nullopt),
          dataHome("XDG_DATA_HOME", (scope.path() / "data").string()) {
        configPath = scope.path() / "config.toml";
    }

    void writeConfig(const std::string& body) { std::ofstream(configPath) << body; }

    TempDirScope scope;
    EnvGuard pluginDirEnv;
    EnvGuard logLevelEnv;
    EnvGuard configEnv;
    EnvGuard dataHome;
    fs::path configPath;
};

} // namespace

TEST_CASE("parse_config_value reads sections and dotted keys", "[config]") {
    auto scope = TempDirScope::unique_under("scriptor-config-parse");
    auto path = scope.path() / "config.toml";
    std::ofstream(path) << "# scriptor\n"
                           "dir = \"/top-level\"\n"
                           "[plugins]\n"
                           "dir = \"/srv/plugins\"  \n"
                           "[logging]\n"
                           "level = debug # inline comment\n"
                           "logging.file = '/var/log/scriptor.log'\n";

    CHECK(parse_config_value(path, "", "dir") == "/top-level");
    CHECK(parse_config_value(path, "plugins", "dir") == "/srv/plugins");
    CHECK(parse_config_value(path, "logging", "level") == "debug");
    CHECK(parse_config_value(path, "logging", "file") == "/var/log/scriptor.log");
    CHECK(parse_config_value(path, "plugins", "missing").empty());
    CHECK(parse_config_value(scope.path() / "absent.toml", "plugins", "dir").empty());
}

TEST_CASE_METHOD(ConfigFixture, "resolvePluginSettings precedence", "[config]") {
    SECTION("defaults without config or environment") {
        auto s = resolvePluginSettings(configPath.string());
        CHECK(s.configPath == configPath);
        CHECK(s.pluginsDir == scope.path() / "data" / "scriptor" / "plugins");
        CHECK(s.logLevel == "warn");
        CHECK(s.logFile.empty());
    }

    SECTION("config file values") {
        writeConfig("[plugins]\ndir = \"/opt/scriptor/plugins\"\n"
                    "[logging]\nlevel = \"info\"\nfile = \"/tmp/scriptor.log\"\n");
        auto s = resolvePluginSettings(configPath.string());
        CHECK(s.pluginsDir == fs::path("/opt/scriptor/plugins"));
        CHECK(s.logLevel == "info");
        CHECK(s.logFile == fs::path("/tmp/scriptor.log"));
    }

    SECTION("environment overrides the config file") {
        writeConfig("[plugins]\ndir = \"/opt/scriptor/plugins\"\n[logging]\nlevel = info\n");
        EnvGuard dir("SCRIPTOR_PLUGIN_DIR", std::string("/env/plugins"));
        EnvGuard level("SCRIPTOR_LOG_LEVEL", std::string("trace"));
        auto s = resolvePluginSettings(configPath.string());
        CHECK(s.pluginsDir == fs::path("/env/plugins"));
        CHECK(s.logLevel == "trace");
    }

    SECTION("SCRIPTOR_CONFIG selects the config file") {
        writeConfig("[plugins]\ndir = \"/from/env/config\"\n");
        EnvGuard cfg("SCRIPTOR_CONFIG", configPath.string());
        auto s = resolvePluginSettings();
        CHECK(s.configPath == configPath);
        CHECK(s.pluginsDir == fs::path("/from/env/config"));
    }

#ifndef _WIN32
    SECTION("tilde expands to HOME") {
        EnvGuard home("HOME", scope.path().string());
        writeConfig("[plugins]\ndir = \"~/my-plugins\"\n");
        auto s = resolvePluginSettings(configPath.string());
        CHECK(s.pluginsDir == scope.path() / "my-plugins");
    }
#endif
}
