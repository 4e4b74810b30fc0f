#pragma once

#include <functional>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <scriptor/core/types.h>

namespace scriptor::plugins {
class PluginManager;
class HostHooks;
} // namespace scriptor::plugins

namespace scriptor::cli {

/**
 * Command-line host for the plugin subsystem.
 *
 * Stands in for the editor shell: it discovers plugins at startup, then runs one
 * shell action (list, install, uninstall, reload, open, save, event).
 */
class PluginCli {
public:
    PluginCli();
    ~PluginCli();

    PluginCli(const PluginCli&) = delete;
    PluginCli& operator=(const PluginCli&) = delete;

    /**
     * Run the CLI with given arguments
     * @return process exit code
     */
    int run(int argc, char* argv[]);

private:
    void registerCommands(CLI::App& app);
    Result<void> initialize();

    Result<void> listPlugins();
    Result<void> installPackage();
    Result<void> uninstallPlugin();
    Result<void> reloadPlugins();
    Result<void> fireOpen();
    Result<void> fireSave();
    Result<void> fireEvent();

    std::unique_ptr<plugins::PluginManager> manager_;
    std::unique_ptr<plugins::HostHooks> hooks_;
    std::function<Result<void>()> action_;

    // Global options
    std::string configPath_;
    std::string pluginsDir_;
    std::string logLevel_;

    // Persistent option storage for subcommand callbacks
    bool listJson_{false};
    std::string packagePath_;
    std::string checksum_;
    std::string pluginName_;
    std::string filePath_;
    std::string eventName_;
    std::string eventPayload_;
};

} // namespace scriptor::cli
