#pragma once

#include <filesystem>
#include <string>

namespace scriptor::config {

/**
 * Settings the plugin host needs at startup.
 */
struct PluginSettings {
    std::filesystem::path configPath; // config file consulted (may not exist)
    std::filesystem::path pluginsDir;
    std::string logLevel{"warn"};
    std::filesystem::path logFile; // empty = log to the console
};

/**
 * Resolve plugin host settings, highest precedence first:
 * 1. Environment (SCRIPTOR_PLUGIN_DIR, SCRIPTOR_LOG_LEVEL)
 * 2. Config file ([plugins] dir, [logging] level, [logging] file)
 * 3. Defaults (<data dir>/plugins, "warn", console)
 *
 * @param configOverride explicit config file path (empty = standard location)
 */
PluginSettings resolvePluginSettings(const std::string& configOverride = "");

} // namespace scriptor::config
