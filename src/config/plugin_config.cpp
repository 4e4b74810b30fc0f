#include <scriptor/config/config_helpers.h>
#include <scriptor/config/plugin_config.h>

#include <cstdlib>

namespace scriptor::config {

PluginSettings resolvePluginSettings(const std::string& configOverride) {
    PluginSettings settings;
    settings.configPath = get_config_path(configOverride);

    // Plugins root
    if (const char* env = std::getenv("SCRIPTOR_PLUGIN_DIR"); env && *env) {
        settings.pluginsDir = expand_tilde(env);
    } else if (auto v = parse_config_value(settings.configPath, "plugins", "dir"); !v.empty()) {
        settings.pluginsDir = expand_tilde(v);
    } else {
        settings.pluginsDir = get_data_dir() / "plugins";
    }

    // Log level
    if (const char* env = std::getenv("SCRIPTOR_LOG_LEVEL"); env && *env) {
        settings.logLevel = env;
    } else if (auto v = parse_config_value(settings.configPath, "logging", "level"); !v.empty()) {
        settings.logLevel = v;
    }

    if (auto v = parse_config_value(settings.configPath, "logging", "file"); !v.empty()) {
        settings.logFile = expand_tilde(v);
    }

    return settings;
}

} // namespace scriptor::config
