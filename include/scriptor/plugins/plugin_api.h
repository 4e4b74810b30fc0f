#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <scriptor/plugins/hook_events.h>

namespace scriptor::plugins {

struct Plugin;

inline constexpr std::string_view kHostAppName = "Scriptor";

/**
 * @brief Capability handle passed to a plugin's registration function.
 *
 * This is the only surface a plugin sees of the host. It is bound to the
 * plugin record being loaded and cannot reach the registry or other plugins.
 * Calls cross the module boundary through the vtable, so plugin modules do not
 * link against the host library.
 */
class PluginApi {
public:
    virtual ~PluginApi() = default;

    /**
     * Append a callback to the named hook of the owning plugin.
     * Any hook name is accepted. Registration order is kept and duplicates are
     * allowed. Never throws for an empty callback; that is reported at dispatch.
     */
    virtual void registerHook(const std::string& name, HookCallback callback) = 0;

    /// Fixed host identity string ("Scriptor").
    virtual std::string_view appName() const = 0;

    /// Name of the plugin being registered (its install directory's base name).
    virtual std::string_view pluginName() const = 0;
};

/**
 * Create the capability object for a plugin record. The record must outlive the
 * returned object.
 */
std::unique_ptr<PluginApi> makePluginApi(Plugin& plugin);

} // namespace scriptor::plugins
