// Copyright 2025 The Scriptor Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <scriptor/core/types.h>
#include <scriptor/plugins/code_unit.h>
#include <scriptor/plugins/hook_events.h>
#include <scriptor/plugins/plugin.h>
#include <scriptor/plugins/plugin_loader.h>

namespace scriptor::plugins {

/**
 * Installation options.
 */
struct InstallOptions {
    std::optional<std::string> checksum; // expected "sha256:<hex>" of the package file
};

/**
 * Installation result.
 */
struct InstallResult {
    std::string pluginName;
    std::filesystem::path installedPath;
    std::string checksum;
    uint64_t sizeBytes{0};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Outcome of a full rediscovery. Only successes are named; per-plugin causes go
 * to the log.
 */
struct ReloadReport {
    std::vector<std::string> loaded;
    std::size_t failed{0};
};

/**
 * Outcome of one hook dispatch.
 */
struct DispatchStats {
    std::size_t invoked{0};
    std::size_t failed{0};
};

/**
 * @brief Owns the set of installed plugins.
 *
 * ## Responsibilities
 * - Discovery of plugin directories under a single root
 * - Installing plugins from packages and uninstalling them
 * - Dispatching named hooks to every registered callback
 *
 * ## Failure isolation
 * Explicit operations (loadPlugin, install, uninstall) return typed errors.
 * Bulk operations (loadAll, callHook) log per-item failures and continue.
 *
 * Not thread-safe; all calls are expected from the shell's event thread.
 */
class PluginManager {
public:
    /**
     * @param pluginsDir root holding one subdirectory per plugin; created if missing.
     *        Stored absolute and lexically normalised.
     * @param codeLoader code unit loader; defaults to the dynamic library loader
     */
    explicit PluginManager(std::filesystem::path pluginsDir,
                           std::unique_ptr<ICodeUnitLoader> codeLoader = nullptr);
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    /**
     * Drop every loaded plugin and rediscover the plugins root.
     * Never fails; unloadable plugins are logged and skipped.
     */
    ReloadReport loadAll();

    /**
     * Load a single plugin directory and add it to the registry.
     * @return the plugin name, or the loader's error
     */
    Result<std::string> loadPlugin(const std::filesystem::path& directory);

    /**
     * Install a plugin package into the plugins root and load it.
     * Never overwrites an existing plugin directory.
     */
    Result<InstallResult> install(const std::filesystem::path& packagePath,
                                  const InstallOptions& options = {});

    /**
     * Remove a loaded plugin and delete its directory. No teardown hook runs.
     */
    Result<void> uninstall(const std::string& name);

    /**
     * Invoke every callback registered for @p hookName, plugin by plugin in name
     * order, each in registration order. A failing callback is logged and does
     * not stop the others.
     *
     * Callbacks may uninstall or load other plugins; a plugin removed mid-dispatch
     * receives no further calls. A callback must not remove its own plugin.
     */
    DispatchStats callHook(const std::string& hookName, const HookEvent& event);

    std::vector<std::string> pluginNames() const;
    bool contains(const std::string& name) const;
    const Plugin* find(const std::string& name) const;
    std::size_t size() const { return plugins_.size(); }
    const std::filesystem::path& pluginsDir() const { return pluginsDir_; }

    /**
     * First free directory for a package stem under the plugins root:
     * <root>/<stem>, then <root>/<stem>_1, <root>/<stem>_2, ...
     */
    std::filesystem::path nextFreeDestination(const std::string& stem) const;

private:
    Result<void> ensurePluginsDir() const;
    Result<std::string> adopt(std::unique_ptr<Plugin> plugin);

    std::filesystem::path pluginsDir_;
    std::unique_ptr<ICodeUnitLoader> codeLoader_;
    PluginLoader loader_;
    std::map<std::string, std::unique_ptr<Plugin>> plugins_;
};

} // namespace scriptor::plugins
