#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <scriptor/core/types.h>
#include <scriptor/plugins/code_unit.h>
#include <scriptor/plugins/plugin.h>

namespace scriptor::plugins {

/**
 * Turns a plugin directory into a populated Plugin record.
 *
 * Failures are returned, never thrown, and only affect the load being
 * attempted. The directory is never modified.
 */
class PluginLoader {
public:
    explicit PluginLoader(ICodeUnitLoader& codeLoader) : codeLoader_(codeLoader) {}

    PluginLoader(const PluginLoader&) = delete;
    PluginLoader& operator=(const PluginLoader&) = delete;

    /**
     * Load the plugin in @p directory.
     * @return the record with its code unit and registered hooks, or one of
     *         FileNotFound, InvalidArgument, MissingEntrypoint, ExecutionError,
     *         ContractViolation, RegistrationError.
     */
    Result<std::unique_ptr<Plugin>> load(const std::filesystem::path& directory) const;

    /// Name a plugin directory loads under (its base name).
    static std::string pluginNameFor(const std::filesystem::path& directory);

    /// Namespace a plugin's code unit is bound to.
    static std::string unitNamespaceFor(const std::string& pluginName);

    static const char* entrypointFileName() { return SCRIPTOR_PLUGIN_ENTRYPOINT; }

private:
    ICodeUnitLoader& codeLoader_;
};

} // namespace scriptor::plugins
