#include <scriptor/plugins/plugin_api.h>
#include <scriptor/plugins/plugin_loader.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <optional>

namespace scriptor::plugins {

namespace fs = std::filesystem;

std::string PluginLoader::pluginNameFor(const fs::path& directory) {
    auto normal = directory.lexically_normal();
    if (normal.filename().empty())
        normal = normal.parent_path();
    return normal.filename().string();
}

std::string PluginLoader::unitNamespaceFor(const std::string& pluginName) {
    std::string ns = "scriptor_plugin_";
    ns.reserve(ns.size() + pluginName.size());
    for (unsigned char c : pluginName)
        ns.push_back(std::isalnum(c) ? static_cast<char>(c) : '_');
    return ns;
}

Result<std::unique_ptr<Plugin>> PluginLoader::load(const fs::path& directory) const {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return Error{ErrorCode::FileNotFound, "Plugin directory not found: " + directory.string()};
    }
    if (!fs::is_directory(directory, ec)) {
        return Error{ErrorCode::InvalidArgument, "Not a directory: " + directory.string()};
    }

    auto absolute = fs::absolute(directory, ec);
    if (ec)
        absolute = directory;
    auto plugin = std::make_unique<Plugin>(pluginNameFor(absolute), absolute.lexically_normal());
    const std::string& name = plugin->name;

    fs::path entrypoint = plugin->path / entrypointFileName();
    if (!fs::is_regular_file(entrypoint, ec)) {
        return Error{ErrorCode::MissingEntrypoint, std::string(entrypointFileName()) +
                                                       " missing in " + plugin->path.string()};
    }

    // Loading runs the unit's static initialisers, which may throw.
    std::optional<Result<std::unique_ptr<ICodeUnit>>> unitRes;
    try {
        unitRes.emplace(codeLoader_.load(entrypoint, unitNamespaceFor(name)));
    } catch (const std::exception& e) {
        return Error{ErrorCode::ExecutionError,
                     "Plugin '" + name + "' failed to load: " + e.what()};
    } catch (...) {
        return Error{ErrorCode::ExecutionError,
                     "Plugin '" + name + "' failed to load: unknown exception"};
    }
    if (!*unitRes) {
        return Error{ErrorCode::ExecutionError,
                     "Plugin '" + name + "' failed to load: " + unitRes->error().message};
    }
    plugin->unit = std::move(*unitRes).value();

    if (auto abi = plugin->unit->abiVersion(); abi && *abi != SCRIPTOR_PLUGIN_ABI_VERSION) {
        return Error{ErrorCode::ContractViolation,
                     "Plugin '" + name + "' targets ABI version " + std::to_string(*abi) +
                         ", host provides " + std::to_string(SCRIPTOR_PLUGIN_ABI_VERSION)};
    }

    auto entry = plugin->unit->registrationEntry();
    if (!entry || !*entry) {
        return Error{ErrorCode::ContractViolation, "Plugin '" + name + "' must export " +
                                                       SCRIPTOR_PLUGIN_REGISTER_SYMBOL};
    }

    // On any registration failure the record is dropped here, which discards the
    // hooks registered before the failure together with the code unit.
    auto api = makePluginApi(*plugin);
    int rc = SCRIPTOR_PLUGIN_OK;
    try {
        rc = (*entry)(api.get());
    } catch (const std::exception& e) {
        return Error{ErrorCode::RegistrationError,
                     "Plugin '" + name + "' registration failed: " + e.what()};
    } catch (...) {
        return Error{ErrorCode::RegistrationError,
                     "Plugin '" + name + "' registration failed: unknown exception"};
    }
    if (rc != SCRIPTOR_PLUGIN_OK) {
        return Error{ErrorCode::RegistrationError,
                     "Plugin '" + name + "' registration returned " + std::to_string(rc)};
    }

    std::size_t callbacks = 0;
    for (const auto& [hook, fns] : plugin->hooks)
        callbacks += fns.size();
    spdlog::debug("Plugin '{}' registered {} callback(s) on {} hook(s)", name, callbacks,
                  plugin->hooks.size());
    return Result<std::unique_ptr<Plugin>>(std::move(plugin));
}

} // namespace scriptor::plugins
