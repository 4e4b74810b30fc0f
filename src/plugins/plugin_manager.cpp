// Copyright 2025 The Scriptor Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <scriptor/plugins/plugin_manager.h>
#include <scriptor/plugins/plugin_package.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>

namespace scriptor::plugins {

namespace fs = std::filesystem;

namespace {

// Absolute, without "." / ".." components or a trailing separator.
fs::path normalizedRoot(const fs::path& dir) {
    std::error_code ec;
    fs::path root = fs::absolute(dir, ec);
    if (ec)
        root = dir;
    root = root.lexically_normal();
    if (root.filename().empty() && root.has_relative_path())
        root = root.parent_path();
    return root;
}

} // namespace

PluginManager::PluginManager(fs::path pluginsDir, std::unique_ptr<ICodeUnitLoader> codeLoader)
    : pluginsDir_(normalizedRoot(pluginsDir)),
      codeLoader_(codeLoader ? std::move(codeLoader) : makeDynamicCodeUnitLoader()),
      loader_(*codeLoader_) {
    if (auto res = ensurePluginsDir(); !res) {
        spdlog::warn("Plugins directory unavailable: {}", res.error().message);
    }
}

PluginManager::~PluginManager() = default;

Result<void> PluginManager::ensurePluginsDir() const {
    std::error_code ec;
    fs::create_directories(pluginsDir_, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Cannot create " + pluginsDir_.string() + ": " + ec.message()};
    }
    return Result<void>();
}

ReloadReport PluginManager::loadAll() {
    // Existing records are dropped without any teardown.
    plugins_.clear();

    ReloadReport report;
    if (auto res = ensurePluginsDir(); !res) {
        spdlog::warn("Plugin discovery skipped: {}", res.error().message);
        return report;
    }

    std::vector<fs::path> candidates;
    std::error_code ec;
    for (fs::directory_iterator it(pluginsDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc))
            candidates.push_back(it->path());
    }
    if (ec) {
        spdlog::warn("Plugin discovery in {} stopped early: {}", pluginsDir_.string(),
                     ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& dir : candidates) {
        auto res = loader_.load(dir);
        if (!res) {
            ++report.failed;
            spdlog::warn("Failed loading plugin {}: [{}] {}", dir.string(),
                         errorToString(res.error().code), res.error().message);
            continue;
        }
        auto adopted = adopt(std::move(res).value());
        if (!adopted) {
            ++report.failed;
            spdlog::warn("Failed loading plugin {}: {}", dir.string(), adopted.error().message);
            continue;
        }
        report.loaded.push_back(adopted.value());
    }

    spdlog::info("Plugin discovery: {} loaded, {} failed", report.loaded.size(), report.failed);
    return report;
}

Result<std::string> PluginManager::loadPlugin(const fs::path& directory) {
    auto res = loader_.load(directory);
    if (!res)
        return res.error();
    return adopt(std::move(res).value());
}

Result<std::string> PluginManager::adopt(std::unique_ptr<Plugin> plugin) {
    std::string name = plugin->name;
    if (plugins_.count(name)) {
        return Error{ErrorCode::InvalidOperation, "Plugin '" + name + "' is already loaded"};
    }
    plugins_.emplace(name, std::move(plugin));
    spdlog::info("Loaded plugin: {}", name);
    return name;
}

fs::path PluginManager::nextFreeDestination(const std::string& stem) const {
    fs::path dest = pluginsDir_ / stem;
    std::error_code ec;
    for (int idx = 1; fs::exists(dest, ec) || plugins_.count(dest.filename().string()); ++idx) {
        dest = pluginsDir_ / (stem + "_" + std::to_string(idx));
    }
    return dest;
}

Result<InstallResult> PluginManager::install(const fs::path& packagePath,
                                             const InstallOptions& options) {
    auto startTime = std::chrono::steady_clock::now();

    auto contents = inspectPackage(packagePath);
    if (!contents)
        return contents.error();
    if (!contents.value().hasEntrypoint) {
        return Error{ErrorCode::PackageFormatError, packagePath.filename().string() +
                                                        " must contain " +
                                                        PluginLoader::entrypointFileName() +
                                                        " at its root"};
    }

    auto checksum = computePackageChecksum(packagePath);
    if (!checksum)
        return checksum.error();
    if (options.checksum && !options.checksum->empty() && *options.checksum != checksum.value()) {
        return Error{ErrorCode::HashMismatch, "Checksum mismatch: expected " + *options.checksum +
                                                  ", got " + checksum.value()};
    }

    if (auto res = ensurePluginsDir(); !res)
        return res.error();

    std::string stem = packagePath.stem().string();
    if (stem.empty()) {
        return Error{ErrorCode::InvalidArgument, "Cannot derive plugin name from " +
                                                     packagePath.string()};
    }
    fs::path dest = nextFreeDestination(stem);

    auto extracted = extractPackage(packagePath, dest);
    if (!extracted) {
        // The directory was created by us and holds at most a partial extraction.
        std::error_code ec;
        fs::remove_all(dest, ec);
        return extracted.error();
    }

    // A failed load leaves the extracted directory in place.
    auto loaded = loadPlugin(dest);
    if (!loaded) {
        spdlog::error("Install of {} failed: {}", packagePath.string(), loaded.error().message);
        return loaded.error();
    }

    InstallResult result;
    result.pluginName = loaded.value();
    result.installedPath = plugins_.at(result.pluginName)->path;
    result.checksum = checksum.value();
    result.sizeBytes = extracted.value();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    spdlog::info("Installed plugin {} to {} ({})", result.pluginName,
                 result.installedPath.string(), result.checksum);
    return result;
}

Result<void> PluginManager::uninstall(const std::string& name) {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return Error{ErrorCode::NotFound, "Plugin not loaded: " + name};
    }
    fs::path dir = it->second->path;
    plugins_.erase(it);

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to remove plugin: " + ec.message()};
    }
    spdlog::info("Uninstalled plugin {} ({})", name, dir.string());
    return Result<void>();
}

DispatchStats PluginManager::callHook(const std::string& hookName, const HookEvent& event) {
    DispatchStats stats;
    spdlog::debug("Dispatching {} {}", hookName, describeEvent(event));
    // Callbacks may change the registry; walk a snapshot of the names and look
    // each record up again before every invocation.
    for (const auto& name : pluginNames()) {
        for (std::size_t i = 0;; ++i) {
            const Plugin* plugin = find(name);
            if (!plugin)
                break;
            auto hit = plugin->hooks.find(hookName);
            if (hit == plugin->hooks.end() || i >= hit->second.size())
                break;
            const HookCallback& callback = hit->second[i];
            ++stats.invoked;
            try {
                callback(event);
            } catch (const std::bad_function_call&) {
                ++stats.failed;
                spdlog::error("Plugin {} hook {} error: callback is not invocable", name,
                              hookName);
            } catch (const std::exception& e) {
                ++stats.failed;
                spdlog::error("Plugin {} hook {} error: {}", name, hookName, e.what());
            } catch (...) {
                ++stats.failed;
                spdlog::error("Plugin {} hook {} error: unknown exception", name, hookName);
            }
        }
    }
    return stats;
}

std::vector<std::string> PluginManager::pluginNames() const {
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& [name, plugin] : plugins_)
        names.push_back(name);
    return names;
}

bool PluginManager::contains(const std::string& name) const {
    return plugins_.count(name) != 0;
}

const Plugin* PluginManager::find(const std::string& name) const {
    auto it = plugins_.find(name);
    return it == plugins_.end() ? nullptr : it->second.get();
}

} // namespace scriptor::plugins
