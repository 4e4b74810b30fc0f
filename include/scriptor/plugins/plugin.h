#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <scriptor/plugins/code_unit.h>
#include <scriptor/plugins/hook_events.h>

namespace scriptor::plugins {

/**
 * Plugin record: one loaded plugin.
 */
struct Plugin {
    std::string name;
    std::filesystem::path path;
    // Declared before hooks: members are destroyed in reverse order, so the
    // callbacks go away while the code that defines them is still mapped.
    std::unique_ptr<ICodeUnit> unit;
    std::map<std::string, std::vector<HookCallback>> hooks;

    Plugin() = default;
    Plugin(std::string n, std::filesystem::path p) : name(std::move(n)), path(std::move(p)) {}
    Plugin(const Plugin&) = delete;
    Plugin& operator=(const Plugin&) = delete;

    std::size_t callbackCount(const std::string& hook) const {
        auto it = hooks.find(hook);
        return it == hooks.end() ? 0 : it->second.size();
    }
};

} // namespace scriptor::plugins
