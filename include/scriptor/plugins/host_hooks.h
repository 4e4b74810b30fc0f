#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <scriptor/plugins/plugin_manager.h>

namespace scriptor::plugins {

// Adapter the editor shell calls on file and UI events.
class HostHooks {
public:
    explicit HostHooks(PluginManager& manager) : manager_(manager) {}

    DispatchStats onOpen(const std::string& path);
    DispatchStats onSave(const std::string& path);
    DispatchStats onEvent(const std::string& name,
                          nlohmann::json payload = nlohmann::json::object());

private:
    PluginManager& manager_;
};

} // namespace scriptor::plugins
