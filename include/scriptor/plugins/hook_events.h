#pragma once

#include <functional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace scriptor::plugins {

// Hook names fired by the editor shell
inline constexpr const char* kHookOnOpen = "on_open";
inline constexpr const char* kHookOnSave = "on_save";
inline constexpr const char* kHookOnEvent = "on_event";

/// A file was opened in a new editor tab.
struct OpenEvent {
    std::string path;
};

/// A file was written to disk (save or save-as).
struct SaveEvent {
    std::string path;
};

/// Any other shell notification. `payload` is a JSON object of named arguments.
struct GenericEvent {
    std::string name;
    nlohmann::json payload = nlohmann::json::object();
};

using HookEvent = std::variant<OpenEvent, SaveEvent, GenericEvent>;

// Callbacks are opaque closures supplied by plugin code. An empty callback may be
// registered; it fails only when the hook fires.
using HookCallback = std::function<void(const HookEvent&)>;

// Short human-readable description of an event for log lines.
std::string describeEvent(const HookEvent& event);

} // namespace scriptor::plugins
