#pragma once

#if defined(_WIN32) || defined(_WIN64)
#define SCRIPTOR_PLUGIN_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
#define SCRIPTOR_PLUGIN_EXPORT __attribute__((visibility("default")))
#else
#define SCRIPTOR_PLUGIN_EXPORT
#endif

#define SCRIPTOR_PLUGIN_ABI_VERSION 1

#define SCRIPTOR_PLUGIN_OK 0
#define SCRIPTOR_PLUGIN_ERR_INIT_FAILED -1
#define SCRIPTOR_PLUGIN_ERR_INVALID -2

// Base name of the registration entrypoint every plugin directory carries at its root.
#define SCRIPTOR_PLUGIN_ENTRYPOINT_STEM "plugin-main"

#if defined(_WIN32) || defined(_WIN64)
#define SCRIPTOR_PLUGIN_MODULE_SUFFIX ".dll"
#elif defined(__APPLE__)
#define SCRIPTOR_PLUGIN_MODULE_SUFFIX ".dylib"
#else
#define SCRIPTOR_PLUGIN_MODULE_SUFFIX ".so"
#endif

#define SCRIPTOR_PLUGIN_ENTRYPOINT SCRIPTOR_PLUGIN_ENTRYPOINT_STEM SCRIPTOR_PLUGIN_MODULE_SUFFIX

#define SCRIPTOR_PLUGIN_REGISTER_SYMBOL "scriptor_plugin_register"
#define SCRIPTOR_PLUGIN_ABI_VERSION_SYMBOL "scriptor_plugin_get_abi_version"

namespace scriptor::plugins {
class PluginApi;
}

// Symbols a plugin module exports. Only scriptor_plugin_register is required.
// The registration function receives the capability object for the plugin being
// loaded and returns SCRIPTOR_PLUGIN_OK on success.
extern "C" {
using scriptor_plugin_register_fn = int (*)(scriptor::plugins::PluginApi* api);
using scriptor_plugin_abi_version_fn = int (*)();
}
