// Test plugin whose callbacks fail at dispatch time.

#include <scriptor/plugins/abi.h>
#include <scriptor/plugins/plugin_api.h>

#include <stdexcept>

using scriptor::plugins::HookEvent;
using scriptor::plugins::PluginApi;

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_register(PluginApi* api) {
    api->registerHook("on_open", [](const HookEvent&) {
        throw std::runtime_error("faulty plugin refuses to open files");
    });
    api->registerHook("x", [](const HookEvent&) { throw std::logic_error("x is broken"); });
    return SCRIPTOR_PLUGIN_OK;
}
