// Test plugin built against a newer plugin ABI.

#include <scriptor/plugins/abi.h>
#include <scriptor/plugins/plugin_api.h>

using scriptor::plugins::PluginApi;

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_get_abi_version() {
    return SCRIPTOR_PLUGIN_ABI_VERSION + 1;
}

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_register(PluginApi*) {
    return SCRIPTOR_PLUGIN_OK;
}
