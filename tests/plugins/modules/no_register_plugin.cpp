// Test plugin that loads fine but exports no registration function.

#include <scriptor/plugins/abi.h>

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_get_abi_version() {
    return SCRIPTOR_PLUGIN_ABI_VERSION;
}
