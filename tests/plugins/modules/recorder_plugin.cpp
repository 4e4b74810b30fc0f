// Test plugin that appends one line per hook invocation to the file named by
// SCRIPTOR_TEST_RECORD_FILE. Built twice with different tags to check that
// identically named symbols in two plugins stay separate.

#include <scriptor/plugins/abi.h>
#include <scriptor/plugins/plugin_api.h>

#include <cstdlib>
#include <fstream>
#include <string>

#ifndef SCRIPTOR_TEST_PLUGIN_TAG
#define SCRIPTOR_TEST_PLUGIN_TAG "recorder"
#endif

using scriptor::plugins::GenericEvent;
using scriptor::plugins::HookEvent;
using scriptor::plugins::OpenEvent;
using scriptor::plugins::PluginApi;
using scriptor::plugins::SaveEvent;

// Same name in every build of this module.
extern "C" SCRIPTOR_PLUGIN_EXPORT const char* scriptor_test_identity() {
    return SCRIPTOR_TEST_PLUGIN_TAG;
}

namespace {

void record(const std::string& line) {
    const char* file = std::getenv("SCRIPTOR_TEST_RECORD_FILE");
    if (!file || !*file)
        return;
    std::ofstream out(file, std::ios::app);
    out << scriptor_test_identity() << '|' << line << '\n';
}

std::string detail(const HookEvent& event) {
    if (auto* open = std::get_if<OpenEvent>(&event))
        return open->path;
    if (auto* save = std::get_if<SaveEvent>(&event))
        return save->path;
    const auto& generic = std::get<GenericEvent>(event);
    return generic.name + ' ' + generic.payload.dump();
}

} // namespace

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_get_abi_version() {
    return SCRIPTOR_PLUGIN_ABI_VERSION;
}

extern "C" SCRIPTOR_PLUGIN_EXPORT int scriptor_plugin_register(PluginApi* api) {
    if (!api)
        return SCRIPTOR_PLUGIN_ERR_INVALID;
    std::string self(api->pluginName());
    record(self + "|register|" + std::string(api->appName()));

    for (const char* hook : {"on_open", "on_save", "on_event"}) {
        std::string name = hook;
        api->registerHook(name, [self, name](const HookEvent& event) {
            record(self + '|' + name + '|' + detail(event));
        });
    }
    return SCRIPTOR_PLUGIN_OK;
}
