#include <scriptor/plugins/host_hooks.h>

namespace scriptor::plugins {

DispatchStats HostHooks::onOpen(const std::string& path) {
    return manager_.callHook(kHookOnOpen, OpenEvent{path});
}

DispatchStats HostHooks::onSave(const std::string& path) {
    return manager_.callHook(kHookOnSave, SaveEvent{path});
}

DispatchStats HostHooks::onEvent(const std::string& name, nlohmann::json payload) {
    if (!payload.is_object()) {
        payload = nlohmann::json{{"value", std::move(payload)}};
    }
    return manager_.callHook(kHookOnEvent, GenericEvent{name, std::move(payload)});
}

} // namespace scriptor::plugins
