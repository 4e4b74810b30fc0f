#include <scriptor/plugins/plugin.h>
#include <scriptor/plugins/plugin_api.h>

#include <utility>

namespace scriptor::plugins {

namespace {

class PluginApiImpl final : public PluginApi {
public:
    explicit PluginApiImpl(Plugin& plugin) : plugin_(plugin) {}

    void registerHook(const std::string& name, HookCallback callback) override {
        plugin_.hooks[name].push_back(std::move(callback));
    }

    std::string_view appName() const override { return kHostAppName; }

    std::string_view pluginName() const override { return plugin_.name; }

private:
    Plugin& plugin_;
};

} // namespace

std::unique_ptr<PluginApi> makePluginApi(Plugin& plugin) {
    return std::make_unique<PluginApiImpl>(plugin);
}

} // namespace scriptor::plugins
