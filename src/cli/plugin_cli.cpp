#include <scriptor/app/logging.h>
#include <scriptor/cli/plugin_cli.h>
#include <scriptor/config/plugin_config.h>
#include <scriptor/plugins/host_hooks.h>
#include <scriptor/plugins/plugin_manager.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

namespace scriptor::cli {

using plugins::DispatchStats;

namespace {

void printDispatch(const std::string& hook, const DispatchStats& stats) {
    std::cout << hook << ": " << stats.invoked << " callback(s) invoked";
    if (stats.failed > 0)
        std::cout << ", " << stats.failed << " failed (see log)";
    std::cout << '\n';
}

} // namespace

PluginCli::PluginCli() = default;
PluginCli::~PluginCli() = default;

void PluginCli::registerCommands(CLI::App& app) {
    app.add_option("--config", configPath_, "Config file (default: ~/.config/scriptor/config.toml)");
    app.add_option("--plugins-dir", pluginsDir_, "Plugins root directory");
    app.add_option("--log-level", logLevel_, "Log level: trace, debug, info, warn, error");
    app.require_subcommand(1);

    auto* list = app.add_subcommand("list", "List loaded plugins and their hooks");
    list->add_flag("--json", listJson_, "Print as JSON");
    list->callback([this]() { action_ = [this]() { return listPlugins(); }; });

    auto* install = app.add_subcommand("install", "Install a plugin package (.scpl / .zip)");
    install->add_option("package", packagePath_, "Package path")->required();
    install->add_option("--checksum", checksum_, "Expected package checksum (sha256:<hex>)");
    install->callback([this]() { action_ = [this]() { return installPackage(); }; });

    auto* uninstall = app.add_subcommand("uninstall", "Uninstall a plugin and delete its files");
    uninstall->add_option("name", pluginName_, "Plugin name")->required();
    uninstall->callback([this]() { action_ = [this]() { return uninstallPlugin(); }; });

    auto* reload = app.add_subcommand("reload", "Rediscover installed plugins");
    reload->callback([this]() { action_ = [this]() { return reloadPlugins(); }; });

    auto* open = app.add_subcommand("open", "Fire the on_open hook for a file");
    open->add_option("path", filePath_, "File path")->required();
    open->callback([this]() { action_ = [this]() { return fireOpen(); }; });

    auto* save = app.add_subcommand("save", "Fire the on_save hook for a file");
    save->add_option("path", filePath_, "File path")->required();
    save->callback([this]() { action_ = [this]() { return fireSave(); }; });

    auto* event = app.add_subcommand("event", "Fire the on_event hook");
    event->add_option("name", eventName_, "Event name")->required();
    event->add_option("--payload", eventPayload_, "JSON object passed to callbacks");
    event->callback([this]() { action_ = [this]() { return fireEvent(); }; });
}

int PluginCli::run(int argc, char* argv[]) {
    CLI::App app{"Scriptor plugin host"};
    registerCommands(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (auto res = initialize(); !res) {
        std::cerr << "Error: " << res.error().message << '\n';
        return 1;
    }
    if (!action_)
        return 0;

    auto res = action_();
    if (!res) {
        std::cerr << "Error: " << res.error().message << '\n';
        return 1;
    }
    return 0;
}

Result<void> PluginCli::initialize() {
    auto settings = config::resolvePluginSettings(configPath_);
    if (!pluginsDir_.empty())
        settings.pluginsDir = pluginsDir_;
    if (!logLevel_.empty())
        settings.logLevel = logLevel_;

    app::configureLogging(settings.logLevel, settings.logFile);
    spdlog::debug("Using plugins directory {}", settings.pluginsDir.string());

    manager_ = std::make_unique<plugins::PluginManager>(settings.pluginsDir);
    hooks_ = std::make_unique<plugins::HostHooks>(*manager_);
    manager_->loadAll();
    return Result<void>();
}

Result<void> PluginCli::listPlugins() {
    if (listJson_) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& name : manager_->pluginNames()) {
            const auto* plugin = manager_->find(name);
            nlohmann::json hooks = nlohmann::json::object();
            for (const auto& [hook, callbacks] : plugin->hooks)
                hooks[hook] = callbacks.size();
            out.push_back({{"name", name}, {"path", plugin->path.string()}, {"hooks", hooks}});
        }
        std::cout << out.dump(2) << '\n';
        return Result<void>();
    }

    if (manager_->size() == 0) {
        std::cout << "No plugins loaded from " << manager_->pluginsDir().string() << '\n';
        return Result<void>();
    }
    for (const auto& name : manager_->pluginNames()) {
        const auto* plugin = manager_->find(name);
        std::cout << name << "  " << plugin->path.string() << '\n';
        for (const auto& [hook, callbacks] : plugin->hooks)
            std::cout << "    " << hook << " (" << callbacks.size() << ")\n";
    }
    return Result<void>();
}

Result<void> PluginCli::installPackage() {
    plugins::InstallOptions options;
    if (!checksum_.empty())
        options.checksum = checksum_;
    auto res = manager_->install(packagePath_, options);
    if (!res)
        return res.error();
    const auto& r = res.value();
    std::cout << "Installed " << r.pluginName << " to: " << r.installedPath.string() << '\n';
    std::cout << "  checksum: " << r.checksum << '\n';
    std::cout << "  size: " << r.sizeBytes << " bytes (" << r.elapsed.count() << " ms)\n";
    return Result<void>();
}

Result<void> PluginCli::uninstallPlugin() {
    auto res = manager_->uninstall(pluginName_);
    if (!res)
        return res.error();
    std::cout << pluginName_ << " removed.\n";
    return Result<void>();
}

Result<void> PluginCli::reloadPlugins() {
    auto report = manager_->loadAll();
    std::string names;
    for (const auto& n : report.loaded) {
        if (!names.empty())
            names += ", ";
        names += n;
    }
    std::cout << "Loaded plugins: " << (names.empty() ? "none" : names) << '\n';
    return Result<void>();
}

Result<void> PluginCli::fireOpen() {
    printDispatch(plugins::kHookOnOpen, hooks_->onOpen(filePath_));
    return Result<void>();
}

Result<void> PluginCli::fireSave() {
    printDispatch(plugins::kHookOnSave, hooks_->onSave(filePath_));
    return Result<void>();
}

Result<void> PluginCli::fireEvent() {
    nlohmann::json payload = nlohmann::json::object();
    if (!eventPayload_.empty()) {
        try {
            payload = nlohmann::json::parse(eventPayload_);
        } catch (const nlohmann::json::parse_error& e) {
            return Error{ErrorCode::InvalidArgument, std::string("Invalid --payload: ") + e.what()};
        }
    }
    printDispatch(plugins::kHookOnEvent, hooks_->onEvent(eventName_, std::move(payload)));
    return Result<void>();
}

} // namespace scriptor::cli
