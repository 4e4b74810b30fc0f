#include <spdlog/spdlog.h>
#include <scriptor/cli/plugin_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; PluginCli::run() applies the configured level
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        scriptor::cli::PluginCli cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
