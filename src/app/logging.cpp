#include <scriptor/app/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace scriptor::app {

void configureLogging(const std::string& level, const std::filesystem::path& logFile) {
    std::shared_ptr<spdlog::logger> logger;
    if (!logFile.empty()) {
        try {
            std::error_code ec;
            std::filesystem::create_directories(logFile.parent_path(), ec);
            // Rotating file sink
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), max_size, max_files);
            logger = std::make_shared<spdlog::logger>("scriptor", rotating_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}; logging to console", logFile.string(),
                         e.what());
        }
    }
    if (!logger) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("scriptor", console_sink);
    }
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (!level.empty()) {
        spdlog::warn("Unknown log level '{}'", level);
    }
}

} // namespace scriptor::app
