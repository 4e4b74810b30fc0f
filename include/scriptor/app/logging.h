#pragma once

#include <filesystem>
#include <string>

namespace scriptor::app {

/**
 * Install the default spdlog logger for the plugin host.
 * Logs to a colour console sink, or to a rotating file (10MB x 5) when
 * @p logFile is set. Unknown level names leave the current level unchanged.
 */
void configureLogging(const std::string& level, const std::filesystem::path& logFile = {});

} // namespace scriptor::app
