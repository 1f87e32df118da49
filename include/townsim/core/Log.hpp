#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace townsim::core {

struct LogConfig {
    std::string level = "info";     // trace|debug|info|warn|error|critical|off
    std::string file;               // empty = console only
    std::size_t maxBytes = 1u << 20;
    std::size_t maxFiles = 4;
    bool async = false;
    bool console = true;
};

// Installs the "townsim" logger as spdlog's default logger.
// Safe to call more than once; the last call wins.
std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg);

// Parses a level name; unknown names map to info.
[[nodiscard]] spdlog::level::level_enum ParseLogLevel(const std::string& name) noexcept;

void ShutdownLogging();

} // namespace townsim::core
