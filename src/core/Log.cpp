#include "townsim/core/Log.hpp"

#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace townsim::core {

namespace {

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger,
                              spdlog::level::level_enum level)
{
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps stdout free for the request/response stream.
    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!cfg.file.empty())
    {
        const fs::path p(cfg.file);
        std::error_code ec;
        if (p.has_parent_path())
            fs::create_directories(p.parent_path(), ec);

        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                p.string(), cfg.maxBytes, cfg.maxFiles));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Fall back to console output; report through whatever sink we have.
            if (sinks.empty())
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            spdlog::default_logger()->warn("Log file '{}' unavailable: {}", p.string(), e.what());
        }
    }

    if (sinks.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return sinks;
}

} // namespace

spdlog::level::level_enum ParseLogLevel(const std::string& name) noexcept
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg)
{
    auto sinks = make_sinks(cfg);

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.async)
    {
        static std::once_flag s_thread_pool_once;
        std::call_once(s_thread_pool_once, [] {
            spdlog::init_thread_pool(8192, 1);
        });

        logger = std::make_shared<spdlog::async_logger>(
            "townsim",
            sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>("townsim", sinks.begin(), sinks.end());
    }

    configure_default_logger(logger, ParseLogLevel(cfg.level));
    return logger;
}

void ShutdownLogging()
{
    if (auto logger = spdlog::default_logger())
        logger->flush();
    spdlog::shutdown();
}

} // namespace townsim::core
