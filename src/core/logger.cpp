/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace sunward::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const LoggerConfig& config)
{
    // Re-initialization replaces the previous loggers
    if (is_initialized())
    {
        shutdown();
    }

    // -----------------------------------------------------------------
    // Shared sinks, both loggers write to the same console and file.
    // Console goes to stderr so stdout carries only the report.
    // -----------------------------------------------------------------
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(config.pattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    // An unwritable log file leaves the console sink alone; reported below
    std::string file_sink_error;
    if (config.enable_file_sink && !config.log_file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        try
        {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, kMaxFileSize, kMaxFiles);
            file_sink->set_pattern(config.pattern);
            sinks.push_back(file_sink);
        }
        catch (const spdlog::spdlog_ex& e)
        {
            file_sink_error = e.what();
        }
    }

    // -----------------------------------------------------------------
    // Core logger ("SUNWARD")
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("SUNWARD", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"), command line, user-facing
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);

    if (!file_sink_error.empty())
    {
        s_core_logger->warn("Logging to console only: {}", file_sink_error);
    }
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

bool Logger::is_initialized()
{
    return s_core_logger != nullptr && s_app_logger != nullptr;
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

spdlog::logger& Logger::core()
{
    return s_core_logger ? *s_core_logger : fallback_logger();
}

spdlog::logger& Logger::app()
{
    return s_app_logger ? *s_app_logger : fallback_logger();
}

spdlog::logger& Logger::fallback_logger()
{
    // Unregistered, so spdlog::drop_all() in shutdown() leaves it usable
    static const std::shared_ptr<spdlog::logger> s_fallback = std::make_shared<spdlog::logger>(
        "SUNWARD-FALLBACK", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return *s_fallback;
}

} // namespace sunward::core
