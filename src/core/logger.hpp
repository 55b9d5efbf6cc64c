#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace sunward::core
{
    /// @brief Logger setup, filled from the command line.
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        std::string log_file = "sunward.log";
        bool enable_file_sink = true;
        std::string pattern = "[%T.%e] [%n] [%^%l%$] %v";
    };

    /// @brief Centralized logging facility for Sunward.
    ///
    /// Provides two separate loggers:
    /// - **SUNWARD** (core): library internals, startup and shutdown
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored console output and, when enabled, a rotating log file.
    /// Call init() once from main(). The astronomical
    /// pipeline itself never logs.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        /// A log file that cannot be opened is reported as a warning and
        /// logging continues on the console. SWD_ macros used before this
        /// call go to a plain stderr logger.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        [[nodiscard]] static bool is_initialized();

        /// @brief Access the core logger ("SUNWARD").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

        /// @brief Core logger, or a stderr fallback before init() / after shutdown().
        [[nodiscard]] static spdlog::logger& core();

        /// @brief App logger, or a stderr fallback before init() / after shutdown().
        [[nodiscard]] static spdlog::logger& app();

    private:
        static spdlog::logger& fallback_logger();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace sunward::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SWD_CORE_TRACE(...)    ::sunward::core::Logger::core().trace(__VA_ARGS__)
#define SWD_CORE_DEBUG(...)    ::sunward::core::Logger::core().debug(__VA_ARGS__)
#define SWD_CORE_INFO(...)     ::sunward::core::Logger::core().info(__VA_ARGS__)
#define SWD_CORE_WARN(...)     ::sunward::core::Logger::core().warn(__VA_ARGS__)
#define SWD_CORE_ERROR(...)    ::sunward::core::Logger::core().error(__VA_ARGS__)
#define SWD_CORE_CRITICAL(...) ::sunward::core::Logger::core().critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SWD_TRACE(...)         ::sunward::core::Logger::app().trace(__VA_ARGS__)
#define SWD_DEBUG(...)         ::sunward::core::Logger::app().debug(__VA_ARGS__)
#define SWD_INFO(...)          ::sunward::core::Logger::app().info(__VA_ARGS__)
#define SWD_WARN(...)          ::sunward::core::Logger::app().warn(__VA_ARGS__)
#define SWD_ERROR(...)         ::sunward::core::Logger::app().error(__VA_ARGS__)
#define SWD_CRITICAL(...)      ::sunward::core::Logger::app().critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
