#pragma once

/// @file cli_options.hpp
/// @brief Command-line options of the sunward executable.

#include "core/logger.hpp"

#include <optional>
#include <string>

namespace sunward::app
{
    /// @brief Options gathered from argv.
    ///
    /// Date and coordinates stay as raw text; whatever is missing is prompted
    /// for on stdin by the Application.
    struct CliOptions
    {
        std::optional<std::string> date;
        std::optional<std::string> latitude;
        std::optional<std::string> longitude;
        bool output_degrees = false;
        bool show_help = false;

        core::LoggerConfig logger;

        bool had_parse_error = false;
        std::string error_message;
    };

    /// @brief Parse argv. Never throws; errors are reported through
    /// had_parse_error/error_message since the logger is not up yet.
    [[nodiscard]] CliOptions parse_cli_options(int argc, const char* const* argv);

    /// @brief Multi-line usage text.
    [[nodiscard]] std::string usage_text(const char* program_name);

} // namespace sunward::app
