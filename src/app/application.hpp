#pragma once

/// @file application.hpp
/// @brief Command-line application: gathers input, runs the pipeline, prints the report.

#include "app/cli_options.hpp"
#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sunward::app
{
    /// @brief Exit codes returned by Application::run().
    enum class ExitCode : int
    {
        Success = 0,
        InvalidInput = 1,
        UsageError = 2,
    };

    /// @brief Drives one interactive or argument-driven Sun position query.
    ///
    /// Lifecycle: construct with parsed options and the streams to use,
    /// then run() once. The logger must already be initialized.
    /// Errors raised by the astro layer are caught here, logged and mapped
    /// to an exit code; nothing escapes run().
    class Application
    {
    public:
        Application(CliOptions options, std::istream& in, std::ostream& out);

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        /// @brief Execute the query. Returns the process exit code.
        [[nodiscard]] ExitCode run();

    private:
        /// @brief Return the option value, or prompt for it on the input stream.
        [[nodiscard]] std::optional<std::string> value_or_prompt(
            const std::optional<std::string>& value, std::string_view prompt);

        [[nodiscard]] ExitCode compute_and_report(
            const astro::DateTime& when, const astro::GeoCoordinate& location);

        CliOptions m_options;
        std::istream& m_in;
        std::ostream& m_out;
    };

} // namespace sunward::app
