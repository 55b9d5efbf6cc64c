#pragma once

/// @file input_parser.hpp
/// @brief Parses user-entered date and coordinate strings.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace sunward::app
{
    /// @brief Static utility class turning text input into typed values.
    ///
    /// Parsers only check syntax; range checks happen in the astro layer,
    /// which raises InvalidInputError. Failures are logged on the app logger
    /// (plain stderr until Logger::init() has been called).
    class InputParser
    {
    public:
        InputParser() = delete;

        /// @brief Parse a UTC date/time.
        ///
        /// Accepted forms:
        ///   2025-02-11 11:25:18
        ///   2025-02-11T11:25:18.250Z
        ///   2025-02-11 11:25         (seconds default to 0)
        ///
        /// @return The parsed fields, or std::nullopt on a syntax error.
        [[nodiscard]] static std::optional<astro::DateTime> parse_date_time(std::string_view text);

        /// @brief Parse a decimal angle in degrees, e.g. "51.2113" or "-3.5".
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_degrees(std::string_view text);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

    private:
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
        [[nodiscard]] static std::optional<i32> parse_i32(std::string_view sv);
    };

} // namespace sunward::app
