/// @file input_parser.cpp
/// @brief Implementation of date and coordinate text parsing.

#include "app/input_parser.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>

namespace sunward::app
{

// -----------------------------------------------------------------
// Date/time: YYYY-MM-DD{ |T}HH:MM[:SS[.fff]][Z]
// -----------------------------------------------------------------

std::optional<astro::DateTime> InputParser::parse_date_time(std::string_view text)
{
    std::string_view sv = trim(text);

    if (!sv.empty() && (sv.back() == 'Z' || sv.back() == 'z'))
    {
        sv.remove_suffix(1);
    }

    const auto sep = sv.find_first_of(" T");
    if (sep == std::string_view::npos)
    {
        SWD_WARN("InputParser: Missing time in date '{}'", text);
        return std::nullopt;
    }

    const std::string_view date_part = sv.substr(0, sep);
    const std::string_view time_part = trim(sv.substr(sep + 1));

    // Date: the year may carry a leading sign, so search for '-' from index 1
    const auto dash1 = date_part.find('-', 1);
    const auto dash2 = (dash1 == std::string_view::npos)
                     ? std::string_view::npos
                     : date_part.find('-', dash1 + 1);
    if (dash2 == std::string_view::npos)
    {
        SWD_WARN("InputParser: Malformed date '{}'", text);
        return std::nullopt;
    }

    const auto year  = parse_i32(date_part.substr(0, dash1));
    const auto month = parse_i32(date_part.substr(dash1 + 1, dash2 - dash1 - 1));
    const auto day   = parse_i32(date_part.substr(dash2 + 1));

    // Time: HH:MM with optional :SS[.fff]
    const auto colon1 = time_part.find(':');
    if (colon1 == std::string_view::npos)
    {
        SWD_WARN("InputParser: Malformed time in '{}'", text);
        return std::nullopt;
    }
    const auto colon2 = time_part.find(':', colon1 + 1);

    const auto hour = parse_i32(time_part.substr(0, colon1));
    const auto minute = parse_i32(time_part.substr(
        colon1 + 1,
        colon2 == std::string_view::npos ? std::string_view::npos : colon2 - colon1 - 1));
    const auto second = (colon2 == std::string_view::npos)
                      ? std::optional<f64>{0.0}
                      : parse_f64(time_part.substr(colon2 + 1));

    if (!year || !month || !day || !hour || !minute || !second)
    {
        SWD_WARN("InputParser: Failed to parse date/time fields in '{}'", text);
        return std::nullopt;
    }

    return astro::DateTime{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = *hour,
        .minute = *minute,
        .second = *second,
    };
}

std::optional<f64> InputParser::parse_degrees(std::string_view text)
{
    const auto value = parse_f64(trim(text));
    if (!value)
    {
        SWD_WARN("InputParser: '{}' is not a number of degrees", text);
    }
    return value;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view InputParser::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 / i32 from string_view (whole input must be consumed)
// -----------------------------------------------------------------

std::optional<f64> InputParser::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects a leading '+', which users do type for north/east
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
        if (sv.empty() || sv.front() == '-')
        {
            return std::nullopt;
        }
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<i32> InputParser::parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace sunward::app
