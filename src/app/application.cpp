/// @file application.cpp
/// @brief Application implementation: input gathering, computation, reporting.

#include "app/application.hpp"

#include "app/input_parser.hpp"
#include "app/report.hpp"
#include "astro/sun_position.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <istream>
#include <ostream>
#include <utility>

namespace sunward::app
{

Application::Application(CliOptions options, std::istream& in, std::ostream& out)
    : m_options(std::move(options))
    , m_in(in)
    , m_out(out)
{
}

ExitCode Application::run()
{
    if (m_options.had_parse_error)
    {
        SWD_ERROR("Invalid command line: {}", m_options.error_message);
        return ExitCode::UsageError;
    }

    // -----------------------------------------------------------------
    // 1. Gather raw input (arguments first, then prompts)
    // -----------------------------------------------------------------
    const auto date_text = value_or_prompt(
        m_options.date, "Enter date and time (in format: 2025-02-11 11:25:18): ");
    const auto lat_text = value_or_prompt(m_options.latitude, "Enter latitude: ");
    const auto lng_text = value_or_prompt(m_options.longitude, "Enter longitude: ");

    if (!date_text || !lat_text || !lng_text)
    {
        SWD_ERROR("Input ended before date, latitude and longitude were given");
        return ExitCode::InvalidInput;
    }

    // -----------------------------------------------------------------
    // 2. Parse
    // -----------------------------------------------------------------
    const auto when = InputParser::parse_date_time(*date_text);
    const auto latitude = InputParser::parse_degrees(*lat_text);
    const auto longitude = InputParser::parse_degrees(*lng_text);

    if (!when || !latitude || !longitude)
    {
        SWD_ERROR("Could not parse input (date '{}', latitude '{}', longitude '{}')",
                  *date_text, *lat_text, *lng_text);
        return ExitCode::InvalidInput;
    }

    // -----------------------------------------------------------------
    // 3. Compute and print
    // -----------------------------------------------------------------
    return compute_and_report(*when, astro::GeoCoordinate{
        .latitude_deg  = *latitude,
        .longitude_deg = *longitude,
    });
}

std::optional<std::string> Application::value_or_prompt(
    const std::optional<std::string>& value, std::string_view prompt)
{
    if (value)
    {
        return value;
    }

    m_out << prompt << std::flush;

    std::string line;
    if (!std::getline(m_in, line))
    {
        return std::nullopt;
    }
    return line;
}

ExitCode Application::compute_and_report(
    const astro::DateTime& when, const astro::GeoCoordinate& location)
{
    try
    {
        const astro::Instant instant = astro::TimeSystem::to_instant(when);
        const astro::SolarState state = astro::compute_solar_state(instant, location);

        SWD_DEBUG("d = {} days since J2000, M = {} rad, L = {} rad",
                  state.days_since_j2000, state.mean_anomaly, state.ecliptic_longitude);
        SWD_DEBUG("dec = {} rad, ra = {} rad, LST = {} rad, H = {} rad",
                  state.equatorial.dec, state.equatorial.ra,
                  state.sidereal_time, state.hour_angle);

        m_out << format_report(when, location, state.horizontal, m_options.output_degrees);
    }
    catch (const SunwardError& e)
    {
        SWD_ERROR("{}", e.what());
        return ExitCode::InvalidInput;
    }

    return ExitCode::Success;
}

} // namespace sunward::app
