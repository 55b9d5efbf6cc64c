/// @file report.cpp
/// @brief Report formatting using the fmt library bundled with spdlog.

#include "app/report.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace sunward::app
{

std::string format_date_time(const astro::DateTime& dt)
{
    const f64 whole = std::floor(dt.second);
    if (dt.second == whole)
    {
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                           dt.year, dt.month, dt.day, dt.hour, dt.minute,
                           static_cast<i32>(whole));
    }
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:06.3f}",
                       dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
}

std::string format_report(
    const astro::DateTime& when,
    const astro::GeoCoordinate& location,
    const astro::HorizontalCoord& position,
    bool in_degrees)
{
    std::string report = fmt::format(
        "On {}, at latitude: {} and longitude: {}, the sun is at\n",
        format_date_time(when), location.latitude_deg, location.longitude_deg);

    if (in_degrees)
    {
        const astro::HorizontalCoord deg = astro::to_degrees(position);
        report += fmt::format(" a) azimuth: {:.4f} deg (compass bearing {:.4f} deg)\n",
                              deg.azimuth, astro::to_compass_bearing(position.azimuth));
        report += fmt::format(" b) altitude: {:.4f} deg\n", deg.altitude);
    }
    else
    {
        report += fmt::format(" a) azimuth: {}\n", position.azimuth);
        report += fmt::format(" b) altitude: {}\n", position.altitude);
    }

    return report;
}

} // namespace sunward::app
