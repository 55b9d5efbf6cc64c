#pragma once

/// @file report.hpp
/// @brief Text formatting of a computed Sun position.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <string>

namespace sunward::app
{
    /// @brief "YYYY-MM-DD HH:MM:SS", with fractional seconds only when present.
    [[nodiscard]] std::string format_date_time(const astro::DateTime& dt);

    /// @brief Human-readable report of one position.
    ///
    /// Angles are printed in radians (shortest round-trip form) unless
    /// in_degrees is set, in which case the compass bearing is added.
    [[nodiscard]] std::string format_report(
        const astro::DateTime& when,
        const astro::GeoCoordinate& location,
        const astro::HorizontalCoord& position,
        bool in_degrees);

} // namespace sunward::app
