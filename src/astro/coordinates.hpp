#pragma once

/// @file coordinates.hpp
/// @brief Coordinate types of the solar pipeline and Equatorial → Horizontal transforms.

#include "core/types.hpp"

namespace sunward::astro
{
    /// @brief Observer geographic location, as supplied by callers.
    struct GeoCoordinate
    {
        f64 latitude_deg;   ///< Geographic latitude (degrees, -90..+90, north positive)
        f64 longitude_deg;  ///< Geographic longitude (degrees, -180..+180, east positive)
    };

    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
        f64 ra;     ///< Right ascension (radians, -π..+π as returned by atan2)
    };

    /// @brief Horizontal (topocentric) coordinate, south-based azimuth.
    struct HorizontalCoord
    {
        f64 azimuth;    ///< Radians, 0 = south, +π/2 = west, -π/2 = east, ±π = north
        f64 altitude;   ///< Radians, 0 = horizon, negative = below horizon
    };

    /// @brief Azimuth from hour angle, observer latitude and declination (all radians).
    ///
    /// Result lies in (-π, π]; an exact -π from atan2 is reported as +π.
    [[nodiscard]] f64 azimuth(f64 hour_angle, f64 latitude_rad, f64 declination);

    /// @brief Altitude from hour angle, observer latitude and declination (all radians).
    /// @throws NumericDomainError if the arcsine argument leaves [-1, 1] beyond rounding noise.
    [[nodiscard]] f64 altitude(f64 hour_angle, f64 latitude_rad, f64 declination);

    /// @brief Equatorial → Horizontal for a hour angle (radians, positive west).
    [[nodiscard]] HorizontalCoord equatorial_to_horizontal(
        const EquatorialCoord& eq,
        f64 hour_angle,
        f64 latitude_rad
    );

    /// @brief Both horizontal angles converted to degrees.
    [[nodiscard]] HorizontalCoord to_degrees(const HorizontalCoord& hz);

    /// @brief South-based azimuth (radians) → compass bearing (degrees, 0 = north,
    /// 90 = east, clockwise) in [0, 360).
    [[nodiscard]] f64 to_compass_bearing(f64 azimuth_rad);

    /// @brief Unit direction towards the body in the local East-North-Up frame.
    [[nodiscard]] Vec3d to_direction(const HorizontalCoord& hz);

    /// @brief Normalize an angle to the range [0, 2π).
    [[nodiscard]] f64 normalize_radians(f64 angle);

} // namespace sunward::astro
