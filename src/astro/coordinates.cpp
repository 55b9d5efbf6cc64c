/// @file coordinates.cpp
/// @brief Implementation of horizontal coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/math/checked.hpp"
#include "core/types.hpp"

#include <glm/geometric.hpp>

#include <cmath>

namespace sunward::astro
{

// -----------------------------------------------------------------
// Equatorial → Horizontal (south-based azimuth)
//
// tan(az)  = sin(H) / (cos(H) × sin(lat) - tan(dec) × cos(lat))
// sin(alt) = sin(lat) × sin(dec) + cos(lat) × cos(dec) × cos(H)
// -----------------------------------------------------------------

f64 azimuth(f64 hour_angle, f64 latitude_rad, f64 declination)
{
    const f64 az = std::atan2(
        std::sin(hour_angle),
        std::cos(hour_angle) * std::sin(latitude_rad) - std::tan(declination) * std::cos(latitude_rad));

    // atan2 may return -π for a signed-zero numerator; fold onto +π (north)
    return (az <= -astro_constants::kPi) ? astro_constants::kPi : az;
}

f64 altitude(f64 hour_angle, f64 latitude_rad, f64 declination)
{
    const f64 sin_alt = std::sin(latitude_rad) * std::sin(declination)
                      + std::cos(latitude_rad) * std::cos(declination) * std::cos(hour_angle);
    return math::checked_asin(sin_alt, "altitude");
}

HorizontalCoord equatorial_to_horizontal(
    const EquatorialCoord& eq,
    f64 hour_angle,
    f64 latitude_rad)
{
    return HorizontalCoord{
        .azimuth  = azimuth(hour_angle, latitude_rad, eq.dec),
        .altitude = altitude(hour_angle, latitude_rad, eq.dec),
    };
}

HorizontalCoord to_degrees(const HorizontalCoord& hz)
{
    return HorizontalCoord{
        .azimuth  = hz.azimuth * astro_constants::kRadToDeg,
        .altitude = hz.altitude * astro_constants::kRadToDeg,
    };
}

// -----------------------------------------------------------------
// South-based azimuth → compass bearing: bearing = az + π, in [0, 360°)
// -----------------------------------------------------------------

f64 to_compass_bearing(f64 azimuth_rad)
{
    return normalize_radians(azimuth_rad + astro_constants::kPi) * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Horizontal → ENU unit vector
//
// South-based azimuth measured towards west:
//   east  = -cos(alt) × sin(az)
//   north = -cos(alt) × cos(az)
//   up    =  sin(alt)
// -----------------------------------------------------------------

Vec3d to_direction(const HorizontalCoord& hz)
{
    const f64 cos_alt = std::cos(hz.altitude);
    const Vec3d dir{
        -cos_alt * std::sin(hz.azimuth),
        -cos_alt * std::cos(hz.azimuth),
        std::sin(hz.altitude),
    };
    return glm::normalize(dir);
}

f64 normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    // fmod of a tiny negative angle can round back up to exactly 2π
    if (angle >= astro_constants::kTwoPi)
    {
        angle = 0.0;
    }
    return angle;
}

} // namespace sunward::astro
