/// @file solar_ephemeris.cpp
/// @brief Implementation of the low-precision solar ephemeris.

#include "astro/solar_ephemeris.hpp"

#include "core/math/checked.hpp"
#include "core/types.hpp"

#include <cmath>

namespace sunward::astro::solar
{

using astro_constants::kDegToRad;
using astro_constants::kPi;

// -----------------------------------------------------------------
// M = 357.5291° + 0.98560028° × d
// -----------------------------------------------------------------

f64 mean_anomaly(f64 days_since_j2000)
{
    return kDegToRad * (kSolarModel.mean_anomaly_at_epoch
                        + kSolarModel.mean_anomaly_rate * days_since_j2000);
}

// -----------------------------------------------------------------
// C = 1.9148° sin(M) + 0.02° sin(2M) + 0.0003° sin(3M)
// -----------------------------------------------------------------

f64 equation_of_center(f64 mean_anomaly)
{
    return kDegToRad * (kSolarModel.center_c1 * std::sin(mean_anomaly)
                        + kSolarModel.center_c2 * std::sin(2 * mean_anomaly)
                        + kSolarModel.center_c3 * std::sin(3 * mean_anomaly));
}

// -----------------------------------------------------------------
// λ = M + C + ϖ + π   (π turns the heliocentric Earth into the geocentric Sun)
// -----------------------------------------------------------------

f64 ecliptic_longitude(f64 mean_anomaly)
{
    const f64 center = equation_of_center(mean_anomaly);
    const f64 perihelion = kDegToRad * kSolarModel.perihelion;
    return mean_anomaly + center + perihelion + kPi;
}

// -----------------------------------------------------------------
// Ecliptic → Equatorial
//
// sin(δ) = sin(β) cos(ε) + cos(β) sin(ε) sin(λ)
// tan(α) = (sin(λ) cos(ε) - tan(β) sin(ε)) / cos(λ)
// -----------------------------------------------------------------

f64 declination(f64 ecliptic_longitude, f64 ecliptic_latitude)
{
    const f64 e = kSolarModel.obliquity_rad;
    const f64 sin_dec = std::sin(ecliptic_latitude) * std::cos(e)
                      + std::cos(ecliptic_latitude) * std::sin(e) * std::sin(ecliptic_longitude);
    return math::checked_asin(sin_dec, "declination");
}

f64 right_ascension(f64 ecliptic_longitude, f64 ecliptic_latitude)
{
    const f64 e = kSolarModel.obliquity_rad;
    return std::atan2(
        std::sin(ecliptic_longitude) * std::cos(e) - std::tan(ecliptic_latitude) * std::sin(e),
        std::cos(ecliptic_longitude));
}

EquatorialCoord equatorial_from_ecliptic_longitude(f64 ecliptic_longitude)
{
    return EquatorialCoord{
        .dec = declination(ecliptic_longitude, 0.0),
        .ra  = right_ascension(ecliptic_longitude, 0.0),
    };
}

EquatorialCoord sun_equatorial_coordinates(f64 days_since_j2000)
{
    return equatorial_from_ecliptic_longitude(ecliptic_longitude(mean_anomaly(days_since_j2000)));
}

// -----------------------------------------------------------------
// θ = 280.16° + 360.9856235° × d - lw
// -----------------------------------------------------------------

f64 sidereal_time(f64 days_since_j2000, f64 longitude_west_rad)
{
    return kDegToRad * (kSolarModel.sidereal_at_epoch
                        + kSolarModel.sidereal_rate * days_since_j2000)
         - longitude_west_rad;
}

f64 hour_angle(f64 sidereal_time, f64 right_ascension)
{
    return sidereal_time - right_ascension;
}

} // namespace sunward::astro::solar
