#pragma once

/// @file solar_ephemeris.hpp
/// @brief Low-precision solar ephemeris: mean anomaly, ecliptic longitude,
///        equatorial coordinates, sidereal time.
///
/// The model is the classic "low precision" Sun formula (about one arcminute).
/// All functions are pure; no angle is normalized, since every consumer
/// feeds them into periodic trigonometric functions.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace sunward::astro::solar
{
    /// @brief Coefficients of the solar model, in degrees unless noted.
    struct SolarModelConstants
    {
        f64 mean_anomaly_at_epoch  = 357.5291;     ///< M at J2000.0
        f64 mean_anomaly_rate      = 0.98560028;   ///< Degrees per day
        f64 center_c1              = 1.9148;       ///< Equation of center, sin(M) term
        f64 center_c2              = 0.02;         ///< sin(2M) term
        f64 center_c3              = 0.0003;       ///< sin(3M) term
        f64 perihelion             = 102.9372;     ///< Longitude of Earth's perihelion
        f64 sidereal_at_epoch      = 280.16;       ///< Sidereal time at J2000.0, Greenwich
        f64 sidereal_rate          = 360.9856235;  ///< Degrees per day
        f64 obliquity_rad          = astro_constants::kObliquity;
    };

    inline constexpr SolarModelConstants kSolarModel{};

    /// @brief Solar mean anomaly (radians) after d days since J2000.0.
    [[nodiscard]] f64 mean_anomaly(f64 days_since_j2000);

    /// @brief Equation of center (radians) for a mean anomaly.
    [[nodiscard]] f64 equation_of_center(f64 mean_anomaly);

    /// @brief Apparent ecliptic longitude of the Sun (radians): M + C + perihelion + π.
    [[nodiscard]] f64 ecliptic_longitude(f64 mean_anomaly);

    /// @brief Declination (radians) of an ecliptic position.
    /// @throws NumericDomainError if the arcsine argument leaves [-1, 1] beyond rounding noise.
    [[nodiscard]] f64 declination(f64 ecliptic_longitude, f64 ecliptic_latitude);

    /// @brief Right ascension (radians) of an ecliptic position.
    [[nodiscard]] f64 right_ascension(f64 ecliptic_longitude, f64 ecliptic_latitude);

    /// @brief Equatorial position of a point on the ecliptic (ecliptic latitude 0).
    [[nodiscard]] EquatorialCoord equatorial_from_ecliptic_longitude(f64 ecliptic_longitude);

    /// @brief Declination and right ascension of the Sun (ecliptic latitude 0).
    [[nodiscard]] EquatorialCoord sun_equatorial_coordinates(f64 days_since_j2000);

    /// @brief Local sidereal time (radians).
    /// @param longitude_west_rad Observer longitude, positive WEST, in radians.
    [[nodiscard]] f64 sidereal_time(f64 days_since_j2000, f64 longitude_west_rad);

    /// @brief Hour angle (radians, positive west of the meridian).
    [[nodiscard]] f64 hour_angle(f64 sidereal_time, f64 right_ascension);

} // namespace sunward::astro::solar
