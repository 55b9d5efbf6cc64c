#pragma once

/// @file sun_position.hpp
/// @brief Public entry point: apparent azimuth/altitude of the Sun for an observer.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace sunward::astro
{
    /// @brief Every intermediate value of one solar position evaluation.
    struct SolarState
    {
        f64 days_since_j2000;
        f64 mean_anomaly;           ///< Radians
        f64 ecliptic_longitude;     ///< Radians
        EquatorialCoord equatorial;
        f64 sidereal_time;          ///< Radians, local
        f64 hour_angle;             ///< Radians, positive west
        HorizontalCoord horizontal;
    };

    /// @brief Check latitude ∈ [-90, 90] and longitude ∈ [-180, 180] (degrees, finite).
    /// @throws InvalidInputError on the first violated bound.
    void validate_location(const GeoCoordinate& location);

    /// @brief Run the full pipeline and keep every intermediate value.
    /// @throws InvalidInputError for out-of-range coordinates or a non-finite instant.
    /// @throws NumericDomainError if an arcsine argument leaves its domain.
    [[nodiscard]] SolarState compute_solar_state(const Instant& instant, const GeoCoordinate& location);

    /// @brief Apparent position of the Sun.
    /// @param instant Absolute time (UTC-equivalent).
    /// @param location Observer latitude/longitude in degrees, east positive.
    /// @return Azimuth (0 = south, +π/2 = west) and altitude, in radians.
    [[nodiscard]] HorizontalCoord get_position(const Instant& instant, const GeoCoordinate& location);

    [[nodiscard]] HorizontalCoord get_position(const Instant& instant, f64 latitude_deg, f64 longitude_deg);

} // namespace sunward::astro
