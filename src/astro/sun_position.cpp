/// @file sun_position.cpp
/// @brief Sun position pipeline: time → ephemeris → sidereal time → horizontal.

#include "astro/sun_position.hpp"

#include "astro/solar_ephemeris.hpp"
#include "core/math/checked.hpp"
#include "core/types.hpp"

namespace sunward::astro
{

void validate_location(const GeoCoordinate& location)
{
    math::require_in_range(location.latitude_deg, -90.0, 90.0, "latitude");
    math::require_in_range(location.longitude_deg, -180.0, 180.0, "longitude");
}

SolarState compute_solar_state(const Instant& instant, const GeoCoordinate& location)
{
    validate_location(location);

    // The only place where east-positive degrees become west-positive radians
    const f64 longitude_west_rad = -location.longitude_deg * astro_constants::kDegToRad;
    const f64 latitude_rad = location.latitude_deg * astro_constants::kDegToRad;

    const f64 d = TimeSystem::days_since_j2000(instant);

    const f64 m = solar::mean_anomaly(d);
    const f64 l = solar::ecliptic_longitude(m);
    const EquatorialCoord eq = solar::equatorial_from_ecliptic_longitude(l);

    const f64 lst = solar::sidereal_time(d, longitude_west_rad);
    const f64 ha = solar::hour_angle(lst, eq.ra);

    return SolarState{
        .days_since_j2000   = d,
        .mean_anomaly       = m,
        .ecliptic_longitude = l,
        .equatorial         = eq,
        .sidereal_time      = lst,
        .hour_angle         = ha,
        .horizontal         = equatorial_to_horizontal(eq, ha, latitude_rad),
    };
}

HorizontalCoord get_position(const Instant& instant, const GeoCoordinate& location)
{
    return compute_solar_state(instant, location).horizontal;
}

HorizontalCoord get_position(const Instant& instant, f64 latitude_deg, f64 longitude_deg)
{
    return get_position(instant, GeoCoordinate{
        .latitude_deg  = latitude_deg,
        .longitude_deg = longitude_deg,
    });
}

} // namespace sunward::astro
