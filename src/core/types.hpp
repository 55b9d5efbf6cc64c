#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace sunward
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for astronomy)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kJ1970       = 2440588.0;  // Julian Date of 1970-01-01 12:00 UTC
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kMsPerDay    = 1000.0 * 60.0 * 60.0 * 24.0;
        constexpr f64 kObliquity   = 23.4397 * kDegToRad;  // Earth's axial tilt
    }
}
