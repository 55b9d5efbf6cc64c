#pragma once
// core/math/checked.hpp - Range-checked numeric helpers
//
// Guards the few places where floating-point drift or bad input
// would otherwise turn into a silent NaN.

#include "core/errors.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>

namespace sunward::math {

/// Largest overshoot beyond [-1, 1] that is treated as rounding noise.
inline constexpr f64 kAsinTolerance = 1e-12;

/// Arcsine that clamps rounding noise and rejects real domain violations.
/// @throws NumericDomainError if x is NaN or further than kAsinTolerance outside [-1, 1].
inline f64 checked_asin(f64 x, std::string_view what = "asin") {
    if (std::isnan(x) || std::abs(x) > 1.0 + kAsinTolerance) {
        throw NumericDomainError(std::string(what) + ": argument "
                                 + std::to_string(x) + " outside [-1, 1]");
    }
    return std::asin(std::clamp(x, -1.0, 1.0));
}

/// @throws InvalidInputError if value is NaN or infinite.
inline f64 require_finite(f64 value, std::string_view name) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(std::string(name) + " must be finite");
    }
    return value;
}

/// @throws InvalidInputError if value is not finite or lies outside [lo, hi].
inline f64 require_in_range(f64 value, f64 lo, f64 hi, std::string_view name) {
    require_finite(value, name);
    if (value < lo || value > hi) {
        throw InvalidInputError(std::string(name) + " " + std::to_string(value)
                                + " outside [" + std::to_string(lo) + ", "
                                + std::to_string(hi) + "]");
    }
    return value;
}

} // namespace sunward::math
