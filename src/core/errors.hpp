#pragma once

/// @file errors.hpp
/// @brief Exception types raised by the solar position pipeline.

#include <stdexcept>
#include <string>

namespace sunward
{
    /// @brief Base class for every error raised by Sunward.
    class SunwardError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief An input value is outside its valid range or not finite.
    ///
    /// Raised for latitudes outside [-90, 90], longitudes outside [-180, 180],
    /// NaN/infinite coordinates and instants that do not map to a finite timestamp.
    class InvalidInputError : public SunwardError
    {
    public:
        using SunwardError::SunwardError;
    };

    /// @brief A trigonometric argument left its mathematical domain.
    class NumericDomainError : public SunwardError
    {
    public:
        using SunwardError::SunwardError;
    };

} // namespace sunward
