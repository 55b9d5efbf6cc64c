#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: instants, civil dates, Julian day, J2000 offsets.

#include "core/types.hpp"

#include <chrono>

namespace sunward::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Absolute point in time, as milliseconds since 1970-01-01 00:00 UTC.
    struct Instant
    {
        f64 unix_millis;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Civil dates are converted through the integer Julian Day Number
    /// (Fliegel & Van Flandern), so whole-second instants are exact.
    /// Every Julian day derived here uses the Unix-millisecond convention
    /// JD = ms / 86400000 - 0.5 + J1970.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Range of unix_millis accepted by to_date_time(): from JDN 0 to +100 million days.
        static constexpr f64 kMinUnixMillis = -2440588.0 * 86400000.0;
        static constexpr f64 kMaxUnixMillis = 8.64e15;

        /// @brief Civil years accepted by to_instant().
        static constexpr i32 kMinYear = -4712;
        static constexpr i32 kMaxYear = 275759;

        /// @brief Convert civil date/time (UTC) to an instant.
        /// @param dt Month in [1,12], day within the month, hour in [0,23],
        ///           minute in [0,59], second in [0,60).
        /// @throws InvalidInputError if any field is out of range.
        [[nodiscard]] static Instant to_instant(const DateTime& dt);

        /// @brief Convert an instant back to civil date/time (UTC).
        /// @throws InvalidInputError if the instant is not finite or out of range.
        [[nodiscard]] static DateTime to_date_time(const Instant& instant);

        /// @brief Wrap a system clock reading.
        [[nodiscard]] static Instant from_time_point(std::chrono::system_clock::time_point tp);

        /// @brief Current system time.
        [[nodiscard]] static Instant now();

        /// @brief Fractional Julian day of an instant.
        /// @throws InvalidInputError if the timestamp is NaN or infinite.
        [[nodiscard]] static f64 to_julian_day(const Instant& instant);

        /// @brief Days elapsed since J2000.0 (JD 2451545.0).
        /// @throws InvalidInputError if the timestamp is NaN or infinite.
        [[nodiscard]] static f64 days_since_j2000(const Instant& instant);

        /// @brief Number of days in a month of the proleptic Gregorian calendar.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

    private:
        /// @brief Julian Day Number of the civil date (noon-based, integer).
        [[nodiscard]] static i64 julian_day_number(i32 year, i32 month, i32 day);
    };

} // namespace sunward::astro
