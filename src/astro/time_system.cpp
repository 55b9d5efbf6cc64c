/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/errors.hpp"
#include "core/math/checked.hpp"
#include "core/types.hpp"

#include <cmath>
#include <string>

namespace sunward::astro
{

namespace
{

constexpr i64 kMsPerDayInt    = 86'400'000;
constexpr i64 kUnixEpochJdn   = 2'440'588;  // JDN of 1970-01-01

bool is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Civil date → instant
//
// days = JDN(date) - JDN(1970-01-01)
// ms   = days × 86 400 000 + time of day
// -----------------------------------------------------------------

Instant TimeSystem::to_instant(const DateTime& dt)
{
    if (dt.year < kMinYear || dt.year > kMaxYear)
    {
        throw InvalidInputError("year " + std::to_string(dt.year) + " outside supported range");
    }
    if (dt.month < 1 || dt.month > 12)
    {
        throw InvalidInputError("month " + std::to_string(dt.month) + " outside [1, 12]");
    }
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
    {
        throw InvalidInputError("day " + std::to_string(dt.day) + " outside month "
                                + std::to_string(dt.year) + "-" + std::to_string(dt.month));
    }
    if (dt.hour < 0 || dt.hour > 23)
    {
        throw InvalidInputError("hour " + std::to_string(dt.hour) + " outside [0, 23]");
    }
    if (dt.minute < 0 || dt.minute > 59)
    {
        throw InvalidInputError("minute " + std::to_string(dt.minute) + " outside [0, 59]");
    }
    math::require_finite(dt.second, "second");
    if (dt.second < 0.0 || dt.second >= 60.0)
    {
        throw InvalidInputError("second " + std::to_string(dt.second) + " outside [0, 60)");
    }

    const i64 days = julian_day_number(dt.year, dt.month, dt.day) - kUnixEpochJdn;
    const i64 whole_ms = days * kMsPerDayInt
                       + (static_cast<i64>(dt.hour) * 3600 + static_cast<i64>(dt.minute) * 60) * 1000;

    return Instant{
        .unix_millis = static_cast<f64>(whole_ms) + dt.second * 1000.0,
    };
}

// -----------------------------------------------------------------
// Instant → civil date (inverse Fliegel & Van Flandern)
// -----------------------------------------------------------------

DateTime TimeSystem::to_date_time(const Instant& instant)
{
    math::require_finite(instant.unix_millis, "timestamp");
    if (instant.unix_millis < kMinUnixMillis || instant.unix_millis > kMaxUnixMillis)
    {
        throw InvalidInputError("timestamp " + std::to_string(instant.unix_millis)
                                + " ms outside the supported calendar range");
    }

    const f64 floor_ms = std::floor(instant.unix_millis);
    const f64 sub_ms = instant.unix_millis - floor_ms;
    const auto total_ms = static_cast<i64>(floor_ms);

    // Floor division so that instants before 1970 land on the previous day
    i64 days = total_ms / kMsPerDayInt;
    i64 ms_of_day = total_ms % kMsPerDayInt;
    if (ms_of_day < 0)
    {
        ms_of_day += kMsPerDayInt;
        --days;
    }

    const i64 a = days + kUnixEpochJdn + 32044;
    const i64 b = (4 * a + 3) / 146097;
    const i64 c = a - (146097 * b) / 4;
    const i64 d = (4 * c + 3) / 1461;
    const i64 e = c - (1461 * d) / 4;
    const i64 m = (5 * e + 2) / 153;

    const i64 hour = ms_of_day / 3'600'000;
    const i64 minute = (ms_of_day / 60'000) % 60;
    const i64 ms_of_minute = ms_of_day % 60'000;

    return DateTime{
        .year   = static_cast<i32>(100 * b + d - 4800 + m / 10),
        .month  = static_cast<i32>(m + 3 - 12 * (m / 10)),
        .day    = static_cast<i32>(e - (153 * m + 2) / 5 + 1),
        .hour   = static_cast<i32>(hour),
        .minute = static_cast<i32>(minute),
        .second = (static_cast<f64>(ms_of_minute) + sub_ms) / 1000.0,
    };
}

Instant TimeSystem::from_time_point(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    const auto since_epoch = duration_cast<duration<f64, std::milli>>(tp.time_since_epoch());
    return Instant{.unix_millis = since_epoch.count()};
}

Instant TimeSystem::now()
{
    return from_time_point(std::chrono::system_clock::now());
}

// -----------------------------------------------------------------
// Julian day: JD = ms / 86 400 000 - 0.5 + J1970
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_day(const Instant& instant)
{
    math::require_finite(instant.unix_millis, "timestamp");
    return instant.unix_millis / astro_constants::kMsPerDay - 0.5 + astro_constants::kJ1970;
}

f64 TimeSystem::days_since_j2000(const Instant& instant)
{
    return to_julian_day(instant) - astro_constants::kJ2000;
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    switch (month)
    {
    case 2:
        return is_leap_year(year) ? 29 : 28;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    default:
        return 31;
    }
}

i64 TimeSystem::julian_day_number(i32 year, i32 month, i32 day)
{
    const i64 a = (14 - month) / 12;
    const i64 y = static_cast<i64>(year) + 4800 - a;
    const i64 m = month + 12 * a - 3;
    return day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
}

} // namespace sunward::astro
