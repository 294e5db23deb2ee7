/// @file time_system.cpp
/// @brief Julian Date conversions and the simulation clock.

#include "astro/time_system.hpp"

#include <algorithm>
#include <cmath>

namespace orrery::astro
{

namespace
{
    // First day of the Gregorian calendar (1582-10-15) as a Julian Day Number
    constexpr i32 kGregorianReformJdn = 2299161;
}

// -----------------------------------------------------------------
// Civil date → Julian Date (Meeus, Astronomical Algorithms Ch. 7)
//
// JD = ⌊365.25 (Y + 4716)⌋ + ⌊30.6001 (M + 1)⌋ + D + B − 1524.5
// B  = 2 − ⌊Y/100⌋ + ⌊⌊Y/100⌋/4⌋
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    // The year starts in March so the leap day is the last day of the year
    const bool before_march = dt.month <= 2;
    const i32 year = before_march ? dt.year - 1 : dt.year;
    const i32 month = before_march ? dt.month + 12 : dt.month;

    const i32 century = year / 100;
    const i32 gregorian_shift = 2 - century + century / 4;

    const f64 seconds_of_day = static_cast<f64>(dt.hour) * 3600.0
                             + static_cast<f64>(dt.minute) * 60.0
                             + dt.second;

    return std::floor(365.25 * static_cast<f64>(year + 4716))
         + std::floor(30.6001 * static_cast<f64>(month + 1))
         + static_cast<f64>(dt.day + gregorian_shift)
         - 1524.5
         + seconds_of_day / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Julian Date → civil date (inverse of the above, Meeus Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Julian days start at noon; civil days at midnight
    f64 day_number = 0.0;
    const f64 day_fraction = std::modf(jd + 0.5, &day_number);
    const auto z = static_cast<i32>(day_number);

    i32 shifted = z;
    if (z >= kGregorianReformJdn)
    {
        const auto alpha = static_cast<i32>(std::floor((static_cast<f64>(z) - 1867216.25) / 36524.25));
        shifted += 1 + alpha - alpha / 4;
    }

    const i32 b = shifted + 1524;
    const auto c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 day_of_cycle = b - static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const auto e = static_cast<i32>(std::floor(static_cast<f64>(day_of_cycle) / 30.6001));

    const i32 month = (e < 14) ? e - 1 : e - 13;

    f64 seconds = day_fraction * astro_constants::kSecondsPerDay;
    const auto hour = static_cast<i32>(seconds / 3600.0);
    seconds -= static_cast<f64>(hour) * 3600.0;
    const auto minute = static_cast<i32>(seconds / 60.0);
    seconds -= static_cast<f64>(minute) * 60.0;

    return DateTime{
        .year   = (month > 2) ? c - 4716 : c - 4715,
        .month  = month,
        .day    = day_of_cycle - static_cast<i32>(std::floor(30.6001 * static_cast<f64>(e))),
        .hour   = hour,
        .minute = minute,
        .second = seconds,
    };
}

// -----------------------------------------------------------------
// Epoch offsets
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

f64 TimeSystem::days_since_j2000(f64 jd)
{
    return jd - astro_constants::kJ2000;
}

f64 TimeSystem::unix_seconds_to_jd(i64 unix_seconds)
{
    return kUnixEpochJd + static_cast<f64>(unix_seconds) / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// SimulationClock
// -----------------------------------------------------------------

SimulationClock::SimulationClock()
    : m_start_jd(TimeSystem::unix_seconds_to_jd(kDefaultStartUnixSeconds))
{
}

SimulationClock::SimulationClock(f64 start_jd)
    : m_start_jd(start_jd)
{
}

void SimulationClock::advance(f64 wall_dt)
{
    if (m_paused || !std::isfinite(wall_dt) || wall_dt <= 0.0)
    {
        return;
    }
    m_elapsed += wall_dt * m_time_scale;
}

void SimulationClock::set_elapsed(f64 elapsed_seconds)
{
    if (std::isfinite(elapsed_seconds))
    {
        m_elapsed = elapsed_seconds;
    }
}

void SimulationClock::set_time_scale(f64 scale)
{
    if (!std::isfinite(scale))
    {
        return;
    }
    m_time_scale = std::clamp(scale, kMinTimeScale, kMaxTimeScale);
}

f64 SimulationClock::current_jd() const
{
    return m_start_jd + m_elapsed / astro_constants::kSecondsPerDay;
}

DateTime SimulationClock::current_date() const
{
    return TimeSystem::from_julian_date(current_jd());
}

} // namespace orrery::astro
