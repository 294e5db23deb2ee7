#pragma once

/// @file time_system.hpp
/// @brief Calendar conversions and the virtual simulation clock.

#include "core/types.hpp"

namespace orrery::astro
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

    /// @brief Static utility class for calendar computations.
    ///
    /// Julian Date conversion follows Meeus, Astronomical Algorithms Ch. 7.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// Unix epoch (1970-01-01 00:00 UTC) as Julian Date.
        static constexpr f64 kUnixEpochJd = 2440587.5;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Days elapsed since J2000.0.
        [[nodiscard]] static f64 days_since_j2000(f64 jd);

        [[nodiscard]] static f64 unix_seconds_to_jd(i64 unix_seconds);
    };

    /// @brief Virtual simulated time: elapsed seconds, scale and pause.
    ///
    /// The only time input of the propagator is elapsed(). Wall-clock
    /// deltas enter exclusively through advance(), scaled by the time
    /// scale, so pausing, fast-forwarding and scrubbing stay deterministic.
    class SimulationClock
    {
    public:
        static constexpr f64 kMinTimeScale = 0.1;
        static constexpr f64 kMaxTimeScale = 1000.0;

        /// 2026-01-01 00:00:00 UTC
        static constexpr i64 kDefaultStartUnixSeconds = 1767225600;

        SimulationClock();
        explicit SimulationClock(f64 start_jd);

        /// @brief Advance by a wall-clock delta (seconds) times the time scale.
        /// Ignored while paused and for negative or non-finite deltas.
        void advance(f64 wall_dt);

        /// @brief Jump to an absolute elapsed time (scrubbing, save/load).
        void set_elapsed(f64 elapsed_seconds);

        /// @brief Set the time scale, clamped to [0.1, 1000].
        void set_time_scale(f64 scale);

        void set_paused(bool paused) { m_paused = paused; }
        void toggle_pause() { m_paused = !m_paused; }

        [[nodiscard]] f64 elapsed() const { return m_elapsed; }
        [[nodiscard]] f64 time_scale() const { return m_time_scale; }
        [[nodiscard]] bool is_paused() const { return m_paused; }
        [[nodiscard]] f64 start_jd() const { return m_start_jd; }

        /// @brief Julian Date of the current simulated instant.
        [[nodiscard]] f64 current_jd() const;

        /// @brief Civil date of the current simulated instant.
        [[nodiscard]] DateTime current_date() const;

    private:
        f64 m_start_jd;
        f64 m_elapsed = 0.0;
        f64 m_time_scale = 1.0;
        bool m_paused = false;
    };

} // namespace orrery::astro
