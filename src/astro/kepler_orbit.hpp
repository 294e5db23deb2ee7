#pragma once

/// @file kepler_orbit.hpp
/// @brief Keplerian orbital elements and their parent-relative position at a given time.

#include "astro/space_coordinates.hpp"
#include "core/types.hpp"

#include <optional>

namespace orrery::astro
{
    /// @brief Classical orbital elements of a fixed ellipse.
    ///
    /// Angles in radians, distances in AU, mean motion in rad/s.
    /// Elements never change after the body is spawned; only the phase
    /// along the ellipse advances with simulated time.
    struct KeplerOrbit
    {
        f64 eccentricity = 0.0;             ///< e, [0, 1)
        f64 semi_major_axis = 1.0;          ///< a (AU), > 0
        f64 inclination = 0.0;              ///< i
        f64 longitude_ascending_node = 0.0; ///< Ω
        f64 argument_of_periapsis = 0.0;    ///< ω
        f64 mean_anomaly_at_epoch = 0.0;    ///< M₀
        f64 mean_motion = 0.0;              ///< n = 2π / period, >= 0

        /// @brief Validated construction.
        /// @return std::nullopt when e is outside [0, 1), a <= 0, n < 0,
        ///         or any element is not finite.
        [[nodiscard]] static std::optional<KeplerOrbit> create(f64 eccentricity,
                                                               f64 semi_major_axis,
                                                               f64 inclination,
                                                               f64 longitude_ascending_node,
                                                               f64 argument_of_periapsis,
                                                               f64 mean_anomaly_at_epoch,
                                                               f64 mean_motion);

        /// @brief Circular, equatorial orbit starting at periapsis.
        [[nodiscard]] static KeplerOrbit circular(f64 semi_major_axis, f64 mean_motion);

        /// @brief n = 2π / period. Returns 0 for non-positive periods.
        [[nodiscard]] static f64 mean_motion_from_period(f64 period_seconds);

        /// @brief period = 2π / n. Returns 0 for non-positive mean motion.
        [[nodiscard]] static f64 period_from_mean_motion(f64 mean_motion);

        /// @brief True when the elements describe a closed ellipse this module supports.
        [[nodiscard]] bool is_valid() const;

        /// @brief M = M₀ + n·t (not reduced).
        [[nodiscard]] f64 mean_anomaly_at(f64 elapsed_seconds) const;

        /// @brief Position relative to the orbit's focus (AU) at simulated time t.
        [[nodiscard]] SpaceCoordinates position_at(f64 elapsed_seconds) const;

        /// @brief Position relative to the focus for a given mean anomaly.
        [[nodiscard]] SpaceCoordinates position_at_mean_anomaly(f64 mean_anomaly) const;

        [[nodiscard]] f64 period_seconds() const { return period_from_mean_motion(mean_motion); }
        [[nodiscard]] f64 periapsis() const { return semi_major_axis * (1.0 - eccentricity); }
        [[nodiscard]] f64 apoapsis() const { return semi_major_axis * (1.0 + eccentricity); }
    };

} // namespace orrery::astro
