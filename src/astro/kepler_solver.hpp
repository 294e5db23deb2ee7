#pragma once

/// @file kepler_solver.hpp
/// @brief Kepler's equation and the anomaly/radius relations of an elliptical orbit.

#include "core/types.hpp"

namespace orrery::astro
{
    /// @brief Static utility class for two-body anomaly computations.
    ///
    /// All angles are in radians. Defined for elliptical orbits, 0 <= e < 1;
    /// results for e >= 1 are unspecified.
    class KeplerSolver
    {
    public:
        KeplerSolver() = delete;

        static constexpr u32 kMaxIterations = 50;
        static constexpr f64 kTolerance = 1e-10;
        static constexpr f64 kCircularThreshold = 1e-10;

        /// @brief Solve E - e·sin(E) = M for the eccentric anomaly.
        ///
        /// Newton-Raphson, stopping when |ΔE| < 1e-10 or after 50 iterations.
        /// For e < 1e-10 returns M unchanged. Otherwise M is first reduced to
        /// [0, 2π) and the result lies in that range too.
        /// @param mean_anomaly M (radians).
        /// @param eccentricity e in [0, 1).
        [[nodiscard]] static f64 solve_kepler(f64 mean_anomaly, f64 eccentricity);

        /// @brief Eccentric anomaly to true anomaly via the half-angle tangent identity.
        /// Returns E unchanged for e < 1e-10.
        [[nodiscard]] static f64 true_anomaly(f64 eccentric_anomaly, f64 eccentricity);

        /// @brief Distance from the focus: a(1 - e²) / (1 + e·cos ν).
        [[nodiscard]] static f64 orbital_radius(f64 semi_major_axis, f64 eccentricity, f64 true_anomaly);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace orrery::astro
