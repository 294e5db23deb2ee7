/// @file kepler_solver.cpp
/// @brief Newton-Raphson Kepler solver and anomaly conversions.

#include "astro/kepler_solver.hpp"

#include <cmath>

namespace orrery::astro
{

// -----------------------------------------------------------------
// Kepler's equation
//
// f(E)  = E − e sin E − M
// f'(E) = 1 − e cos E
// E ← E − f(E) / f'(E)
//
// Start from E₀ = M, or E₀ = π for e > 0.8 where the iteration
// from M overshoots for small M.
// -----------------------------------------------------------------

f64 KeplerSolver::solve_kepler(f64 mean_anomaly, f64 eccentricity)
{
    if (eccentricity < kCircularThreshold)
    {
        return mean_anomaly;
    }

    const f64 m = normalize_radians(mean_anomaly);
    f64 e_anom = (eccentricity > 0.8) ? astro_constants::kPi : m;

    for (u32 i = 0; i < kMaxIterations; ++i)
    {
        const f64 f = e_anom - eccentricity * std::sin(e_anom) - m;
        const f64 f_prime = 1.0 - eccentricity * std::cos(e_anom);
        const f64 delta = f / f_prime;
        e_anom -= delta;

        if (std::abs(delta) < kTolerance)
        {
            break;
        }
    }

    return e_anom;
}

// -----------------------------------------------------------------
// True anomaly
//
// tan(ν/2) = √((1 + e) / (1 − e)) · tan(E/2)
// -----------------------------------------------------------------

f64 KeplerSolver::true_anomaly(f64 eccentric_anomaly, f64 eccentricity)
{
    if (eccentricity < kCircularThreshold)
    {
        return eccentric_anomaly;
    }

    const f64 factor = std::sqrt((1.0 + eccentricity) / (1.0 - eccentricity));
    return 2.0 * std::atan(factor * std::tan(eccentric_anomaly / 2.0));
}

// -----------------------------------------------------------------
// Orbital radius (conic equation)
// -----------------------------------------------------------------

f64 KeplerSolver::orbital_radius(f64 semi_major_axis, f64 eccentricity, f64 true_anomaly)
{
    return semi_major_axis * (1.0 - eccentricity * eccentricity)
         / (1.0 + eccentricity * std::cos(true_anomaly));
}

f64 KeplerSolver::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace orrery::astro
