/// @file kepler_orbit.cpp
/// @brief Orbital-plane to parent-frame transform for Keplerian elements.

#include "astro/kepler_orbit.hpp"

#include "astro/kepler_solver.hpp"

#include <cmath>

namespace orrery::astro
{

std::optional<KeplerOrbit> KeplerOrbit::create(f64 eccentricity,
                                               f64 semi_major_axis,
                                               f64 inclination,
                                               f64 longitude_ascending_node,
                                               f64 argument_of_periapsis,
                                               f64 mean_anomaly_at_epoch,
                                               f64 mean_motion)
{
    const KeplerOrbit orbit{
        .eccentricity = eccentricity,
        .semi_major_axis = semi_major_axis,
        .inclination = inclination,
        .longitude_ascending_node = longitude_ascending_node,
        .argument_of_periapsis = argument_of_periapsis,
        .mean_anomaly_at_epoch = mean_anomaly_at_epoch,
        .mean_motion = mean_motion,
    };

    if (!orbit.is_valid())
    {
        return std::nullopt;
    }
    return orbit;
}

KeplerOrbit KeplerOrbit::circular(f64 semi_major_axis, f64 mean_motion)
{
    return KeplerOrbit{
        .eccentricity = 0.0,
        .semi_major_axis = semi_major_axis,
        .mean_motion = mean_motion,
    };
}

f64 KeplerOrbit::mean_motion_from_period(f64 period_seconds)
{
    if (period_seconds <= 0.0)
    {
        return 0.0;
    }
    return astro_constants::kTwoPi / period_seconds;
}

f64 KeplerOrbit::period_from_mean_motion(f64 mean_motion)
{
    if (mean_motion <= 0.0)
    {
        return 0.0;
    }
    return astro_constants::kTwoPi / mean_motion;
}

bool KeplerOrbit::is_valid() const
{
    const bool finite = std::isfinite(eccentricity) && std::isfinite(semi_major_axis)
                     && std::isfinite(inclination) && std::isfinite(longitude_ascending_node)
                     && std::isfinite(argument_of_periapsis) && std::isfinite(mean_anomaly_at_epoch)
                     && std::isfinite(mean_motion);

    return finite
        && eccentricity >= 0.0 && eccentricity < 1.0
        && semi_major_axis > 0.0
        && mean_motion >= 0.0;
}

f64 KeplerOrbit::mean_anomaly_at(f64 elapsed_seconds) const
{
    return mean_anomaly_at_epoch + mean_motion * elapsed_seconds;
}

SpaceCoordinates KeplerOrbit::position_at(f64 elapsed_seconds) const
{
    return position_at_mean_anomaly(mean_anomaly_at(elapsed_seconds));
}

// -----------------------------------------------------------------
// Perifocal → parent frame (rotations by ω, i, Ω)
//
// x_p = x cos ω − y sin ω
// y_p = x sin ω + y cos ω
//
// X = x_p cos Ω − y_p cos i sin Ω
// Y = x_p sin Ω + y_p cos i cos Ω
// Z = y_p sin i
// -----------------------------------------------------------------

SpaceCoordinates KeplerOrbit::position_at_mean_anomaly(f64 mean_anomaly) const
{
    const f64 e_anom = KeplerSolver::solve_kepler(mean_anomaly, eccentricity);
    const f64 nu = KeplerSolver::true_anomaly(e_anom, eccentricity);
    const f64 r = KeplerSolver::orbital_radius(semi_major_axis, eccentricity, nu);

    const f64 x = r * std::cos(nu);
    const f64 y = r * std::sin(nu);

    const f64 cos_w = std::cos(argument_of_periapsis);
    const f64 sin_w = std::sin(argument_of_periapsis);
    const f64 x_p = x * cos_w - y * sin_w;
    const f64 y_p = x * sin_w + y * cos_w;

    const f64 cos_node = std::cos(longitude_ascending_node);
    const f64 sin_node = std::sin(longitude_ascending_node);
    const f64 cos_i = std::cos(inclination);
    const f64 sin_i = std::sin(inclination);

    return SpaceCoordinates{
        x_p * cos_node - y_p * cos_i * sin_node,
        x_p * sin_node + y_p * cos_i * cos_node,
        y_p * sin_i,
    };
}

} // namespace orrery::astro
