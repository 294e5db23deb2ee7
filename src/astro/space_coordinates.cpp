/// @file space_coordinates.cpp
/// @brief Equatorial to Cartesian conversion for star-system placement.

#include "astro/space_coordinates.hpp"

#include <cmath>

namespace orrery::astro
{

// -----------------------------------------------------------------
// Spherical (RA, Dec, d) → Cartesian
//
// x = d cos δ cos α
// y = d cos δ sin α
// z = d sin δ
// -----------------------------------------------------------------

Vec3d equatorial_to_cartesian(f64 ra_deg, f64 dec_deg, f64 distance_ly)
{
    const f64 ra  = ra_deg * astro_constants::kDegToRad;
    const f64 dec = dec_deg * astro_constants::kDegToRad;
    const f64 cos_dec = std::cos(dec);

    return Vec3d{
        distance_ly * cos_dec * std::cos(ra),
        distance_ly * cos_dec * std::sin(ra),
        distance_ly * std::sin(dec),
    };
}

} // namespace orrery::astro
