#pragma once

/// @file space_coordinates.hpp
/// @brief Double-precision simulation coordinates and unit conversions.

#include "core/types.hpp"

namespace orrery::astro
{
    /// @brief True position in AU, in the shared universe frame.
    ///
    /// Sol sits at the origin; other systems are placed at their galactic
    /// offset converted to AU. Never narrowed to f32 outside the render bridge.
    using SpaceCoordinates = Vec3d;

    /// @brief Render units per AU (1 AU = 100 render units).
    constexpr f64 kDefaultRenderScale = 100.0;

    /// @brief Light-years to AU.
    [[nodiscard]] constexpr f64 light_years_to_au(f64 ly)
    {
        return ly * astro_constants::kAuPerLightYear;
    }

    /// @brief AU to light-years.
    [[nodiscard]] constexpr f64 au_to_light_years(f64 au)
    {
        return au / astro_constants::kAuPerLightYear;
    }

    /// @brief Galactic position (ly) to shared-frame coordinates (AU).
    [[nodiscard]] inline SpaceCoordinates galactic_to_space(const Vec3d& position_ly)
    {
        return position_ly * astro_constants::kAuPerLightYear;
    }

    /// @brief Cartesian position (ly) from J2000 equatorial RA/Dec (degrees) and distance.
    ///
    /// x points to RA 0h on the equator, z to the north celestial pole.
    [[nodiscard]] Vec3d equatorial_to_cartesian(f64 ra_deg, f64 dec_deg, f64 distance_ly);

} // namespace orrery::astro
