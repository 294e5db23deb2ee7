#pragma once

/// @file ephemeris.hpp
/// @brief J2000 mean elements of the Sol planets (JPL approximate positions, 1800–2050 AD).

#include "astro/kepler_orbit.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace orrery::astro
{
    /// @brief Mean orbital elements at J2000.0. Angles in degrees.
    struct PlanetElements
    {
        std::string_view name;
        f64 semi_major_axis;          ///< a (AU)
        f64 eccentricity;             ///< e
        f64 inclination;              ///< i (deg)
        f64 mean_longitude;           ///< L at J2000 (deg)
        f64 longitude_perihelion;     ///< ϖ = Ω + ω (deg)
        f64 longitude_ascending_node; ///< Ω (deg)
        f64 mean_longitude_rate;      ///< dL/dT (deg per Julian century)
        f64 period_days;              ///< Sidereal period
        f64 mass_earth;
        f64 radius_earth;
    };

    /// @brief Static lookup of planetary mean elements.
    class Ephemeris
    {
    public:
        Ephemeris() = delete;

        /// @brief All eight planets, Mercury first.
        [[nodiscard]] static std::span<const PlanetElements> planets();

        /// @brief Case-insensitive lookup by planet name.
        /// @return nullptr if the name is unknown.
        [[nodiscard]] static const PlanetElements* find(std::string_view name);

        /// @brief Mean anomaly in degrees, normalized to [0, 360).
        ///
        /// M = L + L'·T − ϖ, with T in Julian centuries since J2000.
        [[nodiscard]] static f64 mean_anomaly_deg(const PlanetElements& planet, f64 jd);

        /// @brief Mean anomaly for a named planet, or std::nullopt if unknown.
        [[nodiscard]] static std::optional<f64> mean_anomaly_deg(std::string_view name, f64 jd);

        /// @brief Kepler elements whose epoch (t = 0) is the given Julian Date.
        [[nodiscard]] static KeplerOrbit orbit_at(const PlanetElements& planet, f64 epoch_jd);
    };

} // namespace orrery::astro
