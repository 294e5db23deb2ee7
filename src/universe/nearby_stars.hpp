#pragma once

/// @file nearby_stars.hpp
/// @brief Catalog records for real nearby star systems and their confirmed planets.

#include "core/types.hpp"
#include "universe/procedural_system.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::universe
{
    enum class CatalogPlanetType : u8
    {
        Rocky,
        SuperEarth,
        NeptuneLike,
        GasGiant,
        Unknown,
    };

    /// @brief A confirmed exoplanet as published. Mass and radius may be missing.
    struct CatalogPlanet
    {
        std::string name;
        std::optional<f64> mass_earth;
        std::optional<f64> radius_earth;
        f64 period_days = 0.0;
        f64 semi_major_axis_au = 0.0;
        f64 eccentricity = 0.0;
        CatalogPlanetType type = CatalogPlanetType::Unknown;

        /// @brief Published mass, else an empirical mass-radius estimate.
        ///
        /// Rocky M = R^3.7, Neptune-like M = R^2.5, other M = R^3;
        /// gas giant radii carry no mass information (≈ 300 M⊕ default).
        [[nodiscard]] f64 estimated_mass_earth() const;

        /// @brief Published radius, else the inverse relation of estimated_mass_earth().
        /// Gas giants saturate at ≈ 11.2 R⊕ across the Jovian mass range.
        [[nodiscard]] f64 estimated_radius_earth() const;

        /// @brief Closest procedural planet class, used for presentation.
        [[nodiscard]] PlanetType planet_type() const;
    };

    struct CatalogStar
    {
        std::string name;
        std::string spectral_type;
        f64 mass_solar = 1.0;
        f64 radius_solar = 1.0;
        f64 temperature_k = 5772.0;
        f64 luminosity_solar = 1.0;
        std::vector<CatalogPlanet> planets;
    };

    /// @brief Mutual orbit of two stars of the same system. Angles in degrees.
    struct BinaryOrbit
    {
        std::string label;
        u32 primary = 0;                    ///< Index into CatalogSystem::stars
        u32 secondary = 1;
        f64 semi_major_axis_au = 0.0;       ///< Separation ellipse (relative orbit)
        f64 period_years = 0.0;
        f64 eccentricity = 0.0;
        f64 inclination_deg = 0.0;
        f64 arg_periastron_deg = 0.0;
    };

    struct CatalogSystem
    {
        std::string name;
        f64 distance_ly = 0.0;
        f64 ra_deg = 0.0;
        f64 dec_deg = 0.0;
        std::vector<CatalogStar> stars;
        std::vector<BinaryOrbit> binaries;

        /// @brief Galactic position relative to Sol (light-years).
        [[nodiscard]] Vec3d position_ly() const;
    };

    /// @brief In-memory table of real star systems.
    class NearbyStarCatalog
    {
    public:
        void add_system(CatalogSystem system);

        /// @brief Case-insensitive lookup by system name or by the name of any of its stars.
        /// @return nullptr when nothing matches.
        [[nodiscard]] const CatalogSystem* find_by_name(std::string_view name) const;

        [[nodiscard]] std::span<const CatalogSystem> systems() const { return m_systems; }
        [[nodiscard]] std::size_t size() const { return m_systems.size(); }

        /// @brief Well-studied systems within 12 light-years.
        [[nodiscard]] static NearbyStarCatalog load_builtin();

    private:
        std::vector<CatalogSystem> m_systems;
    };

} // namespace orrery::universe
