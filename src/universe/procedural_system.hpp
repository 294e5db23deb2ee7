#pragma once

/// @file procedural_system.hpp
/// @brief Frost-line based synthesis of planets, asteroid belts and cometary clouds.
///
/// Fills the gaps around stars whose catalog data is incomplete without
/// disturbing orbits already known to be real. Every call is a pure function
/// of its inputs and seed.

#include "astro/kepler_orbit.hpp"
#include "core/types.hpp"
#include "universe/star_system.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::universe
{
    enum class PlanetType : u8
    {
        Rocky,
        IceGiant,
        GasGiant,
    };

    [[nodiscard]] std::string_view to_string(PlanetType type);

    /// @brief A synthesized planet with full orbital elements. Angles in radians.
    struct ProceduralPlanet
    {
        std::string name;
        f64 semi_major_axis;           ///< AU
        f64 eccentricity;
        f64 inclination;
        f64 longitude_ascending_node;
        f64 argument_of_periapsis;
        f64 mean_anomaly_at_epoch;
        f64 period_days;
        f64 mass_earth;
        f64 radius_earth;
        PlanetType type;

        [[nodiscard]] astro::KeplerOrbit to_kepler_orbit() const;
        [[nodiscard]] f64 mass_kg() const;
        [[nodiscard]] f64 radius_km() const;
    };

    /// @brief Annular zone of small bodies (asteroid belt or cometary cloud).
    struct DebrisZone
    {
        f64 inner_au;
        f64 outer_au;
        u32 count;
        f64 inclination;    ///< Mean inclination (belt) or spread (cloud), radians
    };

    /// @brief Generated layout of one star's system.
    struct SystemArchitecture
    {
        f64 frost_line_au = 0.0;
        std::vector<ProceduralPlanet> rocky_planets;
        std::vector<ProceduralPlanet> giants;
        std::optional<DebrisZone> asteroid_belt;
        std::optional<DebrisZone> cometary_cloud;

        [[nodiscard]] std::size_t planet_count() const { return rocky_planets.size() + giants.size(); }
    };

    enum class AsteroidClass : u8
    {
        S,  ///< Silicaceous
        M,  ///< Metallic
        V,  ///< Basaltic (Vesta family)
    };

    /// @brief One expanded belt or cloud member, ready to spawn as a body.
    struct SmallBody
    {
        std::string name;
        astro::KeplerOrbit orbit;
        f64 radius_km;
        f64 mass_kg;
        std::optional<AsteroidClass> asteroid_class;   ///< Unset for comets
    };

    /// @brief Static utility class for procedural system generation.
    class ProceduralSystemGenerator
    {
    public:
        ProceduralSystemGenerator() = delete;

        static constexpr u32 kTargetPlanetCount = 5;
        static constexpr f64 kFrostLineCoefficient = 4.85;     ///< AU at one solar luminosity
        static constexpr f64 kRockySeparationAu = 0.1;
        static constexpr f64 kGiantSeparationAu = 0.5;
        static constexpr f64 kBeltProbability = 0.8;
        static constexpr f64 kCloudProbability = 0.7;
        static constexpr f64 kCloudMaxInclination = astro_constants::kPi / 3.0;

        /// @brief d_frost = 4.85 √L AU. Non-positive luminosity gives 0.
        [[nodiscard]] static f64 calculate_frost_line(f64 luminosity_solar);

        /// @brief Synthesize the missing planets, belt and cloud for a star.
        ///
        /// @param star_name Names planets ("<star> b", ...) and salts the seed.
        /// @param luminosity_solar Stellar luminosity (L☉).
        /// @param existing_count Number of planets already known for this star.
        /// @param existing_orbits_au Semi-major axes of known planets (AU).
        /// @param seed Global seed; same inputs always give the same output.
        /// @param existing_names Names of known planets; generated names skip them.
        [[nodiscard]] static SystemArchitecture generate_architecture(std::string_view star_name,
                                                                      f64 luminosity_solar,
                                                                      u32 existing_count,
                                                                      std::span<const f64> existing_orbits_au,
                                                                      u64 seed,
                                                                      std::span<const std::string> existing_names = {});

        /// @brief Concrete asteroids for a belt.
        /// Seeded from (seed, system, belt parameters) so members do not depend
        /// on generation order.
        [[nodiscard]] static std::vector<SmallBody> expand_asteroid_belt(const DebrisZone& belt,
                                                                         std::string_view star_name,
                                                                         SystemId system,
                                                                         u64 seed);

        /// @brief Concrete comets for a cometary cloud.
        [[nodiscard]] static std::vector<SmallBody> expand_cometary_cloud(const DebrisZone& cloud,
                                                                          std::string_view star_name,
                                                                          SystemId system,
                                                                          u64 seed);

        /// @brief Kepler's third law for a solar-mass primary: T = a^1.5 years, in days.
        [[nodiscard]] static f64 period_days_from_axis(f64 semi_major_axis_au);
    };

} // namespace orrery::universe
