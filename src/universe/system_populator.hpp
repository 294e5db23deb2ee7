#pragma once

/// @file system_populator.hpp
/// @brief Spawns the bodies of a star system from catalog data and procedural fill.

#include "core/types.hpp"
#include "universe/body_registry.hpp"
#include "universe/nearby_stars.hpp"
#include "universe/procedural_system.hpp"
#include "universe/star_system.hpp"

namespace orrery::universe
{
    /// @brief Turns catalog records into registry bodies.
    ///
    /// Order per system: stars (binary pairs on opposite-phase orbits around
    /// a barycenter), confirmed planets, procedural planets filling the gaps,
    /// then asteroid-belt and cometary-cloud members. Every generated body
    /// derives from the populator's seed, so repopulating gives the same bodies.
    class SystemPopulator
    {
    public:
        SystemPopulator(BodyRegistry& registry, u64 seed);

        /// @brief Skip belt/cloud member bodies (the zones are still generated).
        void set_expand_small_bodies(bool expand) { m_expand_small_bodies = expand; }

        /// @brief Spawn every body of a catalog system under the given id.
        /// @return The populated system, Dormant, with body count and bounding radius set.
        [[nodiscard]] StarSystem populate(const CatalogSystem& record, SystemId id);

        /// @brief Spawn Sol, its eight planets and the Moon at their positions for epoch_jd.
        [[nodiscard]] StarSystem populate_sol(SystemId id, f64 epoch_jd);

        [[nodiscard]] u64 seed() const { return m_seed; }

    private:
        BodyId spawn_star(const CatalogStar& star, SystemId system, const astro::SpaceCoordinates& origin);
        void spawn_binary(const CatalogSystem& record, const BinaryOrbit& binary,
                          const std::vector<BodyId>& star_ids, SystemId system,
                          const astro::SpaceCoordinates& origin);
        u32 spawn_catalog_planets(const CatalogStar& star, BodyId host, SystemId system);
        void spawn_procedural(const CatalogStar& star, BodyId host, SystemId system);
        void spawn_small_bodies(const std::vector<SmallBody>& members, BodyKind kind,
                                BodyId host, SystemId system);
        f64 bounding_radius(SystemId system) const;

        BodyRegistry& m_registry;
        u64 m_seed;
        bool m_expand_small_bodies = true;
    };

} // namespace orrery::universe
