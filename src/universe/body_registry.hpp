#pragma once

/// @file body_registry.hpp
/// @brief Arena of simulated bodies with optional orbit, orbit-center and path fields.

#include "astro/kepler_orbit.hpp"
#include "astro/space_coordinates.hpp"
#include "core/types.hpp"
#include "rendering/orbit_path.hpp"
#include "universe/star_system.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::universe
{
    using BodyId = u32;

    enum class BodyKind : u8
    {
        Star,
        Barycenter,
        Planet,
        Moon,
        Asteroid,
        Comet,
    };

    [[nodiscard]] std::string_view to_string(BodyKind kind);

    /// @brief A simulated body. Optional fields mark which components it carries.
    struct Body
    {
        BodyId id = 0;
        std::string name;
        BodyKind kind = BodyKind::Planet;
        SystemId system = 0;
        f64 mass_kg = 0.0;
        f64 radius_km = 0.0;
        bool is_real = false;                        ///< From a catalog rather than generated

        astro::SpaceCoordinates position{0.0};      ///< Shared frame (AU)
        std::optional<astro::KeplerOrbit> orbit;
        std::optional<BodyId> orbit_center;          ///< Body whose position is this orbit's focus
        std::optional<rendering::OrbitPath> orbit_path;
    };

    /// @brief Owns every body; ids are stable indices into the arena.
    ///
    /// OrbitCenter links form a forest: links to unknown bodies, to the body
    /// itself, or that would close a cycle are rejected when created.
    class BodyRegistry
    {
    public:
        /// @brief Store a body and assign its id (the incoming id is ignored).
        BodyId add_body(Body body);

        [[nodiscard]] Body* find(BodyId id);
        [[nodiscard]] const Body* find(BodyId id) const;

        /// @brief Link child → parent.
        /// @return false (and no change) for unknown ids, self links or cycles.
        bool set_orbit_center(BodyId child, BodyId parent);

        void clear_orbit_center(BodyId child);

        /// @brief Ids ordered so that every parent precedes its children.
        [[nodiscard]] const std::vector<BodyId>& propagation_order();

        [[nodiscard]] std::vector<BodyId> bodies_in_system(SystemId system) const;
        [[nodiscard]] u32 count_in_system(SystemId system) const;

        /// @brief Number of OrbitCenter hops from the body to its root.
        [[nodiscard]] u32 depth(BodyId id) const;

        [[nodiscard]] std::span<Body> bodies() { return m_bodies; }
        [[nodiscard]] std::span<const Body> bodies() const { return m_bodies; }
        [[nodiscard]] std::size_t size() const { return m_bodies.size(); }

    private:
        [[nodiscard]] bool would_cycle(BodyId child, BodyId parent) const;

        std::vector<Body> m_bodies;
        std::vector<BodyId> m_order;
        bool m_order_dirty = true;
    };

} // namespace orrery::universe
