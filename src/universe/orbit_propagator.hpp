#pragma once

/// @file orbit_propagator.hpp
/// @brief Stateless Keplerian propagation of registry bodies, composed through OrbitCenter.

#include "astro/space_coordinates.hpp"
#include "universe/body_registry.hpp"
#include "universe/star_system.hpp"

#include <optional>

namespace orrery::universe
{
    /// @brief Recomputes body positions as a pure function of elapsed simulated time.
    ///
    /// position = orbit.position_at(t) + position of the orbit center.
    /// Bodies without elements keep their stored position. Repeated calls
    /// with the same t always give the same result.
    class OrbitPropagator
    {
    public:
        OrbitPropagator() = delete;

        /// @brief Propagate one body, resolving its parent chain at the same t.
        ///
        /// The body's stored position is updated, as are those of its ancestors.
        /// @return std::nullopt if the id is unknown or the body has no orbit.
        static std::optional<astro::SpaceCoordinates> propagate(BodyRegistry& registry,
                                                                BodyId id,
                                                                f64 elapsed_seconds);

        /// @brief Propagate every body with elements, parents before children.
        /// @return Number of bodies updated.
        static u32 propagate_all(BodyRegistry& registry, f64 elapsed_seconds);

        /// @brief Propagate the bodies of one star system only.
        /// @return Number of bodies updated.
        static u32 propagate_system(BodyRegistry& registry, SystemId system, f64 elapsed_seconds);

    private:
        static void update_body(BodyRegistry& registry, Body& body, f64 elapsed_seconds);
    };

} // namespace orrery::universe
