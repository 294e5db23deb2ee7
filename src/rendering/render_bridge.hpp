#pragma once

/// @file render_bridge.hpp
/// @brief Double-precision simulation space to single-precision render space.

#include "astro/kepler_orbit.hpp"
#include "astro/space_coordinates.hpp"
#include "core/types.hpp"
#include "rendering/orbit_path.hpp"
#include "universe/body_registry.hpp"
#include "universe/star_system.hpp"

#include <optional>
#include <vector>

namespace orrery::rendering
{
    /// @brief Shared render-frame origin, in AU.
    ///
    /// Re-centering is only requested here; the owner applies it between
    /// ticks so that no propagation or render pass sees a half-updated frame.
    class FloatingOrigin
    {
    public:
        [[nodiscard]] const astro::SpaceCoordinates& origin() const { return m_origin; }
        [[nodiscard]] bool has_pending() const { return m_pending.has_value(); }

        /// @brief Queue a new origin. A later request before apply_pending() replaces it.
        void request_recenter(const astro::SpaceCoordinates& new_origin) { m_pending = new_origin; }

        /// @brief Commit the queued origin.
        /// @return true if the origin changed.
        bool apply_pending();

    private:
        astro::SpaceCoordinates m_origin{0.0};
        std::optional<astro::SpaceCoordinates> m_pending;
    };

    /// @brief One body's render-space position for this frame.
    struct RenderInstance
    {
        universe::BodyId body;
        Vec3f position;
    };

    /// @brief Static utility class for true → render conversions.
    class RenderBridge
    {
    public:
        RenderBridge() = delete;

        /// @brief f32((true − origin) × scale). The subtraction happens in f64.
        [[nodiscard]] static Vec3f render_position(const astro::SpaceCoordinates& true_position,
                                                   const astro::SpaceCoordinates& origin,
                                                   f64 scale = astro::kDefaultRenderScale);

        /// @brief Closed line strip of segments + 1 points, uniform in mean anomaly.
        ///
        /// Each sample runs the full Kepler pipeline, so eccentric orbits get
        /// denser points near periapsis. Empty when the path is not visible.
        [[nodiscard]] static std::vector<Vec3f> build_orbit_polyline(const astro::KeplerOrbit& orbit,
                                                                     const OrbitPath& path,
                                                                     const astro::SpaceCoordinates& parent_position,
                                                                     const astro::SpaceCoordinates& origin,
                                                                     f64 scale = astro::kDefaultRenderScale);

        /// @brief Polyline for a registry body around its orbit center's current position.
        /// Empty for unknown bodies, bodies without an orbit, or hidden paths.
        [[nodiscard]] static std::vector<Vec3f> build_orbit_polyline(const universe::BodyRegistry& registry,
                                                                     universe::BodyId id,
                                                                     const astro::SpaceCoordinates& origin,
                                                                     f64 scale = astro::kDefaultRenderScale);

        /// @brief Render positions of every body in one system.
        [[nodiscard]] static std::vector<RenderInstance> collect_instances(const universe::BodyRegistry& registry,
                                                                           universe::SystemId system,
                                                                           const astro::SpaceCoordinates& origin,
                                                                           f64 scale = astro::kDefaultRenderScale);
    };

} // namespace orrery::rendering
