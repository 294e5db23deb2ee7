/// @file render_bridge.cpp
/// @brief Floating-origin conversion and orbit polyline sampling.

#include "rendering/render_bridge.hpp"

#include "core/logger.hpp"

namespace orrery::rendering
{

bool FloatingOrigin::apply_pending()
{
    if (!m_pending)
    {
        return false;
    }

    const bool changed = (*m_pending != m_origin);
    if (changed)
    {
        ORR_CORE_DEBUG("FloatingOrigin: re-centered to ({:.3f}, {:.3f}, {:.3f}) AU",
                       m_pending->x, m_pending->y, m_pending->z);
    }
    m_origin = *m_pending;
    m_pending.reset();
    return changed;
}

Vec3f RenderBridge::render_position(const astro::SpaceCoordinates& true_position,
                                    const astro::SpaceCoordinates& origin,
                                    f64 scale)
{
    const Vec3d relative = (true_position - origin) * scale;
    return Vec3f{
        static_cast<f32>(relative.x),
        static_cast<f32>(relative.y),
        static_cast<f32>(relative.z),
    };
}

// -----------------------------------------------------------------
// Orbit polyline
//
// M_k = 2π k / N,  k = 0..N   (N + 1 points, last closes the loop)
// -----------------------------------------------------------------

std::vector<Vec3f> RenderBridge::build_orbit_polyline(const astro::KeplerOrbit& orbit,
                                                      const OrbitPath& path,
                                                      const astro::SpaceCoordinates& parent_position,
                                                      const astro::SpaceCoordinates& origin,
                                                      f64 scale)
{
    std::vector<Vec3f> points;
    if (!path.visible || path.segments == 0)
    {
        return points;
    }

    points.reserve(path.segments + 1);
    for (u32 k = 0; k <= path.segments; ++k)
    {
        const f64 mean_anomaly = astro_constants::kTwoPi * static_cast<f64>(k) / static_cast<f64>(path.segments);
        const astro::SpaceCoordinates local = orbit.position_at_mean_anomaly(mean_anomaly);
        points.push_back(render_position(parent_position + local, origin, scale));
    }
    return points;
}

std::vector<Vec3f> RenderBridge::build_orbit_polyline(const universe::BodyRegistry& registry,
                                                      universe::BodyId id,
                                                      const astro::SpaceCoordinates& origin,
                                                      f64 scale)
{
    const universe::Body* body = registry.find(id);
    if (body == nullptr || !body->orbit)
    {
        return {};
    }

    astro::SpaceCoordinates parent_position{0.0};
    if (body->orbit_center)
    {
        if (const universe::Body* parent = registry.find(*body->orbit_center))
        {
            parent_position = parent->position;
        }
    }

    const OrbitPath path = body->orbit_path.value_or(OrbitPath{});
    return build_orbit_polyline(*body->orbit, path, parent_position, origin, scale);
}

std::vector<RenderInstance> RenderBridge::collect_instances(const universe::BodyRegistry& registry,
                                                            universe::SystemId system,
                                                            const astro::SpaceCoordinates& origin,
                                                            f64 scale)
{
    std::vector<RenderInstance> instances;
    for (const auto& body : registry.bodies())
    {
        if (body.system == system)
        {
            instances.push_back(RenderInstance{
                .body = body.id,
                .position = render_position(body.position, origin, scale),
            });
        }
    }
    return instances;
}

} // namespace orrery::rendering
