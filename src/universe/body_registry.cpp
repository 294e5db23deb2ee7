/// @file body_registry.cpp
/// @brief Body arena and parent-before-child ordering of OrbitCenter links.

#include "universe/body_registry.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace orrery::universe
{

std::string_view to_string(BodyKind kind)
{
    switch (kind)
    {
        case BodyKind::Star:       return "Star";
        case BodyKind::Barycenter: return "Barycenter";
        case BodyKind::Planet:     return "Planet";
        case BodyKind::Moon:       return "Moon";
        case BodyKind::Asteroid:   return "Asteroid";
        case BodyKind::Comet:      return "Comet";
    }
    return "Unknown";
}

BodyId BodyRegistry::add_body(Body body)
{
    const auto id = static_cast<BodyId>(m_bodies.size());
    body.id = id;

    // A link supplied with the body goes through the same checks as set_orbit_center()
    const std::optional<BodyId> requested_center = body.orbit_center;
    body.orbit_center.reset();

    m_bodies.push_back(std::move(body));
    m_order_dirty = true;

    if (requested_center)
    {
        set_orbit_center(id, *requested_center);
    }
    return id;
}

Body* BodyRegistry::find(BodyId id)
{
    if (id >= m_bodies.size())
    {
        return nullptr;
    }
    return &m_bodies[id];
}

const Body* BodyRegistry::find(BodyId id) const
{
    if (id >= m_bodies.size())
    {
        return nullptr;
    }
    return &m_bodies[id];
}

// -----------------------------------------------------------------
// OrbitCenter links
// -----------------------------------------------------------------

bool BodyRegistry::would_cycle(BodyId child, BodyId parent) const
{
    // Walk up from the prospective parent; reaching the child closes a loop
    std::optional<BodyId> cursor = parent;
    while (cursor)
    {
        if (*cursor == child)
        {
            return true;
        }
        cursor = m_bodies[*cursor].orbit_center;
    }
    return false;
}

bool BodyRegistry::set_orbit_center(BodyId child, BodyId parent)
{
    if (child >= m_bodies.size() || parent >= m_bodies.size())
    {
        ORR_CORE_WARN("BodyRegistry: OrbitCenter link {} -> {} references an unknown body", child, parent);
        return false;
    }
    if (would_cycle(child, parent))
    {
        ORR_CORE_WARN("BodyRegistry: OrbitCenter link '{}' -> '{}' would form a cycle",
                      m_bodies[child].name, m_bodies[parent].name);
        return false;
    }

    m_bodies[child].orbit_center = parent;
    m_order_dirty = true;
    return true;
}

void BodyRegistry::clear_orbit_center(BodyId child)
{
    if (child < m_bodies.size())
    {
        m_bodies[child].orbit_center.reset();
        m_order_dirty = true;
    }
}

u32 BodyRegistry::depth(BodyId id) const
{
    u32 hops = 0;
    std::optional<BodyId> cursor = (id < m_bodies.size()) ? m_bodies[id].orbit_center : std::nullopt;
    while (cursor)
    {
        ++hops;
        cursor = m_bodies[*cursor].orbit_center;
    }
    return hops;
}

// -----------------------------------------------------------------
// Topological order: stable sort by depth puts parents first
// -----------------------------------------------------------------

const std::vector<BodyId>& BodyRegistry::propagation_order()
{
    if (!m_order_dirty)
    {
        return m_order;
    }

    std::vector<u32> depths(m_bodies.size());
    m_order.resize(m_bodies.size());
    for (BodyId id = 0; id < m_bodies.size(); ++id)
    {
        m_order[id] = id;
        depths[id] = depth(id);
    }

    std::stable_sort(m_order.begin(), m_order.end(),
                     [&depths](BodyId a, BodyId b) { return depths[a] < depths[b]; });

    m_order_dirty = false;
    return m_order;
}

std::vector<BodyId> BodyRegistry::bodies_in_system(SystemId system) const
{
    std::vector<BodyId> result;
    for (const auto& body : m_bodies)
    {
        if (body.system == system)
        {
            result.push_back(body.id);
        }
    }
    return result;
}

u32 BodyRegistry::count_in_system(SystemId system) const
{
    return static_cast<u32>(std::count_if(m_bodies.begin(), m_bodies.end(),
        [system](const Body& body) { return body.system == system; }));
}

} // namespace orrery::universe
