/// @file orbit_propagator.cpp
/// @brief Propagation passes over the body registry.

#include "universe/orbit_propagator.hpp"

#include "core/logger.hpp"

#include <vector>

namespace orrery::universe
{

void OrbitPropagator::update_body(BodyRegistry& registry, Body& body, f64 elapsed_seconds)
{
    astro::SpaceCoordinates position = body.orbit->position_at(elapsed_seconds);

    if (body.orbit_center)
    {
        if (const Body* parent = registry.find(*body.orbit_center))
        {
            position += parent->position;
        }
    }
    body.position = position;
}

std::optional<astro::SpaceCoordinates> OrbitPropagator::propagate(BodyRegistry& registry,
                                                                  BodyId id,
                                                                  f64 elapsed_seconds)
{
    Body* body = registry.find(id);
    if (body == nullptr)
    {
        ORR_CORE_WARN("OrbitPropagator: Unknown body id {}", id);
        return std::nullopt;
    }
    if (!body->orbit)
    {
        return std::nullopt;
    }

    // Ancestors, nearest first; acyclic by construction
    std::vector<BodyId> chain;
    for (std::optional<BodyId> cursor = body->orbit_center; cursor; )
    {
        chain.push_back(*cursor);
        cursor = registry.find(*cursor)->orbit_center;
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        Body* ancestor = registry.find(*it);
        if (ancestor->orbit)
        {
            update_body(registry, *ancestor, elapsed_seconds);
        }
    }

    update_body(registry, *body, elapsed_seconds);
    return body->position;
}

u32 OrbitPropagator::propagate_all(BodyRegistry& registry, f64 elapsed_seconds)
{
    u32 updated = 0;
    for (const BodyId id : registry.propagation_order())
    {
        Body* body = registry.find(id);
        if (body->orbit)
        {
            update_body(registry, *body, elapsed_seconds);
            ++updated;
        }
    }
    return updated;
}

u32 OrbitPropagator::propagate_system(BodyRegistry& registry, SystemId system, f64 elapsed_seconds)
{
    u32 updated = 0;
    for (const BodyId id : registry.propagation_order())
    {
        Body* body = registry.find(id);
        if (body->system == system && body->orbit)
        {
            update_body(registry, *body, elapsed_seconds);
            ++updated;
        }
    }
    return updated;
}

} // namespace orrery::universe
