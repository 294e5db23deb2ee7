/// @file simulation.cpp
/// @brief Tick phases of the simulation driver.

#include "sim/simulation.hpp"

#include "astro/space_coordinates.hpp"
#include "core/logger.hpp"
#include "universe/orbit_propagator.hpp"

#include <unordered_set>

namespace orrery::sim
{

using universe::SimulationState;
using universe::SystemId;

Simulation::Simulation(MultiSystemConfig config, u64 seed)
    : m_populator(m_registry, seed)
    , m_scheduler(config)
{
}

SystemId Simulation::add_catalog_system(const universe::CatalogSystem& record)
{
    return register_system(m_populator.populate(record, m_next_system_id));
}

SystemId Simulation::add_sol()
{
    return register_system(m_populator.populate_sol(m_next_system_id, m_clock.start_jd()));
}

SystemId Simulation::register_system(universe::StarSystem system)
{
    const SystemId id = system.id;
    ++m_next_system_id;

    // Valid positions from the start, even for systems that stay Dormant
    universe::OrbitPropagator::propagate_system(m_registry, id, m_clock.elapsed());

    if (!m_scheduler.add_system(std::move(system)))
    {
        ORR_CORE_ERROR("Simulation: Failed to register system id {}", id);
    }
    return id;
}

bool Simulation::focus_system(SystemId id)
{
    const universe::StarSystem* system = m_scheduler.find(id);
    if (system == nullptr || !m_scheduler.set_focus(id))
    {
        return false;
    }

    m_origin.request_recenter(astro::galactic_to_space(system->galactic_position_ly));
    ORR_CORE_INFO("Simulation: Focus -> '{}'", system->name);
    return true;
}

Vec3d Simulation::focus_position_ly() const
{
    if (const auto focus = m_scheduler.focus())
    {
        if (const universe::StarSystem* system = m_scheduler.find(*focus))
        {
            return system->galactic_position_ly;
        }
    }
    // No focus: measure from wherever the render frame is centered
    const astro::SpaceCoordinates& origin = m_origin.origin();
    return origin / astro_constants::kAuPerLightYear;
}

// -----------------------------------------------------------------
// tick
// -----------------------------------------------------------------

void Simulation::tick(f64 wall_dt)
{
    TickStats stats;

    // 1. Floating origin
    m_origin.apply_pending();

    // 2. Clock
    m_clock.advance(wall_dt);
    const f64 t = m_clock.elapsed();

    // 3. Fidelity
    m_last_transitions = m_scheduler.evaluate(focus_position_ly());
    stats.transitions = static_cast<u32>(m_last_transitions.size());

    // 4. Catch-up of woken systems: the same pure formulas at the current t
    std::unordered_set<SystemId> done;
    for (const auto& transition : m_last_transitions)
    {
        if (transition.from == SimulationState::Dormant && transition.to != SimulationState::Dormant)
        {
            stats.bodies_propagated += universe::OrbitPropagator::propagate_system(m_registry, transition.system, t);
            ++stats.systems_caught_up;
            ++stats.systems_propagated;
            done.insert(transition.system);
        }
    }

    // 5. Cadence
    for (const auto& system : m_scheduler.systems())
    {
        if (done.contains(system.id) || !m_scheduler.should_propagate(system.id, m_frame))
        {
            continue;
        }
        stats.bodies_propagated += universe::OrbitPropagator::propagate_system(m_registry, system.id, t);
        ++stats.systems_propagated;
    }

    // 6. Frame
    ++m_frame;
    m_last_tick = stats;
}

void Simulation::scrub_to(f64 elapsed_seconds)
{
    m_clock.set_elapsed(elapsed_seconds);
    const f64 t = m_clock.elapsed();

    for (const auto& system : m_scheduler.systems())
    {
        if (system.state != SimulationState::Dormant)
        {
            universe::OrbitPropagator::propagate_system(m_registry, system.id, t);
        }
    }
}

std::vector<rendering::RenderInstance> Simulation::render_instances(f64 scale) const
{
    std::vector<rendering::RenderInstance> instances;
    for (const SystemId id : m_scheduler.systems_in_state(SimulationState::Active))
    {
        auto system_instances = rendering::RenderBridge::collect_instances(m_registry, id, m_origin.origin(), scale);
        instances.insert(instances.end(), system_instances.begin(), system_instances.end());
    }
    return instances;
}

} // namespace orrery::sim
