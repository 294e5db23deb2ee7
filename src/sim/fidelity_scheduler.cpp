/// @file fidelity_scheduler.cpp
/// @brief Distance thresholds, hysteresis and caps of the fidelity scheduler.

#include "sim/fidelity_scheduler.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace orrery::sim
{

using universe::SimulationState;
using universe::StarSystem;
using universe::SystemId;

FidelityScheduler::FidelityScheduler(MultiSystemConfig config)
    : m_config(config)
{
}

bool FidelityScheduler::add_system(StarSystem system)
{
    if (m_index.contains(system.id))
    {
        ORR_CORE_WARN("FidelityScheduler: System id {} ('{}') is already registered", system.id, system.name);
        return false;
    }

    m_index.emplace(system.id, m_systems.size());
    m_systems.push_back(std::move(system));
    return true;
}

std::optional<SimulationState> FidelityScheduler::fidelity_state(SystemId id) const
{
    const StarSystem* system = find(id);
    if (system == nullptr)
    {
        return std::nullopt;
    }
    return system->state;
}

const StarSystem* FidelityScheduler::find(SystemId id) const
{
    const auto it = m_index.find(id);
    if (it == m_index.end())
    {
        return nullptr;
    }
    return &m_systems[it->second];
}

bool FidelityScheduler::set_focus(SystemId id)
{
    if (!m_index.contains(id))
    {
        ORR_CORE_WARN("FidelityScheduler: Cannot focus unknown system id {}", id);
        return false;
    }
    m_focus = id;
    return true;
}

// -----------------------------------------------------------------
// Per-system target ignoring caps
// -----------------------------------------------------------------

SimulationState FidelityScheduler::desired_state(const StarSystem& system, f64 distance) const
{
    if (m_focus && *m_focus == system.id)
    {
        return SimulationState::Active;
    }

    if (!m_config.auto_transition_systems)
    {
        return system.state;
    }

    if (distance <= m_config.activation_distance_ly)
    {
        return SimulationState::Active;
    }
    if (distance <= m_config.background_distance_ly)
    {
        return SimulationState::Background;
    }

    // Hysteresis band: already-running systems stay in Background until dormant distance
    if (system.state != SimulationState::Dormant && distance <= m_config.dormant_distance_ly)
    {
        return SimulationState::Background;
    }
    return SimulationState::Dormant;
}

std::vector<SystemTransition> FidelityScheduler::evaluate(const Vec3d& focus_position_ly)
{
    return evaluate([&focus_position_ly](const StarSystem& system) -> std::optional<f64> {
        return glm::distance(system.galactic_position_ly, focus_position_ly);
    });
}

std::vector<SystemTransition> FidelityScheduler::evaluate(const DistanceQuery& distance_ly)
{
    struct Candidate
    {
        std::size_t index;
        f64 distance;
        SimulationState state;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(m_systems.size());
    for (std::size_t i = 0; i < m_systems.size(); ++i)
    {
        // Absent or non-finite distances count as unreachable
        const auto d = distance_ly(m_systems[i]);
        const f64 distance = (d && std::isfinite(*d)) ? *d : std::numeric_limits<f64>::infinity();
        candidates.push_back({i, distance, desired_state(m_systems[i], distance)});
    }

    // Focus first, then nearest, then lowest id for a stable order
    std::sort(candidates.begin(), candidates.end(), [this](const Candidate& a, const Candidate& b) {
        const bool a_focus = m_focus && m_systems[a.index].id == *m_focus;
        const bool b_focus = m_focus && m_systems[b.index].id == *m_focus;
        if (a_focus != b_focus)
        {
            return a_focus;
        }
        if (a.distance != b.distance)
        {
            return a.distance < b.distance;
        }
        return m_systems[a.index].id < m_systems[b.index].id;
    });

    // -----------------------------------------------------------------
    // Caps: overflow Active → Background, overflow Background → Dormant
    // -----------------------------------------------------------------
    u32 active = 0;
    for (auto& candidate : candidates)
    {
        if (candidate.state == SimulationState::Active && ++active > m_config.max_active_systems)
        {
            candidate.state = SimulationState::Background;
        }
    }

    u32 background = 0;
    for (auto& candidate : candidates)
    {
        if (candidate.state == SimulationState::Background && ++background > m_config.max_background_systems)
        {
            candidate.state = SimulationState::Dormant;
        }
    }

    // -----------------------------------------------------------------
    // Commit and report
    // -----------------------------------------------------------------
    std::vector<SystemTransition> transitions;
    for (const auto& candidate : candidates)
    {
        StarSystem& system = m_systems[candidate.index];
        if (system.state == candidate.state)
        {
            continue;
        }

        const SystemTransition transition{
            .system = system.id,
            .from = system.state,
            .to = candidate.state,
            .distance_ly = candidate.distance,
        };
        system.state = candidate.state;

        ORR_CORE_INFO("FidelityScheduler: '{}' {} -> {} ({:.2f} ly)",
                      system.name, universe::to_string(transition.from),
                      universe::to_string(transition.to), candidate.distance);

        if (m_listener)
        {
            m_listener(transition);
        }
        transitions.push_back(transition);
    }
    return transitions;
}

bool FidelityScheduler::should_propagate(SystemId id, u64 frame) const
{
    const StarSystem* system = find(id);
    if (system == nullptr)
    {
        return false;
    }

    switch (system->state)
    {
        case SimulationState::Active:     return true;
        case SimulationState::Background: return frame % m_config.background_update_interval == 0;
        case SimulationState::Dormant:    return false;
    }
    return false;
}

bool FidelityScheduler::set_body_count(SystemId id, u32 count)
{
    const auto it = m_index.find(id);
    if (it == m_index.end())
    {
        return false;
    }
    m_systems[it->second].body_count = count;
    return true;
}

SchedulerMetrics FidelityScheduler::metrics() const
{
    SchedulerMetrics m;
    for (const auto& system : m_systems)
    {
        switch (system.state)
        {
            case SimulationState::Active:
                ++m.active_systems;
                m.active_bodies += system.body_count;
                break;
            case SimulationState::Background:
                ++m.background_systems;
                m.background_bodies += system.body_count;
                break;
            case SimulationState::Dormant:
                ++m.dormant_systems;
                m.dormant_bodies += system.body_count;
                break;
        }
    }
    return m;
}

std::vector<SystemId> FidelityScheduler::systems_in_state(SimulationState state) const
{
    std::vector<SystemId> result;
    for (const auto& system : m_systems)
    {
        if (system.state == state)
        {
            result.push_back(system.id);
        }
    }
    return result;
}

} // namespace orrery::sim
