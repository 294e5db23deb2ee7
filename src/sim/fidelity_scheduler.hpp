#pragma once

/// @file fidelity_scheduler.hpp
/// @brief Active/Background/Dormant assignment of star systems by focus and distance.

#include "core/types.hpp"
#include "sim/multi_system_config.hpp"
#include "universe/star_system.hpp"

#include <functional>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace orrery::sim
{
    /// @brief A state change produced by one evaluation.
    struct SystemTransition
    {
        universe::SystemId system;
        universe::SimulationState from;
        universe::SimulationState to;
        f64 distance_ly;
    };

    /// @brief System and body counts per fidelity state.
    struct SchedulerMetrics
    {
        u32 active_systems = 0;
        u32 background_systems = 0;
        u32 dormant_systems = 0;
        u64 active_bodies = 0;
        u64 background_bodies = 0;
        u64 dormant_bodies = 0;
    };

    /// @brief Owns every StarSystem and decides how often each one is simulated.
    ///
    /// Rules, applied once per evaluate():
    /// - the focused system is always Active
    /// - otherwise d <= activation → Active, d <= background → Background,
    ///   a Background system stays Background up to dormant distance,
    ///   everything else is Dormant
    /// - at most max_active Active (focus first, then nearest) and
    ///   max_background Background (nearest first); overflow drops one level
    ///
    /// Active systems propagate every frame, Background every Nth frame,
    /// Dormant never.
    class FidelityScheduler
    {
    public:
        /// Distance from the focus to a system, in light-years. std::nullopt means unreachable.
        using DistanceQuery = std::function<std::optional<f64>(const universe::StarSystem&)>;
        using TransitionListener = std::function<void(const SystemTransition&)>;

        explicit FidelityScheduler(MultiSystemConfig config = {});

        /// @brief Register a system. Its current state is kept as given.
        /// @return false if the id is already registered.
        bool add_system(universe::StarSystem system);

        [[nodiscard]] std::optional<universe::SimulationState> fidelity_state(universe::SystemId id) const;
        [[nodiscard]] const universe::StarSystem* find(universe::SystemId id) const;

        /// @brief Make a system the focus; takes effect at the next evaluate().
        /// @return false if the id is unknown.
        bool set_focus(universe::SystemId id);
        [[nodiscard]] std::optional<universe::SystemId> focus() const { return m_focus; }

        /// @brief Re-evaluate every system against the focus position (light-years).
        std::vector<SystemTransition> evaluate(const Vec3d& focus_position_ly);

        /// @brief Re-evaluate every system using a caller-supplied distance.
        std::vector<SystemTransition> evaluate(const DistanceQuery& distance_ly);

        /// @brief Whether a system's bodies should be propagated on this frame.
        [[nodiscard]] bool should_propagate(universe::SystemId id, u64 frame) const;

        void set_transition_listener(TransitionListener listener) { m_listener = std::move(listener); }

        /// @brief Update the body count reported in metrics.
        bool set_body_count(universe::SystemId id, u32 count);

        [[nodiscard]] SchedulerMetrics metrics() const;
        [[nodiscard]] std::vector<universe::SystemId> systems_in_state(universe::SimulationState state) const;

        [[nodiscard]] const MultiSystemConfig& config() const { return m_config; }
        [[nodiscard]] std::span<const universe::StarSystem> systems() const { return m_systems; }

    private:
        [[nodiscard]] universe::SimulationState desired_state(const universe::StarSystem& system, f64 distance) const;

        MultiSystemConfig m_config;
        std::vector<universe::StarSystem> m_systems;
        std::unordered_map<universe::SystemId, std::size_t> m_index;
        std::optional<universe::SystemId> m_focus;
        TransitionListener m_listener;
    };

} // namespace orrery::sim
