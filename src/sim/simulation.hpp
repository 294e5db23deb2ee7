#pragma once

/// @file simulation.hpp
/// @brief Tick driver: owns time, bodies, fidelity state and the floating origin.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "rendering/render_bridge.hpp"
#include "sim/fidelity_scheduler.hpp"
#include "sim/multi_system_config.hpp"
#include "universe/body_registry.hpp"
#include "universe/nearby_stars.hpp"
#include "universe/system_populator.hpp"

#include <optional>
#include <vector>

namespace orrery::sim
{
    /// @brief Counters of the most recent tick.
    struct TickStats
    {
        u32 systems_propagated = 0;
        u32 systems_caught_up = 0;      ///< Woken from Dormant and re-derived this tick
        u32 bodies_propagated = 0;
        u32 transitions = 0;
    };

    /// @brief Single-threaded owner of the shared simulation state.
    ///
    /// tick() runs fixed phases:
    ///   1. apply a pending floating-origin re-center
    ///   2. advance the simulation clock
    ///   3. re-evaluate fidelity states from the focus position
    ///   4. re-derive systems that just left Dormant
    ///   5. propagate systems whose cadence fires on this frame
    ///   6. advance the frame counter
    /// Origin and fidelity state are written only in phases 1 and 3.
    class Simulation
    {
    public:
        static constexpr u64 kDefaultSeed = 0x0DDBA11CAFEULL;

        explicit Simulation(MultiSystemConfig config = {}, u64 seed = kDefaultSeed);

        /// @brief Populate and register a catalog system.
        universe::SystemId add_catalog_system(const universe::CatalogSystem& record);

        /// @brief Populate and register Sol at the clock's start date.
        universe::SystemId add_sol();

        /// @brief Focus a system and queue an origin re-center on it.
        /// @return false if the id is unknown.
        bool focus_system(universe::SystemId id);

        /// @brief Run one tick with the given wall-clock delta (seconds).
        void tick(f64 wall_dt);

        /// @brief Jump to an absolute simulated time and re-derive every non-Dormant system.
        void scrub_to(f64 elapsed_seconds);

        /// @brief Render positions of every body in Active systems.
        [[nodiscard]] std::vector<rendering::RenderInstance> render_instances(f64 scale = astro::kDefaultRenderScale) const;

        [[nodiscard]] astro::SimulationClock& clock() { return m_clock; }
        [[nodiscard]] const astro::SimulationClock& clock() const { return m_clock; }
        [[nodiscard]] universe::BodyRegistry& registry() { return m_registry; }
        [[nodiscard]] const universe::BodyRegistry& registry() const { return m_registry; }
        [[nodiscard]] const FidelityScheduler& scheduler() const { return m_scheduler; }
        [[nodiscard]] FidelityScheduler& scheduler() { return m_scheduler; }
        [[nodiscard]] const rendering::FloatingOrigin& origin() const { return m_origin; }
        [[nodiscard]] u64 frame() const { return m_frame; }
        [[nodiscard]] const TickStats& last_tick() const { return m_last_tick; }
        [[nodiscard]] const std::vector<SystemTransition>& last_transitions() const { return m_last_transitions; }

    private:
        universe::SystemId register_system(universe::StarSystem system);
        [[nodiscard]] Vec3d focus_position_ly() const;

        astro::SimulationClock m_clock;
        universe::BodyRegistry m_registry;
        universe::SystemPopulator m_populator;
        FidelityScheduler m_scheduler;
        rendering::FloatingOrigin m_origin;

        universe::SystemId m_next_system_id = 0;
        u64 m_frame = 0;
        TickStats m_last_tick;
        std::vector<SystemTransition> m_last_transitions;
    };

} // namespace orrery::sim
