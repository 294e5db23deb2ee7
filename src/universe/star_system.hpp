#pragma once

/// @file star_system.hpp
/// @brief Star-system container and its simulation-fidelity state.

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace orrery::universe
{
    using SystemId = u32;

    /// @brief Simulation fidelity of a star system.
    enum class SimulationState : u8
    {
        Dormant,    ///< No propagation; frozen until reactivated
        Background, ///< Propagated every Nth frame, not rendered
        Active,     ///< Propagated every frame, rendered
    };

    [[nodiscard]] constexpr std::string_view to_string(SimulationState state)
    {
        switch (state)
        {
            case SimulationState::Dormant:    return "Dormant";
            case SimulationState::Background: return "Background";
            case SimulationState::Active:     return "Active";
        }
        return "Unknown";
    }

    /// @brief A named star system placed in the galaxy.
    ///
    /// Created once at load time and never destroyed during a session.
    /// The scheduler owns `state`; population owns `body_count`.
    struct StarSystem
    {
        SystemId id = 0;
        std::string name;
        Vec3d galactic_position_ly{0.0};   ///< Offset from Sol (light-years)
        f64 bounding_radius_au = 50.0;     ///< Extent used for view-distance decisions
        SimulationState state = SimulationState::Dormant;
        u32 body_count = 0;
        std::string star_type;             ///< Spectral type of the primary, e.g. "G2V"
    };

} // namespace orrery::universe
