/// @file main.cpp
/// @brief Orrery headless demo: Sol and nearby systems under the fidelity scheduler.

#include "core/logger.hpp"
#include "sim/multi_system_config.hpp"
#include "sim/simulation.hpp"
#include "universe/nearby_stars.hpp"

#include <cstdlib>
#include <optional>

using namespace orrery;

namespace
{
    constexpr f64 kFrameDt = 1.0 / 60.0;
    constexpr u32 kFramesPerLeg = 600;

    void run_leg(sim::Simulation& simulation, u32 frames)
    {
        for (u32 i = 0; i < frames; ++i)
        {
            simulation.tick(kFrameDt);
        }

        const auto date = simulation.clock().current_date();
        const auto m = simulation.scheduler().metrics();
        ORR_INFO("Frame {} | {:04d}-{:02d}-{:02d} | systems A/B/D {}/{}/{} | bodies A/B/D {}/{}/{} | {} instances",
                 simulation.frame(), date.year, date.month, date.day,
                 m.active_systems, m.background_systems, m.dormant_systems,
                 m.active_bodies, m.background_bodies, m.dormant_bodies,
                 simulation.render_instances().size());
    }
}

int main(int argc, char** argv)
{
    core::Logger::init();
    ORR_INFO("Orrery starting");

    sim::MultiSystemConfig config;
    if (argc > 1)
    {
        const auto loaded = sim::MultiSystemConfig::load(argv[1]);
        if (!loaded)
        {
            ORR_CRITICAL("Could not load config '{}'", argv[1]);
            core::Logger::shutdown();
            return EXIT_FAILURE;
        }
        config = *loaded;
    }

    sim::Simulation simulation(config);
    simulation.clock().set_time_scale(1000.0);

    const universe::SystemId sol = simulation.add_sol();
    const auto catalog = universe::NearbyStarCatalog::load_builtin();
    for (const auto& record : catalog.systems())
    {
        simulation.add_catalog_system(record);
    }

    simulation.focus_system(sol);
    run_leg(simulation, kFramesPerLeg);

    // Jump focus to the nearest neighbour; the origin follows at the next tick
    if (const auto* alpha_cen = catalog.find_by_name("Alpha Centauri A"))
    {
        for (const auto& system : simulation.scheduler().systems())
        {
            if (system.name == alpha_cen->name)
            {
                simulation.focus_system(system.id);
                break;
            }
        }
    }
    run_leg(simulation, kFramesPerLeg);

    simulation.clock().set_paused(true);
    run_leg(simulation, kFramesPerLeg / 10);

    ORR_INFO("Orrery shutting down after {:.1f} simulated days",
             simulation.clock().elapsed() / astro_constants::kSecondsPerDay);
    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
