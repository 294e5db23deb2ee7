/// @file test_simulation.cpp
/// @brief Integration tests for orrery::sim::Simulation tick phases.
///
/// Covers deferred origin re-centering, catch-up of systems leaving
/// Dormant, Background cadence, scrubbing and render selection.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/space_coordinates.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "sim/simulation.hpp"
#include "universe/nearby_stars.hpp"
#include "universe/orbit_propagator.hpp"

#include <string>

using namespace orrery;
using namespace orrery::sim;
using orrery::universe::BodyId;
using orrery::universe::CatalogStar;
using orrery::universe::CatalogSystem;
using orrery::universe::SimulationState;
using orrery::universe::SystemId;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    orrery::core::Logger::init({.file_sink = false});
    const int result = doctest::Context(argc, argv).run();
    orrery::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

namespace
{
    // A single Sun-like star on the +x axis (RA 0, Dec 0)
    CatalogSystem make_record(const std::string& name, f64 distance_ly)
    {
        return CatalogSystem{
            .name = name,
            .distance_ly = distance_ly,
            .stars = {CatalogStar{.name = name, .spectral_type = "G2V"}},
        };
    }

    BodyId first_orbiting(const universe::BodyRegistry& registry, SystemId system)
    {
        for (const auto& body : registry.bodies())
        {
            if (body.system == system && body.orbit)
            {
                return body.id;
            }
        }
        FAIL("system has no orbiting body");
        return 0;
    }

    SimulationState state_of(const Simulation& sim, SystemId id)
    {
        const auto state = sim.scheduler().fidelity_state(id);
        REQUIRE(state.has_value());
        return *state;
    }

    // Position the propagator would give right now, without touching the live registry
    astro::SpaceCoordinates expected_position(const Simulation& sim, BodyId id)
    {
        universe::BodyRegistry copy = sim.registry();
        const auto p = universe::OrbitPropagator::propagate(copy, id, sim.clock().elapsed());
        REQUIRE(p.has_value());
        return *p;
    }
}

// =================================================================
// Registration
// =================================================================

TEST_CASE("Registered systems start Dormant with valid positions")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));

    CHECK(sol == 0);
    CHECK(near_id == 1);
    CHECK(state_of(sim, sol) == SimulationState::Dormant);
    CHECK(state_of(sim, near_id) == SimulationState::Dormant);

    const BodyId planet = first_orbiting(sim.registry(), near_id);
    const auto* body = sim.registry().find(planet);
    REQUIRE(body != nullptr);
    CHECK(body->position == expected_position(sim, planet));
    CHECK(body->position.x > 0.5 * astro::light_years_to_au(10.0));
}

TEST_CASE("Focusing an unknown system fails without moving the origin")
{
    Simulation sim;
    (void)sim.add_sol();

    CHECK_FALSE(sim.focus_system(99));
    CHECK_FALSE(sim.origin().has_pending());
    CHECK_FALSE(sim.scheduler().focus().has_value());
}

// =================================================================
// Tick phases
// =================================================================

TEST_CASE("Tick advances the clock and the frame counter")
{
    Simulation sim;
    (void)sim.add_sol();
    sim.clock().set_time_scale(100.0);

    sim.tick(0.5);
    CHECK(sim.clock().elapsed() == doctest::Approx(50.0));
    CHECK(sim.frame() == 1);

    sim.clock().set_paused(true);
    sim.tick(0.5);
    CHECK(sim.clock().elapsed() == doctest::Approx(50.0));
    CHECK(sim.frame() == 2);
}

TEST_CASE("Origin re-centers at the start of the next tick")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));

    REQUIRE(sim.focus_system(sol));
    sim.tick(0.1);
    CHECK(sim.origin().origin() == astro::SpaceCoordinates{0.0});

    REQUIRE(sim.focus_system(near_id));
    CHECK(sim.origin().has_pending());
    CHECK(sim.origin().origin() == astro::SpaceCoordinates{0.0});

    sim.tick(0.1);
    CHECK_FALSE(sim.origin().has_pending());
    CHECK(sim.origin().origin().x == doctest::Approx(astro::light_years_to_au(10.0)));
    CHECK(sim.origin().origin().y == doctest::Approx(0.0));
    CHECK(state_of(sim, near_id) == SimulationState::Active);
    CHECK(state_of(sim, sol) == SimulationState::Background);
}

TEST_CASE("First tick wakes nearby systems and derives their positions")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));
    const SystemId far_id = sim.add_catalog_system(make_record("Far", 500.0));
    sim.clock().set_time_scale(1000.0);

    REQUIRE(sim.focus_system(sol));
    sim.tick(1.0);

    CHECK(state_of(sim, sol) == SimulationState::Active);
    CHECK(state_of(sim, near_id) == SimulationState::Background);
    CHECK(state_of(sim, far_id) == SimulationState::Dormant);

    CHECK(sim.last_tick().transitions == 2);
    CHECK(sim.last_tick().systems_caught_up == 2);
    CHECK(sim.last_tick().systems_propagated == 2);
    CHECK(sim.last_transitions().size() == 2);

    const BodyId planet = first_orbiting(sim.registry(), near_id);
    CHECK(sim.registry().find(planet)->position == expected_position(sim, planet));
}

TEST_CASE("Systems leaving Dormant catch up to the current time")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));
    const SystemId edge_id = sim.add_catalog_system(make_record("Edge", 55.0));
    sim.clock().set_time_scale(1000.0);

    REQUIRE(sim.focus_system(sol));
    for (int i = 0; i < 30; ++i)
    {
        sim.tick(1.0);
    }
    REQUIRE(state_of(sim, edge_id) == SimulationState::Dormant);

    const BodyId planet = first_orbiting(sim.registry(), edge_id);
    const astro::SpaceCoordinates frozen = sim.registry().find(planet)->position;

    // From Near, Edge is 45 ly away and enters Background
    REQUIRE(sim.focus_system(near_id));
    sim.tick(1.0);

    CHECK(state_of(sim, edge_id) == SimulationState::Background);
    CHECK(sim.last_tick().systems_caught_up >= 1);

    const astro::SpaceCoordinates now = sim.registry().find(planet)->position;
    CHECK(now != frozen);
    CHECK(now == expected_position(sim, planet));
}

TEST_CASE("Background systems propagate on their cadence only")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));
    sim.clock().set_time_scale(1000.0);

    REQUIRE(sim.focus_system(sol));
    sim.tick(1.0);     // frame 0: woken and caught up
    REQUIRE(state_of(sim, near_id) == SimulationState::Background);
    REQUIRE(sim.scheduler().config().background_update_interval == 10);

    const BodyId planet = first_orbiting(sim.registry(), near_id);
    const astro::SpaceCoordinates after_wake = sim.registry().find(planet)->position;

    for (int i = 1; i < 10; ++i)     // frames 1..9
    {
        sim.tick(1.0);
        CHECK(sim.registry().find(planet)->position == after_wake);
    }

    sim.tick(1.0);     // frame 10
    CHECK(sim.registry().find(planet)->position != after_wake);
    CHECK(sim.registry().find(planet)->position == expected_position(sim, planet));
}

TEST_CASE("Active systems propagate every tick")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    sim.clock().set_time_scale(1000.0);
    REQUIRE(sim.focus_system(sol));

    const BodyId planet = first_orbiting(sim.registry(), sol);
    for (int i = 0; i < 5; ++i)
    {
        const astro::SpaceCoordinates before = sim.registry().find(planet)->position;
        sim.tick(1.0);
        CHECK(sim.registry().find(planet)->position != before);
        CHECK(sim.registry().find(planet)->position == expected_position(sim, planet));
    }
}

TEST_CASE("Dormant systems keep their positions")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId far_id = sim.add_catalog_system(make_record("Far", 500.0));
    sim.clock().set_time_scale(1000.0);
    REQUIRE(sim.focus_system(sol));

    const BodyId planet = first_orbiting(sim.registry(), far_id);
    const astro::SpaceCoordinates initial = sim.registry().find(planet)->position;

    for (int i = 0; i < 25; ++i)
    {
        sim.tick(1.0);
    }
    CHECK(state_of(sim, far_id) == SimulationState::Dormant);
    CHECK(sim.registry().find(planet)->position == initial);
}

// =================================================================
// Scrubbing
// =================================================================

TEST_CASE("Scrubbing re-derives running systems at the new time")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId far_id = sim.add_catalog_system(make_record("Far", 500.0));
    REQUIRE(sim.focus_system(sol));
    sim.tick(0.1);

    const BodyId earth_like = first_orbiting(sim.registry(), sol);
    const BodyId far_planet = first_orbiting(sim.registry(), far_id);
    const astro::SpaceCoordinates far_before = sim.registry().find(far_planet)->position;

    sim.scrub_to(3.0e7);
    CHECK(sim.clock().elapsed() == 3.0e7);
    CHECK(sim.registry().find(earth_like)->position == expected_position(sim, earth_like));
    CHECK(sim.registry().find(far_planet)->position == far_before);

    // Scrubbing back reproduces the earlier state exactly
    const astro::SpaceCoordinates at_3e7 = sim.registry().find(earth_like)->position;
    sim.scrub_to(0.0);
    sim.scrub_to(3.0e7);
    CHECK(sim.registry().find(earth_like)->position == at_3e7);
}

// =================================================================
// Rendering
// =================================================================

TEST_CASE("Render instances cover Active systems only")
{
    Simulation sim;
    const SystemId sol = sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));
    REQUIRE(sim.focus_system(sol));

    CHECK(sim.render_instances().empty());

    sim.tick(0.1);
    const auto instances = sim.render_instances();
    CHECK(instances.size() == sim.registry().count_in_system(sol));
    for (const auto& instance : instances)
    {
        const auto* body = sim.registry().find(instance.body);
        REQUIRE(body != nullptr);
        CHECK(body->system == sol);
    }

    REQUIRE(sim.focus_system(near_id));
    sim.tick(0.1);
    const auto moved = sim.render_instances();
    CHECK(moved.size() == sim.registry().count_in_system(near_id));
    for (const auto& instance : moved)
    {
        CHECK(sim.registry().find(instance.body)->system == near_id);
    }
}

TEST_CASE("Focused star renders at the render-space origin")
{
    Simulation sim;
    (void)sim.add_sol();
    const SystemId near_id = sim.add_catalog_system(make_record("Near", 10.0));
    REQUIRE(sim.focus_system(near_id));
    sim.tick(0.1);

    for (const auto& instance : sim.render_instances())
    {
        const auto* body = sim.registry().find(instance.body);
        if (body->kind == universe::BodyKind::Star)
        {
            CHECK(instance.position.x == doctest::Approx(0.0));
            CHECK(instance.position.y == doctest::Approx(0.0));
            CHECK(instance.position.z == doctest::Approx(0.0));
        }
    }
}
