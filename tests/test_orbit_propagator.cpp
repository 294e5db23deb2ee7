/// @file test_orbit_propagator.cpp
/// @brief Unit tests for orrery::universe::OrbitPropagator and BodyRegistry.
///
/// Verifies stateless propagation, the perifocal rotation sequence,
/// OrbitCenter composition and cycle rejection.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/kepler_orbit.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "universe/body_registry.hpp"
#include "universe/orbit_propagator.hpp"

#include <algorithm>

using namespace orrery;
using namespace orrery::universe;
using namespace orrery::astro_constants;
using orrery::astro::KeplerOrbit;
using orrery::astro::SpaceCoordinates;

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
    BodyId add_orbiting(BodyRegistry& registry, const char* name, const KeplerOrbit& orbit, SystemId system = 0)
    {
        return registry.add_body(Body{
            .name = name,
            .kind = BodyKind::Planet,
            .system = system,
            .orbit = orbit,
        });
    }

    BodyId add_static(BodyRegistry& registry, const char* name, const SpaceCoordinates& position, SystemId system = 0)
    {
        return registry.add_body(Body{
            .name = name,
            .kind = BodyKind::Star,
            .system = system,
            .position = position,
        });
    }

    void check_vec(const SpaceCoordinates& actual, const SpaceCoordinates& expected, f64 tol = 1e-9)
    {
        CHECK(actual.x == doctest::Approx(expected.x).epsilon(tol));
        CHECK(actual.y == doctest::Approx(expected.y).epsilon(tol));
        CHECK(actual.z == doctest::Approx(expected.z).epsilon(tol));
    }
}

// =================================================================
// Single-body propagation
// =================================================================

TEST_CASE("Circular orbit at t = 0 sits at (1, 0, 0) and repeats exactly")
{
    BodyRegistry registry;
    const BodyId id = add_orbiting(registry, "Circle", KeplerOrbit::circular(1.0, kTwoPi));

    const auto first = OrbitPropagator::propagate(registry, id, 0.0);
    REQUIRE(first.has_value());
    check_vec(*first, {1.0, 0.0, 0.0});

    for (int i = 0; i < 5; ++i)
    {
        const auto again = OrbitPropagator::propagate(registry, id, 0.0);
        REQUIRE(again.has_value());
        CHECK(*again == *first);
    }
}

TEST_CASE("Quarter period moves a circular orbit to the y axis")
{
    BodyRegistry registry;
    const BodyId id = add_orbiting(registry, "Circle", KeplerOrbit::circular(2.0, kTwoPi / 100.0));

    const auto p = OrbitPropagator::propagate(registry, id, 25.0);
    REQUIRE(p.has_value());
    check_vec(*p, {0.0, 2.0, 0.0});
}

TEST_CASE("Propagation ignores history: scrubbing back reproduces earlier positions")
{
    BodyRegistry registry;
    const auto orbit = KeplerOrbit::create(0.4, 3.0, 0.2, 1.0, 2.0, 0.5, 1e-6);
    REQUIRE(orbit.has_value());
    const BodyId id = add_orbiting(registry, "Eccentric", *orbit);

    const auto at_1000 = OrbitPropagator::propagate(registry, id, 1000.0);
    OrbitPropagator::propagate(registry, id, 5.0e6);
    OrbitPropagator::propagate(registry, id, -3.0e5);
    const auto again = OrbitPropagator::propagate(registry, id, 1000.0);

    REQUIRE(at_1000.has_value());
    REQUIRE(again.has_value());
    CHECK(*again == *at_1000);
}

TEST_CASE("Zero mean motion freezes the body at its epoch position")
{
    BodyRegistry registry;
    const auto orbit = KeplerOrbit::create(0.1, 1.0, 0.0, 0.0, 0.0, kHalfPi, 0.0);
    REQUIRE(orbit.has_value());
    const BodyId id = add_orbiting(registry, "Frozen", *orbit);

    const auto p0 = OrbitPropagator::propagate(registry, id, 0.0);
    const auto p1 = OrbitPropagator::propagate(registry, id, 1.0e9);
    REQUIRE(p0.has_value());
    REQUIRE(p1.has_value());
    CHECK(*p0 == *p1);
}

// =================================================================
// Orientation
// =================================================================

TEST_CASE("Argument of periapsis rotates within the orbital plane")
{
    BodyRegistry registry;
    KeplerOrbit orbit = KeplerOrbit::circular(1.0, 0.0);
    orbit.argument_of_periapsis = kHalfPi;
    const BodyId id = add_orbiting(registry, "Rotated", orbit);

    const auto p = OrbitPropagator::propagate(registry, id, 0.0);
    REQUIRE(p.has_value());
    check_vec(*p, {0.0, 1.0, 0.0});
}

TEST_CASE("Polar orbit lifts the periapsis out of the reference plane")
{
    BodyRegistry registry;
    KeplerOrbit orbit = KeplerOrbit::circular(1.0, 0.0);
    orbit.inclination = kHalfPi;
    orbit.argument_of_periapsis = kHalfPi;
    const BodyId id = add_orbiting(registry, "Polar", orbit);

    const auto p = OrbitPropagator::propagate(registry, id, 0.0);
    REQUIRE(p.has_value());
    check_vec(*p, {0.0, 0.0, 1.0});
}

TEST_CASE("Ascending node rotates the line of nodes about z")
{
    BodyRegistry registry;
    KeplerOrbit orbit = KeplerOrbit::circular(1.0, 0.0);
    orbit.longitude_ascending_node = kPi;
    orbit.inclination = 0.3;
    const BodyId id = add_orbiting(registry, "Node", orbit);

    const auto p = OrbitPropagator::propagate(registry, id, 0.0);
    REQUIRE(p.has_value());
    check_vec(*p, {-1.0, 0.0, 0.0});
}

TEST_CASE("Eccentric orbit starts at periapsis distance")
{
    BodyRegistry registry;
    const auto orbit = KeplerOrbit::create(0.5, 1.0, 0.0, 0.0, 0.0, 0.0, 1e-7);
    REQUIRE(orbit.has_value());
    const BodyId id = add_orbiting(registry, "Ellipse", *orbit);

    const auto p = OrbitPropagator::propagate(registry, id, 0.0);
    REQUIRE(p.has_value());
    check_vec(*p, {0.5, 0.0, 0.0});
}

// =================================================================
// OrbitCenter composition
// =================================================================

TEST_CASE("Moon position is parent position plus its own ellipse")
{
    BodyRegistry registry;
    const BodyId star = add_static(registry, "Star", {100.0, 0.0, 0.0});
    const BodyId planet = add_orbiting(registry, "Planet", KeplerOrbit::circular(1.0, kTwoPi / 400.0));
    const BodyId moon = add_orbiting(registry, "Moon", KeplerOrbit::circular(0.01, kTwoPi / 40.0));

    REQUIRE(registry.set_orbit_center(planet, star));
    REQUIRE(registry.set_orbit_center(moon, planet));

    // t = 100: planet a quarter around, moon two and a half turns around
    const u32 updated = OrbitPropagator::propagate_all(registry, 100.0);
    CHECK(updated == 2);

    check_vec(registry.find(planet)->position, {100.0, 1.0, 0.0});
    check_vec(registry.find(moon)->position, {100.0 - 0.01, 1.0, 0.0});
}

TEST_CASE("Single-body propagation resolves the parent chain at the same time")
{
    BodyRegistry registry;
    const BodyId bary = add_static(registry, "Barycenter", {5.0, 5.0, 5.0});
    const BodyId star = add_orbiting(registry, "Star", KeplerOrbit::circular(2.0, kTwoPi / 1000.0));
    const BodyId planet = add_orbiting(registry, "Planet", KeplerOrbit::circular(0.5, kTwoPi / 100.0));
    REQUIRE(registry.set_orbit_center(star, bary));
    REQUIRE(registry.set_orbit_center(planet, star));

    // No prior batch pass: ancestors are stale
    const auto direct = OrbitPropagator::propagate(registry, planet, 250.0);
    REQUIRE(direct.has_value());

    OrbitPropagator::propagate_all(registry, 250.0);
    check_vec(*direct, registry.find(planet)->position);
}

TEST_CASE("Parents are ordered before children regardless of insertion order")
{
    BodyRegistry registry;
    const BodyId moon = add_orbiting(registry, "Moon", KeplerOrbit::circular(0.01, 1e-3));
    const BodyId planet = add_orbiting(registry, "Planet", KeplerOrbit::circular(1.0, 1e-5));
    const BodyId star = add_static(registry, "Star", {0.0, 0.0, 0.0});

    REQUIRE(registry.set_orbit_center(moon, planet));
    REQUIRE(registry.set_orbit_center(planet, star));

    const auto& order = registry.propagation_order();
    const auto pos = [&order](BodyId id) {
        return std::find(order.begin(), order.end(), id) - order.begin();
    };
    CHECK(pos(star) < pos(planet));
    CHECK(pos(planet) < pos(moon));
    CHECK(registry.depth(moon) == 2);
}

TEST_CASE("OrbitCenter links that would form a cycle are rejected")
{
    BodyRegistry registry;
    const BodyId a = add_orbiting(registry, "A", KeplerOrbit::circular(1.0, 1e-6));
    const BodyId b = add_orbiting(registry, "B", KeplerOrbit::circular(1.0, 1e-6));
    const BodyId c = add_orbiting(registry, "C", KeplerOrbit::circular(1.0, 1e-6));

    REQUIRE(registry.set_orbit_center(b, a));
    REQUIRE(registry.set_orbit_center(c, b));

    CHECK_FALSE(registry.set_orbit_center(a, c));
    CHECK_FALSE(registry.set_orbit_center(a, a));
    CHECK_FALSE(registry.set_orbit_center(a, 42));
    CHECK_FALSE(registry.find(a)->orbit_center.has_value());
}

TEST_CASE("Unknown bodies and bodies without elements yield no position")
{
    BodyRegistry registry;
    const BodyId star = add_static(registry, "Star", {1.0, 2.0, 3.0});

    CHECK_FALSE(OrbitPropagator::propagate(registry, 99, 0.0).has_value());
    CHECK_FALSE(OrbitPropagator::propagate(registry, star, 0.0).has_value());

    OrbitPropagator::propagate_all(registry, 1000.0);
    check_vec(registry.find(star)->position, {1.0, 2.0, 3.0});
}

TEST_CASE("System propagation leaves other systems untouched")
{
    BodyRegistry registry;
    const BodyId local = add_orbiting(registry, "Near", KeplerOrbit::circular(1.0, kTwoPi / 100.0), 0);
    const BodyId remote = add_orbiting(registry, "Far", KeplerOrbit::circular(1.0, kTwoPi / 100.0), 1);

    OrbitPropagator::propagate_all(registry, 0.0);
    const u32 updated = OrbitPropagator::propagate_system(registry, 0, 25.0);

    CHECK(updated == 1);
    check_vec(registry.find(local)->position, {0.0, 1.0, 0.0});
    check_vec(registry.find(remote)->position, {1.0, 0.0, 0.0});
    CHECK(registry.count_in_system(1) == 1);
    CHECK(registry.bodies_in_system(0) == std::vector<BodyId>{local});
}
