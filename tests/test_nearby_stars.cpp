/// @file test_nearby_stars.cpp
/// @brief Unit tests for orrery::universe::NearbyStarCatalog and CatalogPlanet.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/space_coordinates.hpp"
#include "core/types.hpp"
#include "universe/nearby_stars.hpp"

#include <cmath>

using namespace orrery;
using namespace orrery::universe;

// =================================================================
// Built-in catalog
// =================================================================

TEST_CASE("Built-in catalog holds the six nearby systems")
{
    const auto catalog = NearbyStarCatalog::load_builtin();
    CHECK(catalog.size() == 6);

    for (const char* name : {"Proxima Centauri", "Alpha Centauri", "Barnard's Star",
                             "Sirius", "Epsilon Eridani", "Tau Ceti"})
    {
        CHECK_MESSAGE(catalog.find_by_name(name) != nullptr, name);
    }
}

TEST_CASE("Lookup ignores case and matches star names")
{
    const auto catalog = NearbyStarCatalog::load_builtin();

    const auto* lower = catalog.find_by_name("tau ceti");
    REQUIRE(lower != nullptr);
    CHECK(lower->name == "Tau Ceti");

    const auto* by_star = catalog.find_by_name("Sirius B");
    REQUIRE(by_star != nullptr);
    CHECK(by_star->name == "Sirius");

    const auto* by_component = catalog.find_by_name("ALPHA CENTAURI A");
    REQUIRE(by_component != nullptr);
    CHECK(by_component->name == "Alpha Centauri");
}

TEST_CASE("Unknown names return null")
{
    const auto catalog = NearbyStarCatalog::load_builtin();
    CHECK(catalog.find_by_name("Vega") == nullptr);
    CHECK(catalog.find_by_name("") == nullptr);
    CHECK(catalog.find_by_name("Tau Cet") == nullptr);
}

TEST_CASE("Proxima Centauri carries its confirmed planet")
{
    const auto catalog = NearbyStarCatalog::load_builtin();
    const auto* proxima = catalog.find_by_name("Proxima Centauri");
    REQUIRE(proxima != nullptr);
    REQUIRE(proxima->stars.size() == 1);

    const auto& star = proxima->stars.front();
    CHECK(star.luminosity_solar == doctest::Approx(0.0017));
    REQUIRE(star.planets.size() == 1);
    CHECK(star.planets.front().name == "Proxima Centauri b");
    CHECK(star.planets.front().semi_major_axis_au == doctest::Approx(0.0485));
}

TEST_CASE("Binary systems describe their mutual orbit")
{
    const auto catalog = NearbyStarCatalog::load_builtin();

    for (const char* name : {"Alpha Centauri", "Sirius"})
    {
        const auto* system = catalog.find_by_name(name);
        REQUIRE(system != nullptr);
        REQUIRE(system->stars.size() == 2);
        REQUIRE(system->binaries.size() == 1);

        const auto& binary = system->binaries.front();
        CHECK(binary.primary < system->stars.size());
        CHECK(binary.secondary < system->stars.size());
        CHECK(binary.primary != binary.secondary);
        CHECK(binary.semi_major_axis_au > 0.0);
        CHECK(binary.eccentricity >= 0.0);
        CHECK(binary.eccentricity < 1.0);
    }
}

TEST_CASE("Tau Ceti planets are listed inside out")
{
    const auto catalog = NearbyStarCatalog::load_builtin();
    const auto* tau = catalog.find_by_name("Tau Ceti");
    REQUIRE(tau != nullptr);

    const auto& planets = tau->stars.front().planets;
    REQUIRE(planets.size() == 4);
    for (std::size_t i = 1; i < planets.size(); ++i)
    {
        CHECK(planets[i - 1].semi_major_axis_au < planets[i].semi_major_axis_au);
    }
}

TEST_CASE("Catalog positions sit at their published distance")
{
    const auto catalog = NearbyStarCatalog::load_builtin();
    for (const auto& system : catalog.systems())
    {
        const Vec3d p = system.position_ly();
        CHECK(glm::length(p) == doctest::Approx(system.distance_ly));
    }
}

TEST_CASE("add_system appends to the catalog")
{
    NearbyStarCatalog catalog;
    CHECK(catalog.size() == 0);
    CHECK(catalog.find_by_name("Nowhere") == nullptr);

    catalog.add_system(CatalogSystem{
        .name = "Nowhere",
        .distance_ly = 1.0,
        .stars = {CatalogStar{.name = "Nowhere A"}},
    });

    CHECK(catalog.size() == 1);
    CHECK(catalog.find_by_name("nowhere a") != nullptr);
}

// =================================================================
// Equatorial conversion
// =================================================================

TEST_CASE("Equatorial axes map onto the Cartesian frame")
{
    const Vec3d vernal = astro::equatorial_to_cartesian(0.0, 0.0, 2.0);
    CHECK(vernal.x == doctest::Approx(2.0));
    CHECK(vernal.y == doctest::Approx(0.0));
    CHECK(vernal.z == doctest::Approx(0.0));

    const Vec3d six_hours = astro::equatorial_to_cartesian(90.0, 0.0, 1.0);
    CHECK(six_hours.x == doctest::Approx(0.0));
    CHECK(six_hours.y == doctest::Approx(1.0));

    const Vec3d pole = astro::equatorial_to_cartesian(123.0, 90.0, 3.0);
    CHECK(pole.z == doctest::Approx(3.0));
}

TEST_CASE("Light-year and AU conversions are inverse")
{
    CHECK(astro::light_years_to_au(1.0) == doctest::Approx(63241.077));
    CHECK(astro::au_to_light_years(astro::light_years_to_au(4.24)) == doctest::Approx(4.24));
}

// =================================================================
// Mass-radius estimation
// =================================================================

TEST_CASE("Published values are returned unchanged")
{
    const CatalogPlanet planet{
        .name = "Known",
        .mass_earth = 1.17,
        .radius_earth = 1.1,
        .type = CatalogPlanetType::Rocky,
    };
    CHECK(planet.estimated_mass_earth() == doctest::Approx(1.17));
    CHECK(planet.estimated_radius_earth() == doctest::Approx(1.1));
}

TEST_CASE("Rocky mass scales as radius to the 3.7")
{
    const CatalogPlanet planet{.name = "Rocky", .radius_earth = 1.5, .type = CatalogPlanetType::Rocky};
    const f64 mass = planet.estimated_mass_earth();
    CHECK(mass == doctest::Approx(std::pow(1.5, 3.7)));
    CHECK(mass > 2.5);
    CHECK(mass < 4.5);
}

TEST_CASE("Inverse relations recover the radius from mass")
{
    const CatalogPlanet rocky{.name = "R", .mass_earth = 8.0, .type = CatalogPlanetType::SuperEarth};
    CHECK(rocky.estimated_radius_earth() == doctest::Approx(std::pow(8.0, 1.0 / 3.7)));

    const CatalogPlanet neptune{.name = "N", .mass_earth = 17.0, .type = CatalogPlanetType::NeptuneLike};
    CHECK(neptune.estimated_radius_earth() == doctest::Approx(std::pow(17.0, 1.0 / 2.5)));

    const CatalogPlanet unknown{.name = "U", .mass_earth = 8.0, .type = CatalogPlanetType::Unknown};
    CHECK(unknown.estimated_radius_earth() == doctest::Approx(2.0));
}

TEST_CASE("Gas giants saturate at a Jovian radius")
{
    const CatalogPlanet jupiter{.name = "J", .mass_earth = 318.0, .type = CatalogPlanetType::GasGiant};
    CHECK(jupiter.estimated_radius_earth() == doctest::Approx(11.2));

    const CatalogPlanet puffy{.name = "P", .radius_earth = 14.0, .type = CatalogPlanetType::GasGiant};
    CHECK(puffy.estimated_mass_earth() == doctest::Approx(300.0));

    const auto catalog = NearbyStarCatalog::load_builtin();
    const auto* eps = catalog.find_by_name("Epsilon Eridani");
    REQUIRE(eps != nullptr);
    const auto& b = eps->stars.front().planets.front();
    CHECK(b.estimated_mass_earth() == doctest::Approx(209.0));
    CHECK(b.estimated_radius_earth() == doctest::Approx(11.2));
    CHECK(b.planet_type() == PlanetType::GasGiant);
}

TEST_CASE("Missing mass and radius fall back to type defaults")
{
    const CatalogPlanet rocky{.name = "R", .type = CatalogPlanetType::Rocky};
    CHECK(rocky.estimated_mass_earth() == doctest::Approx(1.0));
    CHECK(rocky.estimated_radius_earth() == doctest::Approx(1.0));

    const CatalogPlanet super{.name = "S", .type = CatalogPlanetType::SuperEarth};
    CHECK(super.estimated_mass_earth() == doctest::Approx(3.0));
    CHECK(super.estimated_radius_earth() == doctest::Approx(1.5));

    const CatalogPlanet neptune{.name = "N", .type = CatalogPlanetType::NeptuneLike};
    CHECK(neptune.estimated_mass_earth() == doctest::Approx(15.0));
    CHECK(neptune.estimated_radius_earth() == doctest::Approx(4.0));
    CHECK(neptune.planet_type() == PlanetType::IceGiant);

    const CatalogPlanet unknown{.name = "U"};
    CHECK(unknown.estimated_mass_earth() == doctest::Approx(1.0));
    CHECK(unknown.planet_type() == PlanetType::Rocky);
}
