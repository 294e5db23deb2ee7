/// @file system_populator.cpp
/// @brief Catalog-to-body population of star systems.

#include "universe/system_populator.hpp"

#include "astro/ephemeris.hpp"
#include "astro/kepler_orbit.hpp"
#include "astro/space_coordinates.hpp"
#include "core/logger.hpp"
#include "universe/pcg_rng.hpp"

#include <algorithm>

namespace orrery::universe
{

namespace
{
    using namespace astro_constants;

    // Orbit line colours (RGBA)
    const Vec4f kRockyColour{0.62f, 0.55f, 0.45f, 0.5f};
    const Vec4f kIceGiantColour{0.45f, 0.70f, 0.90f, 0.5f};
    const Vec4f kGasGiantColour{0.85f, 0.72f, 0.50f, 0.5f};
    const Vec4f kStarColour{1.0f, 0.9f, 0.6f, 0.4f};

    Vec4f colour_for(PlanetType type)
    {
        switch (type)
        {
            case PlanetType::Rocky:    return kRockyColour;
            case PlanetType::IceGiant: return kIceGiantColour;
            case PlanetType::GasGiant: return kGasGiantColour;
        }
        return kRockyColour;
    }

    rendering::OrbitPath path_with_colour(const Vec4f& colour)
    {
        rendering::OrbitPath path;
        path.colour = colour;
        return path;
    }

    // The Moon's mean elements (ecliptic, J2000)
    constexpr f64 kMoonSemiMajorAxisAu = 0.00257;
    constexpr f64 kMoonEccentricity = 0.0549;
    constexpr f64 kMoonInclinationDeg = 5.145;
    constexpr f64 kMoonPeriodDays = 27.321661;
    constexpr f64 kMoonMassEarth = 0.0123;
    constexpr f64 kMoonRadiusEarth = 0.273;
}

SystemPopulator::SystemPopulator(BodyRegistry& registry, u64 seed)
    : m_registry(registry)
    , m_seed(seed)
{
}

// -----------------------------------------------------------------
// Catalog system
// -----------------------------------------------------------------

StarSystem SystemPopulator::populate(const CatalogSystem& record, SystemId id)
{
    const Vec3d position_ly = record.position_ly();
    const astro::SpaceCoordinates origin = astro::galactic_to_space(position_ly);

    std::vector<BodyId> star_ids;
    star_ids.reserve(record.stars.size());
    for (const auto& star : record.stars)
    {
        star_ids.push_back(spawn_star(star, id, origin));
    }

    for (const auto& binary : record.binaries)
    {
        if (binary.primary >= star_ids.size() || binary.secondary >= star_ids.size()
            || binary.primary == binary.secondary)
        {
            ORR_WARN("SystemPopulator: '{}' binary '{}' references invalid star indices {}/{}",
                     record.name, binary.label, binary.primary, binary.secondary);
            continue;
        }
        spawn_binary(record, binary, star_ids, id, origin);
    }

    u32 confirmed = 0;
    for (std::size_t i = 0; i < record.stars.size(); ++i)
    {
        confirmed += spawn_catalog_planets(record.stars[i], star_ids[i], id);
        spawn_procedural(record.stars[i], star_ids[i], id);
    }

    StarSystem system{
        .id = id,
        .name = record.name,
        .galactic_position_ly = position_ly,
        .bounding_radius_au = bounding_radius(id),
        .state = SimulationState::Dormant,
        .body_count = m_registry.count_in_system(id),
        .star_type = record.stars.empty() ? std::string{} : record.stars.front().spectral_type,
    };

    ORR_INFO("SystemPopulator: '{}' at {:.2f} ly: {} star(s), {} confirmed planet(s), {} bodies",
             system.name, record.distance_ly, record.stars.size(), confirmed, system.body_count);
    return system;
}

BodyId SystemPopulator::spawn_star(const CatalogStar& star, SystemId system, const astro::SpaceCoordinates& origin)
{
    return m_registry.add_body(Body{
        .name = star.name,
        .kind = BodyKind::Star,
        .system = system,
        .mass_kg = star.mass_solar * kSolarMassKg,
        .radius_km = star.radius_solar * kSolarRadiusKm,
        .is_real = true,
        .position = origin,
    });
}

// -----------------------------------------------------------------
// Binary pair around a barycenter
//
// a₁ = a · m₂ / (m₁ + m₂)     (primary)
// a₂ = a · m₁ / (m₁ + m₂)     (secondary)
// ω₁ = ω₂ + π                  (opposite phase)
// -----------------------------------------------------------------

void SystemPopulator::spawn_binary(const CatalogSystem& record, const BinaryOrbit& binary,
                                   const std::vector<BodyId>& star_ids, SystemId system,
                                   const astro::SpaceCoordinates& origin)
{
    const CatalogStar& primary = record.stars[binary.primary];
    const CatalogStar& secondary = record.stars[binary.secondary];
    const f64 total_mass = primary.mass_solar + secondary.mass_solar;

    const BodyId barycenter = m_registry.add_body(Body{
        .name = binary.label + " barycenter",
        .kind = BodyKind::Barycenter,
        .system = system,
        .mass_kg = total_mass * kSolarMassKg,
        .is_real = true,
        .position = origin,
    });

    const f64 n = astro::KeplerOrbit::mean_motion_from_period(binary.period_years * kDaysPerYear * kSecondsPerDay);
    const f64 inclination = binary.inclination_deg * kDegToRad;
    const f64 arg_periastron = binary.arg_periastron_deg * kDegToRad;

    const auto primary_orbit = astro::KeplerOrbit::create(binary.eccentricity,
        binary.semi_major_axis_au * secondary.mass_solar / total_mass,
        inclination, 0.0, arg_periastron + kPi, 0.0, n);
    const auto secondary_orbit = astro::KeplerOrbit::create(binary.eccentricity,
        binary.semi_major_axis_au * primary.mass_solar / total_mass,
        inclination, 0.0, arg_periastron, 0.0, n);

    if (!primary_orbit || !secondary_orbit)
    {
        ORR_WARN("SystemPopulator: '{}' binary '{}' has unsupported elements (e={}, a={}); stars left static",
                 record.name, binary.label, binary.eccentricity, binary.semi_major_axis_au);
        return;
    }

    Body* a = m_registry.find(star_ids[binary.primary]);
    a->orbit = primary_orbit;
    a->orbit_path = path_with_colour(kStarColour);
    m_registry.set_orbit_center(a->id, barycenter);

    Body* b = m_registry.find(star_ids[binary.secondary]);
    b->orbit = secondary_orbit;
    b->orbit_path = path_with_colour(kStarColour);
    m_registry.set_orbit_center(b->id, barycenter);
}

// -----------------------------------------------------------------
// Confirmed planets: published a, e, period; unknown angles drawn
// from a per-planet seed so repeated runs agree
// -----------------------------------------------------------------

u32 SystemPopulator::spawn_catalog_planets(const CatalogStar& star, BodyId host, SystemId system)
{
    u32 spawned = 0;
    for (const auto& planet : star.planets)
    {
        PcgRng rng(mix_seed(m_seed, stable_hash(planet.name)));
        const f64 node = rng.next_in_range(0.0, kTwoPi);
        const f64 arg_periapsis = rng.next_in_range(0.0, kTwoPi);
        const f64 mean_anomaly = rng.next_in_range(0.0, kTwoPi);

        const auto orbit = astro::KeplerOrbit::create(planet.eccentricity, planet.semi_major_axis_au,
            0.0, node, arg_periapsis, mean_anomaly,
            astro::KeplerOrbit::mean_motion_from_period(planet.period_days * kSecondsPerDay));

        if (!orbit)
        {
            ORR_WARN("SystemPopulator: Skipping '{}': unsupported orbit (e={}, a={} AU)",
                     planet.name, planet.eccentricity, planet.semi_major_axis_au);
            continue;
        }

        const BodyId id = m_registry.add_body(Body{
            .name = planet.name,
            .kind = BodyKind::Planet,
            .system = system,
            .mass_kg = planet.estimated_mass_earth() * kEarthMassKg,
            .radius_km = planet.estimated_radius_earth() * kEarthRadiusKm,
            .is_real = true,
            .orbit = orbit,
            .orbit_path = path_with_colour(colour_for(planet.planet_type())),
        });
        m_registry.set_orbit_center(id, host);
        ++spawned;
    }
    return spawned;
}

// -----------------------------------------------------------------
// Procedural fill around one star
// -----------------------------------------------------------------

void SystemPopulator::spawn_procedural(const CatalogStar& star, BodyId host, SystemId system)
{
    std::vector<f64> existing_orbits;
    std::vector<std::string> existing_names;
    existing_orbits.reserve(star.planets.size());
    existing_names.reserve(star.planets.size());
    for (const auto& planet : star.planets)
    {
        existing_orbits.push_back(planet.semi_major_axis_au);
        existing_names.push_back(planet.name);
    }

    const SystemArchitecture arch = ProceduralSystemGenerator::generate_architecture(
        star.name, star.luminosity_solar, static_cast<u32>(star.planets.size()), existing_orbits, m_seed,
        existing_names);

    auto spawn_planet = [&](const ProceduralPlanet& planet) {
        const BodyId id = m_registry.add_body(Body{
            .name = planet.name,
            .kind = BodyKind::Planet,
            .system = system,
            .mass_kg = planet.mass_kg(),
            .radius_km = planet.radius_km(),
            .is_real = false,
            .orbit = planet.to_kepler_orbit(),
            .orbit_path = path_with_colour(colour_for(planet.type)),
        });
        m_registry.set_orbit_center(id, host);
    };

    std::for_each(arch.rocky_planets.begin(), arch.rocky_planets.end(), spawn_planet);
    std::for_each(arch.giants.begin(), arch.giants.end(), spawn_planet);

    if (!m_expand_small_bodies)
    {
        return;
    }
    if (arch.asteroid_belt)
    {
        spawn_small_bodies(ProceduralSystemGenerator::expand_asteroid_belt(*arch.asteroid_belt, star.name, system, m_seed),
                           BodyKind::Asteroid, host, system);
    }
    if (arch.cometary_cloud)
    {
        spawn_small_bodies(ProceduralSystemGenerator::expand_cometary_cloud(*arch.cometary_cloud, star.name, system, m_seed),
                           BodyKind::Comet, host, system);
    }
}

void SystemPopulator::spawn_small_bodies(const std::vector<SmallBody>& members, BodyKind kind,
                                         BodyId host, SystemId system)
{
    rendering::OrbitPath hidden;
    hidden.visible = false;

    for (const auto& member : members)
    {
        const BodyId id = m_registry.add_body(Body{
            .name = member.name,
            .kind = kind,
            .system = system,
            .mass_kg = member.mass_kg,
            .radius_km = member.radius_km,
            .is_real = false,
            .orbit = member.orbit,
            .orbit_path = hidden,
        });
        m_registry.set_orbit_center(id, host);
    }
}

f64 SystemPopulator::bounding_radius(SystemId system) const
{
    f64 radius = 1.0;
    for (const auto& body : m_registry.bodies())
    {
        if (body.system == system && body.orbit)
        {
            radius = std::max(radius, body.orbit->apoapsis());
        }
    }
    return radius;
}

// -----------------------------------------------------------------
// Sol: ephemeris elements for the chosen epoch, no procedural fill
// -----------------------------------------------------------------

StarSystem SystemPopulator::populate_sol(SystemId id, f64 epoch_jd)
{
    const BodyId sun = m_registry.add_body(Body{
        .name = "Sol",
        .kind = BodyKind::Star,
        .system = id,
        .mass_kg = kSolarMassKg,
        .radius_km = kSolarRadiusKm,
        .is_real = true,
        .position = astro::SpaceCoordinates{0.0},
    });

    std::optional<BodyId> earth;
    for (const auto& planet : astro::Ephemeris::planets())
    {
        const PlanetType type = (planet.mass_earth > 50.0) ? PlanetType::GasGiant
                              : (planet.mass_earth > 10.0) ? PlanetType::IceGiant
                              : PlanetType::Rocky;

        const BodyId planet_id = m_registry.add_body(Body{
            .name = std::string{planet.name},
            .kind = BodyKind::Planet,
            .system = id,
            .mass_kg = planet.mass_earth * kEarthMassKg,
            .radius_km = planet.radius_earth * kEarthRadiusKm,
            .is_real = true,
            .orbit = astro::Ephemeris::orbit_at(planet, epoch_jd),
            .orbit_path = path_with_colour(colour_for(type)),
        });
        m_registry.set_orbit_center(planet_id, sun);

        if (planet.name == "Earth")
        {
            earth = planet_id;
        }
    }

    if (earth)
    {
        const BodyId moon = m_registry.add_body(Body{
            .name = "Moon",
            .kind = BodyKind::Moon,
            .system = id,
            .mass_kg = kMoonMassEarth * kEarthMassKg,
            .radius_km = kMoonRadiusEarth * kEarthRadiusKm,
            .is_real = true,
            .orbit = astro::KeplerOrbit{
                .eccentricity = kMoonEccentricity,
                .semi_major_axis = kMoonSemiMajorAxisAu,
                .inclination = kMoonInclinationDeg * kDegToRad,
                .mean_motion = astro::KeplerOrbit::mean_motion_from_period(kMoonPeriodDays * kSecondsPerDay),
            },
            .orbit_path = rendering::OrbitPath{},
        });
        m_registry.set_orbit_center(moon, *earth);
    }

    StarSystem system{
        .id = id,
        .name = "Sol",
        .galactic_position_ly = Vec3d{0.0},
        .bounding_radius_au = bounding_radius(id),
        .state = SimulationState::Dormant,
        .body_count = m_registry.count_in_system(id),
        .star_type = "G2V",
    };

    ORR_INFO("SystemPopulator: 'Sol' with {} bodies at JD {:.1f}", system.body_count, epoch_jd);
    return system;
}

} // namespace orrery::universe
