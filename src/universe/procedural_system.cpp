/// @file procedural_system.cpp
/// @brief Planet placement, belt/cloud layout and small-body expansion.

#include "universe/procedural_system.hpp"

#include "core/logger.hpp"
#include "universe/pcg_rng.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace orrery::universe
{

namespace
{
    using namespace astro_constants;

    // Independent streams per feature keep each feature's draws stable
    // when another feature changes.
    constexpr u64 kStreamRocky = 1;
    constexpr u64 kStreamGiants = 2;
    constexpr u64 kStreamBelt = 3;
    constexpr u64 kStreamCloud = 4;
    constexpr u64 kStreamMembers = 5;

    constexpr u64 kBeltSalt = 0x9E3779B97F4A7C15ULL;
    constexpr u64 kCloudSalt = 0x517CC1B727220A95ULL;

    constexpr f64 kSpacingJitter = 0.15;
    constexpr f64 kInnerZoneMinAu = 0.3;
    constexpr f64 kInnerZoneFrostFraction = 0.95;
    constexpr f64 kOuterZoneFrostFactor = 1.2;
    constexpr f64 kOuterZoneMaxAu = 30.0;
    constexpr f64 kBeltClearanceAu = 1.0;
    constexpr f64 kBeltGapAu = 0.3;

    constexpr f64 kAsteroidDensity = 2500.0;    // kg/m³
    constexpr f64 kCometDensity = 500.0;

    struct Placed
    {
        f64 semi_major_axis;
        f64 separation;
    };

    bool is_too_close(f64 a, std::span<const Placed> others)
    {
        return std::any_of(others.begin(), others.end(), [a](const Placed& other) {
            return std::abs(a - other.semi_major_axis) < other.separation;
        });
    }

    // Step outward until clear of every orbit. The step scales with the
    // separation being violated, so tight inner systems keep tight steps.
    f64 nudge_outward(f64 a, std::span<const Placed> others, PcgRng& rng)
    {
        while (true)
        {
            f64 violated = 0.0;
            for (const auto& other : others)
            {
                if (std::abs(a - other.semi_major_axis) < other.separation)
                {
                    violated = std::max(violated, other.separation);
                }
            }
            if (violated <= 0.0)
            {
                return a;
            }
            a += violated * rng.next_in_range(0.5, 1.5);
        }
    }

    std::string planet_name(std::string_view star_name, u32 index)
    {
        // index 0 -> 'b'; the star itself is implicitly 'a'
        constexpr u32 kLetters = 'z' - 'b' + 1;
        if (index < kLetters)
        {
            return fmt::format("{} {}", star_name, static_cast<char>('b' + index));
        }
        return fmt::format("{} p{}", star_name, index + 1);
    }

    f64 sphere_mass_kg(f64 radius_km, f64 density)
    {
        const f64 r_m = radius_km * 1000.0;
        return (4.0 / 3.0) * kPi * r_m * r_m * r_m * density;
    }

    u64 zone_seed(u64 seed, SystemId system, const DebrisZone& zone, u64 salt)
    {
        u64 h = mix_seed(seed, salt);
        h = mix_seed(h, system);
        h = mix_seed(h, zone.count);
        return mix_seed(h, float_bits(zone.inner_au) ^ float_bits(zone.outer_au));
    }

    f64 mean_motion_for_axis(f64 semi_major_axis_au)
    {
        const f64 days = ProceduralSystemGenerator::period_days_from_axis(semi_major_axis_au);
        return astro::KeplerOrbit::mean_motion_from_period(days * kSecondsPerDay);
    }
}

std::string_view to_string(PlanetType type)
{
    switch (type)
    {
        case PlanetType::Rocky:    return "Rocky";
        case PlanetType::IceGiant: return "IceGiant";
        case PlanetType::GasGiant: return "GasGiant";
    }
    return "Unknown";
}

// -----------------------------------------------------------------
// ProceduralPlanet conversions
// -----------------------------------------------------------------

astro::KeplerOrbit ProceduralPlanet::to_kepler_orbit() const
{
    return astro::KeplerOrbit{
        .eccentricity = eccentricity,
        .semi_major_axis = semi_major_axis,
        .inclination = inclination,
        .longitude_ascending_node = longitude_ascending_node,
        .argument_of_periapsis = argument_of_periapsis,
        .mean_anomaly_at_epoch = mean_anomaly_at_epoch,
        .mean_motion = astro::KeplerOrbit::mean_motion_from_period(period_days * kSecondsPerDay),
    };
}

f64 ProceduralPlanet::mass_kg() const
{
    return mass_earth * kEarthMassKg;
}

f64 ProceduralPlanet::radius_km() const
{
    return radius_earth * kEarthRadiusKm;
}

// -----------------------------------------------------------------
// Frost line
//
// d_frost = 4.85 · √(L / L☉)  AU
// -----------------------------------------------------------------

f64 ProceduralSystemGenerator::calculate_frost_line(f64 luminosity_solar)
{
    if (luminosity_solar <= 0.0)
    {
        return 0.0;
    }
    return kFrostLineCoefficient * std::sqrt(luminosity_solar);
}

f64 ProceduralSystemGenerator::period_days_from_axis(f64 semi_major_axis_au)
{
    return std::pow(semi_major_axis_au, 1.5) * kDaysPerYear;
}

// -----------------------------------------------------------------
// Architecture
// -----------------------------------------------------------------

SystemArchitecture ProceduralSystemGenerator::generate_architecture(std::string_view star_name,
                                                                    f64 luminosity_solar,
                                                                    u32 existing_count,
                                                                    std::span<const f64> existing_orbits_au,
                                                                    u64 seed,
                                                                    std::span<const std::string> existing_names)
{
    SystemArchitecture arch;
    arch.frost_line_au = calculate_frost_line(luminosity_solar);
    const f64 frost = arch.frost_line_au;

    const u64 star_seed = mix_seed(seed, stable_hash(star_name));

    std::vector<Placed> existing;
    existing.reserve(existing_orbits_au.size());
    for (const f64 a : existing_orbits_au)
    {
        existing.push_back({a, kRockySeparationAu});
    }

    // -----------------------------------------------------------------
    // Allotment: inner (rocky) 2..4, outer (giants) the rest, at most 3
    // -----------------------------------------------------------------
    PcgRng rocky_rng(star_seed, kStreamRocky);

    const u32 needed = (existing_count < kTargetPlanetCount) ? kTargetPlanetCount - existing_count : 0;
    const u32 inner_count = rocky_rng.next_int(std::min(2u, needed), std::min(4u, needed));
    const u32 outer_count = std::min(needed - inner_count, 3u);

    // Letters continue after the known planets, skipping names already in use
    u32 name_index = existing_count;
    auto next_name = [&]() {
        std::string name = planet_name(star_name, name_index++);
        while (std::find(existing_names.begin(), existing_names.end(), name) != existing_names.end())
        {
            name = planet_name(star_name, name_index++);
        }
        return name;
    };

    // -----------------------------------------------------------------
    // Rocky planets: even spacing over [inner_min, 0.95 d_frost]
    // -----------------------------------------------------------------
    std::vector<Placed> placed;

    if (inner_count > 0 && frost > 0.0)
    {
        const f64 inner_max = kInnerZoneFrostFraction * frost;
        const f64 inner_min = std::min(kInnerZoneMinAu, 0.25 * inner_max);
        const f64 span = inner_max - inner_min;
        const f64 placed_separation = std::min(kRockySeparationAu,
                                               0.5 * span / static_cast<f64>(inner_count));

        for (u32 k = 0; k < inner_count; ++k)
        {
            const f64 base = inner_min + span * (static_cast<f64>(k) + 0.5) / static_cast<f64>(inner_count);
            f64 a = base * (1.0 + rocky_rng.next_in_range(-kSpacingJitter, kSpacingJitter));

            std::vector<Placed> obstacles = existing;
            obstacles.insert(obstacles.end(), placed.begin(), placed.end());
            a = nudge_outward(a, obstacles, rocky_rng);

            ProceduralPlanet planet{
                .name = next_name(),
                .semi_major_axis = a,
                .eccentricity = rocky_rng.next_in_range(0.0, 0.15),
                .inclination = rocky_rng.next_in_range(-0.05, 0.05),
                .longitude_ascending_node = rocky_rng.next_in_range(0.0, kTwoPi),
                .argument_of_periapsis = rocky_rng.next_in_range(0.0, kTwoPi),
                .mean_anomaly_at_epoch = rocky_rng.next_in_range(0.0, kTwoPi),
                .period_days = period_days_from_axis(a),
                .mass_earth = rocky_rng.next_in_range(0.3, 3.5),
                .radius_earth = rocky_rng.next_in_range(0.7, 1.8),
                .type = PlanetType::Rocky,
            };

            placed.push_back({a, placed_separation});
            arch.rocky_planets.push_back(std::move(planet));
        }
    }

    // -----------------------------------------------------------------
    // Giants: logarithmic spacing over [1.2 d_frost, max(30, 2.5 · 1.2 d_frost)]
    //
    // a_k = a_min · (a_max / a_min)^((k + 0.5) / count)
    // -----------------------------------------------------------------
    if (outer_count > 0 && frost > 0.0)
    {
        PcgRng giant_rng(star_seed, kStreamGiants);

        const f64 outer_min = kOuterZoneFrostFactor * frost;
        const f64 outer_max = std::max(kOuterZoneMaxAu, 2.5 * outer_min);

        // Giants keep the wide separation from everything already in the system
        std::vector<Placed> obstacles;
        for (const f64 a : existing_orbits_au)
        {
            obstacles.push_back({a, kGiantSeparationAu});
        }
        for (const auto& rocky : arch.rocky_planets)
        {
            obstacles.push_back({rocky.semi_major_axis, kGiantSeparationAu});
        }

        for (u32 k = 0; k < outer_count; ++k)
        {
            const f64 t = (static_cast<f64>(k) + 0.5) / static_cast<f64>(outer_count);
            const f64 base = outer_min * std::pow(outer_max / outer_min, t);
            f64 a = base * (1.0 + giant_rng.next_in_range(-kSpacingJitter, kSpacingJitter));

            while (is_too_close(a, obstacles))
            {
                a += giant_rng.next_in_range(0.3, 0.8);
            }

            const bool ice = (a < 3.0 * frost) && giant_rng.next_bool(0.6);

            ProceduralPlanet planet{
                .name = next_name(),
                .semi_major_axis = a,
                .eccentricity = giant_rng.next_in_range(0.0, 0.25),
                .inclination = giant_rng.next_in_range(-0.08, 0.08),
                .longitude_ascending_node = giant_rng.next_in_range(0.0, kTwoPi),
                .argument_of_periapsis = giant_rng.next_in_range(0.0, kTwoPi),
                .mean_anomaly_at_epoch = giant_rng.next_in_range(0.0, kTwoPi),
                .period_days = period_days_from_axis(a),
                .mass_earth = ice ? giant_rng.next_in_range(10.0, 25.0) : giant_rng.next_in_range(50.0, 400.0),
                .radius_earth = ice ? giant_rng.next_in_range(3.5, 4.5) : giant_rng.next_in_range(8.0, 12.0),
                .type = ice ? PlanetType::IceGiant : PlanetType::GasGiant,
            };

            obstacles.push_back({a, kGiantSeparationAu});
            arch.giants.push_back(std::move(planet));
        }
    }

    // -----------------------------------------------------------------
    // Asteroid belt around 2 d_frost, shifted past any planet near its center
    // -----------------------------------------------------------------
    PcgRng belt_rng(star_seed, kStreamBelt);
    if (belt_rng.next_bool(kBeltProbability) && frost > 0.0)
    {
        const f64 center = 2.0 * frost;
        const f64 width = 0.6 * center;
        f64 inner = 0.7 * center;
        f64 outer = 1.3 * center;

        std::vector<f64> all_orbits(existing_orbits_au.begin(), existing_orbits_au.end());
        for (const auto& p : arch.rocky_planets)
        {
            all_orbits.push_back(p.semi_major_axis);
        }
        for (const auto& p : arch.giants)
        {
            all_orbits.push_back(p.semi_major_axis);
        }

        // Planets within the clearance of the center push the whole belt past them
        std::vector<f64> near_orbits;
        std::copy_if(all_orbits.begin(), all_orbits.end(), std::back_inserter(near_orbits),
                     [center](f64 orbit) { return std::abs(orbit - center) < kBeltClearanceAu; });

        if (!near_orbits.empty())
        {
            const auto [lo, hi] = std::minmax_element(near_orbits.begin(), near_orbits.end());
            f64 mean = 0.0;
            for (const f64 orbit : near_orbits)
            {
                mean += orbit;
            }
            mean /= static_cast<f64>(near_orbits.size());

            bool outward = mean < center;
            if (!outward)
            {
                outer = *lo - kBeltGapAu;
                inner = std::max(outer - width, 0.1 * center);
                // No room inside the planets: fall back to beyond them
                outward = outer <= inner;
            }
            if (outward)
            {
                inner = *hi + kBeltGapAu;
                outer = inner + width;
            }
        }

        arch.asteroid_belt = DebrisZone{
            .inner_au = inner,
            .outer_au = outer,
            .count = belt_rng.next_int(50, 200),
            .inclination = belt_rng.next_in_range(0.0, 0.1),
        };
    }

    // -----------------------------------------------------------------
    // Cometary cloud: [max(20, 4 d_frost), max(50, 2.5 · inner)]
    // -----------------------------------------------------------------
    PcgRng cloud_rng(star_seed, kStreamCloud);
    if (cloud_rng.next_bool(kCloudProbability))
    {
        const f64 inner = std::max(20.0, 4.0 * frost);
        const f64 outer = std::max(50.0, 2.5 * inner);

        arch.cometary_cloud = DebrisZone{
            .inner_au = inner,
            .outer_au = outer,
            .count = cloud_rng.next_int(20, 80),
            .inclination = cloud_rng.next_in_range(0.0, kCloudMaxInclination),
        };
    }

    ORR_CORE_DEBUG("ProceduralSystemGenerator: '{}' L={:.4f} frost={:.3f} AU -> {} rocky, {} giants, belt={}, cloud={}",
                   star_name, luminosity_solar, frost,
                   arch.rocky_planets.size(), arch.giants.size(),
                   arch.asteroid_belt.has_value(), arch.cometary_cloud.has_value());

    return arch;
}

// -----------------------------------------------------------------
// Belt / cloud expansion
// -----------------------------------------------------------------

std::vector<SmallBody> ProceduralSystemGenerator::expand_asteroid_belt(const DebrisZone& belt,
                                                                       std::string_view star_name,
                                                                       SystemId system,
                                                                       u64 seed)
{
    PcgRng rng(zone_seed(seed, system, belt, kBeltSalt), kStreamMembers);

    std::vector<SmallBody> members;
    members.reserve(belt.count);

    for (u32 k = 0; k < belt.count; ++k)
    {
        const f64 a = rng.next_in_range(belt.inner_au, belt.outer_au);

        const astro::KeplerOrbit orbit{
            .eccentricity = rng.next_in_range(0.0, 0.2),
            .semi_major_axis = a,
            .inclination = belt.inclination + rng.next_in_range(-0.05, 0.05),
            .longitude_ascending_node = rng.next_in_range(0.0, kTwoPi),
            .argument_of_periapsis = rng.next_in_range(0.0, kTwoPi),
            .mean_anomaly_at_epoch = rng.next_in_range(0.0, kTwoPi),
            .mean_motion = mean_motion_for_axis(a),
        };

        AsteroidClass asteroid_class = AsteroidClass::V;
        if (rng.next_bool(0.3))
        {
            asteroid_class = AsteroidClass::M;
        }
        else if (rng.next_bool(0.6))
        {
            asteroid_class = AsteroidClass::S;
        }

        const f64 radius_km = rng.next_in_range(0.1, 50.0);

        members.push_back(SmallBody{
            .name = fmt::format("{} Asteroid {}", star_name, k + 1),
            .orbit = orbit,
            .radius_km = radius_km,
            .mass_kg = sphere_mass_kg(radius_km, kAsteroidDensity),
            .asteroid_class = asteroid_class,
        });
    }
    return members;
}

std::vector<SmallBody> ProceduralSystemGenerator::expand_cometary_cloud(const DebrisZone& cloud,
                                                                        std::string_view star_name,
                                                                        SystemId system,
                                                                        u64 seed)
{
    PcgRng rng(zone_seed(seed, system, cloud, kCloudSalt), kStreamMembers);

    std::vector<SmallBody> members;
    members.reserve(cloud.count);

    for (u32 k = 0; k < cloud.count; ++k)
    {
        const f64 a = rng.next_in_range(cloud.inner_au, cloud.outer_au);

        const astro::KeplerOrbit orbit{
            .eccentricity = rng.next_in_range(0.3, 0.9),
            .semi_major_axis = a,
            .inclination = rng.next_in_range(0.0, kCloudMaxInclination),
            .longitude_ascending_node = rng.next_in_range(0.0, kTwoPi),
            .argument_of_periapsis = rng.next_in_range(0.0, kTwoPi),
            .mean_anomaly_at_epoch = rng.next_in_range(0.0, kTwoPi),
            .mean_motion = mean_motion_for_axis(a),
        };

        const f64 radius_km = rng.next_in_range(0.5, 10.0);

        members.push_back(SmallBody{
            .name = fmt::format("{} Comet {}", star_name, k + 1),
            .orbit = orbit,
            .radius_km = radius_km,
            .mass_kg = sphere_mass_kg(radius_km, kCometDensity),
            .asteroid_class = std::nullopt,
        });
    }
    return members;
}

} // namespace orrery::universe
