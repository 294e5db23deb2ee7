/// @file ephemeris.cpp
/// @brief Mean anomaly and Kepler elements of the Sol planets at a given date.

#include "astro/ephemeris.hpp"

#include "astro/time_system.hpp"

#include <array>
#include <cctype>
#include <cmath>

namespace orrery::astro
{

namespace
{
    // JPL "Keplerian Elements for Approximate Positions of the Major Planets",
    // Table 1 (J2000 values, L rate per century). Earth is the Earth-Moon barycenter.
    constexpr std::array<PlanetElements, 8> kPlanets = {{
        // name       a            e            i             L              ϖ              Ω             L'               P (days)   M⊕       R⊕
        {"Mercury",  0.38709927, 0.20563593,  7.00497902, 252.25032350,  77.45779628,  48.33076593, 149472.67411175,    87.969,   0.0553, 0.383},
        {"Venus",    0.72333566, 0.00677672,  3.39467605, 181.97909950, 131.60246718,  76.67984255,  58517.81538729,   224.701,   0.815,  0.949},
        {"Earth",    1.00000261, 0.01671123, -0.00001531, 100.46457166, 102.93768193,   0.0,          35999.37244981,   365.256,   1.0,    1.0},
        {"Mars",     1.52371034, 0.09339410,  1.84969142,  -4.55343205, -23.94362959,  49.55953891,  19140.30268499,   686.980,   0.107,  0.532},
        {"Jupiter",  5.20288700, 0.04838624,  1.30439695,  34.39644051,  14.72847983, 100.47390909,   3034.74612775,  4332.589, 317.8,   11.21},
        {"Saturn",   9.53667594, 0.05386179,  2.48599187,  49.95424423,  92.59887831, 113.66242448,   1222.49362201, 10759.22,   95.2,    9.45},
        {"Uranus",  19.18916464, 0.04725744,  0.77263783, 313.23810451, 170.95427630,  74.01692503,    428.48202785, 30685.4,    14.5,    4.01},
        {"Neptune", 30.06992276, 0.00859048,  1.77004347, -55.12002969,  44.96476227, 131.78422574,    218.45945325, 60189.0,    17.1,    3.88},
    }};

    bool iequals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i])))
            {
                return false;
            }
        }
        return true;
    }

    f64 normalize_degrees(f64 deg)
    {
        deg = std::fmod(deg, 360.0);
        if (deg < 0.0)
        {
            deg += 360.0;
        }
        return deg;
    }
}

std::span<const PlanetElements> Ephemeris::planets()
{
    return kPlanets;
}

const PlanetElements* Ephemeris::find(std::string_view name)
{
    for (const auto& planet : kPlanets)
    {
        if (iequals(planet.name, name))
        {
            return &planet;
        }
    }
    return nullptr;
}

f64 Ephemeris::mean_anomaly_deg(const PlanetElements& planet, f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);
    const f64 mean_longitude = planet.mean_longitude + planet.mean_longitude_rate * t;
    return normalize_degrees(mean_longitude - planet.longitude_perihelion);
}

std::optional<f64> Ephemeris::mean_anomaly_deg(std::string_view name, f64 jd)
{
    const PlanetElements* planet = find(name);
    if (planet == nullptr)
    {
        return std::nullopt;
    }
    return mean_anomaly_deg(*planet, jd);
}

// -----------------------------------------------------------------
// ω = ϖ − Ω, M₀ = M(epoch), n = 2π / P
// -----------------------------------------------------------------

KeplerOrbit Ephemeris::orbit_at(const PlanetElements& planet, f64 epoch_jd)
{
    using namespace astro_constants;

    const f64 arg_periapsis = normalize_degrees(planet.longitude_perihelion - planet.longitude_ascending_node);

    return KeplerOrbit{
        .eccentricity = planet.eccentricity,
        .semi_major_axis = planet.semi_major_axis,
        .inclination = planet.inclination * kDegToRad,
        .longitude_ascending_node = planet.longitude_ascending_node * kDegToRad,
        .argument_of_periapsis = arg_periapsis * kDegToRad,
        .mean_anomaly_at_epoch = mean_anomaly_deg(planet, epoch_jd) * kDegToRad,
        .mean_motion = KeplerOrbit::mean_motion_from_period(planet.period_days * kSecondsPerDay),
    };
}

} // namespace orrery::astro
