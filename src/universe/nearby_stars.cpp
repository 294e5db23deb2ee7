/// @file nearby_stars.cpp
/// @brief Nearby-star table and confirmed-planet mass/radius estimation.

#include "universe/nearby_stars.hpp"

#include "astro/space_coordinates.hpp"

#include <cctype>
#include <cmath>

namespace orrery::universe
{

namespace
{
    constexpr f64 kDefaultGasGiantMass = 300.0;     // Earth masses
    constexpr f64 kGasGiantRadius = 11.2;           // Earth radii

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
}

// -----------------------------------------------------------------
// Mass-radius relations (Chen & Kipping 2017, simplified)
// -----------------------------------------------------------------

f64 CatalogPlanet::estimated_mass_earth() const
{
    if (mass_earth)
    {
        return *mass_earth;
    }

    if (radius_earth)
    {
        const f64 r = *radius_earth;
        switch (type)
        {
            case CatalogPlanetType::Rocky:
            case CatalogPlanetType::SuperEarth:  return std::pow(r, 3.7);
            case CatalogPlanetType::NeptuneLike: return std::pow(r, 2.5);
            case CatalogPlanetType::GasGiant:    return kDefaultGasGiantMass;
            case CatalogPlanetType::Unknown:     return std::pow(r, 3.0);
        }
    }

    switch (type)
    {
        case CatalogPlanetType::SuperEarth:  return 3.0;
        case CatalogPlanetType::NeptuneLike: return 15.0;
        case CatalogPlanetType::GasGiant:    return kDefaultGasGiantMass;
        default:                             return 1.0;
    }
}

f64 CatalogPlanet::estimated_radius_earth() const
{
    if (radius_earth)
    {
        return *radius_earth;
    }

    if (mass_earth)
    {
        const f64 m = *mass_earth;
        switch (type)
        {
            case CatalogPlanetType::Rocky:
            case CatalogPlanetType::SuperEarth:  return std::pow(m, 1.0 / 3.7);
            case CatalogPlanetType::NeptuneLike: return std::pow(m, 1.0 / 2.5);
            case CatalogPlanetType::GasGiant:    return kGasGiantRadius;
            case CatalogPlanetType::Unknown:     return std::cbrt(m);
        }
    }

    switch (type)
    {
        case CatalogPlanetType::SuperEarth:  return 1.5;
        case CatalogPlanetType::NeptuneLike: return 4.0;
        case CatalogPlanetType::GasGiant:    return kGasGiantRadius;
        default:                             return 1.0;
    }
}

PlanetType CatalogPlanet::planet_type() const
{
    switch (type)
    {
        case CatalogPlanetType::NeptuneLike: return PlanetType::IceGiant;
        case CatalogPlanetType::GasGiant:    return PlanetType::GasGiant;
        default:                             return PlanetType::Rocky;
    }
}

Vec3d CatalogSystem::position_ly() const
{
    return astro::equatorial_to_cartesian(ra_deg, dec_deg, distance_ly);
}

// -----------------------------------------------------------------
// NearbyStarCatalog
// -----------------------------------------------------------------

void NearbyStarCatalog::add_system(CatalogSystem system)
{
    m_systems.push_back(std::move(system));
}

const CatalogSystem* NearbyStarCatalog::find_by_name(std::string_view name) const
{
    for (const auto& system : m_systems)
    {
        if (iequals(system.name, name))
        {
            return &system;
        }
        for (const auto& star : system.stars)
        {
            if (iequals(star.name, name))
            {
                return &system;
            }
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------
// load_builtin: masses/radii solar, temperatures K, periods days
// -----------------------------------------------------------------

NearbyStarCatalog NearbyStarCatalog::load_builtin()
{
    using PT = CatalogPlanetType;

    NearbyStarCatalog cat;

    cat.add_system(CatalogSystem{
        .name = "Proxima Centauri",
        .distance_ly = 4.24,
        .ra_deg = 217.429,
        .dec_deg = -62.679,
        .stars = {
            {"Proxima Centauri", "M5.5Ve", 0.122, 0.154, 3042.0, 0.0017, {
                {"Proxima Centauri b", 1.07, std::nullopt, 11.186, 0.0485, 0.11, PT::Rocky},
            }},
        },
        .binaries = {},
    });

    cat.add_system(CatalogSystem{
        .name = "Alpha Centauri",
        .distance_ly = 4.37,
        .ra_deg = 219.902,
        .dec_deg = -60.834,
        .stars = {
            {"Alpha Centauri A", "G2V", 1.100, 1.220, 5790.0, 1.519, {}},
            {"Alpha Centauri B", "K1V", 0.907, 0.863, 5260.0, 0.500, {}},
        },
        .binaries = {
            {"Alpha Centauri AB", 0, 1, 23.4, 79.91, 0.5179, 79.2, 232.3},
        },
    });

    cat.add_system(CatalogSystem{
        .name = "Barnard's Star",
        .distance_ly = 5.96,
        .ra_deg = 269.452,
        .dec_deg = 4.693,
        .stars = {
            {"Barnard's Star", "M4Ve", 0.144, 0.196, 3134.0, 0.0035, {
                {"Barnard's Star b", 0.37, std::nullopt, 3.15, 0.0188, 0.03, PT::Rocky},
            }},
        },
        .binaries = {},
    });

    cat.add_system(CatalogSystem{
        .name = "Sirius",
        .distance_ly = 8.6,
        .ra_deg = 101.287,
        .dec_deg = -16.716,
        .stars = {
            {"Sirius A", "A1V", 2.063, 1.711, 9940.0, 25.4, {}},
            {"Sirius B", "DA2", 1.018, 0.0084, 25200.0, 0.056, {}},
        },
        .binaries = {
            {"Sirius AB", 0, 1, 19.8, 50.1, 0.592, 136.3, 149.2},
        },
    });

    cat.add_system(CatalogSystem{
        .name = "Epsilon Eridani",
        .distance_ly = 10.5,
        .ra_deg = 53.233,
        .dec_deg = -9.458,
        .stars = {
            {"Epsilon Eridani", "K2V", 0.82, 0.735, 5084.0, 0.34, {
                {"Epsilon Eridani b", 209.0, std::nullopt, 2692.0, 3.48, 0.07, PT::GasGiant},
            }},
        },
        .binaries = {},
    });

    cat.add_system(CatalogSystem{
        .name = "Tau Ceti",
        .distance_ly = 11.9,
        .ra_deg = 26.017,
        .dec_deg = -15.937,
        .stars = {
            {"Tau Ceti", "G8V", 0.78, 0.79, 5344.0, 0.52, {
                {"Tau Ceti g", 1.75, std::nullopt, 20.0, 0.133, 0.06, PT::Rocky},
                {"Tau Ceti h", 1.83, std::nullopt, 49.41, 0.243, 0.23, PT::Rocky},
                {"Tau Ceti e", 3.93, std::nullopt, 162.87, 0.538, 0.18, PT::SuperEarth},
                {"Tau Ceti f", 3.93, std::nullopt, 636.13, 1.334, 0.16, PT::SuperEarth},
            }},
        },
        .binaries = {},
    });

    return cat;
}

} // namespace orrery::universe
