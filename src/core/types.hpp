#pragma once

/// @file types.hpp
/// @brief Precision aliases, glm vector types and astronomical constants.

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace orrery
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for simulation)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Vector types (float for rendering)
    using Vec3f = glm::vec3;
    using Vec4f = glm::vec4;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi            = glm::pi<f64>();
        constexpr f64 kTwoPi         = 2.0 * kPi;
        constexpr f64 kHalfPi        = kPi / 2.0;
        constexpr f64 kDegToRad      = kPi / 180.0;
        constexpr f64 kRadToDeg      = 180.0 / kPi;
        constexpr f64 kJ2000         = 2451545.0;    // Julian Date of J2000.0 epoch
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kDaysPerYear   = 365.25;       // Julian year
        constexpr f64 kAuPerLightYear = 63241.077;
        constexpr f64 kEarthMassKg   = 5.972e24;
        constexpr f64 kEarthRadiusKm = 6371.0;
        constexpr f64 kSolarMassKg   = 1.989e30;
        constexpr f64 kSolarRadiusKm = 695700.0;
    }
}
