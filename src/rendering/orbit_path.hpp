#pragma once

/// @file orbit_path.hpp
/// @brief Presentational descriptor for drawing a body's orbit ellipse.

#include "core/types.hpp"

namespace orrery::rendering
{
    /// @brief Colour, visibility and sampling density of an orbit line.
    ///
    /// Regenerated on demand from the body's KeplerOrbit; never read by physics.
    struct OrbitPath
    {
        static constexpr u32 kDefaultSegments = 64;

        Vec4f colour{0.5f, 0.5f, 0.5f, 0.3f};  ///< RGBA, grey at 30% alpha by default
        bool visible = true;
        u32 segments = kDefaultSegments;
    };

} // namespace orrery::rendering
