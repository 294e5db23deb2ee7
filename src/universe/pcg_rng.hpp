#pragma once

/// @file pcg_rng.hpp
/// @brief PCG-XSH-RR 32/64 generator and stable seed-mixing helpers.

#include "core/types.hpp"

#include <bit>
#include <string_view>

namespace orrery::universe
{
    /// @brief Small, fast, reproducible pseudorandom generator.
    ///
    /// Identical (seed, stream) pairs yield identical sequences on every
    /// platform. Never shared between features: each feature gets its own stream.
    class PcgRng
    {
    public:
        explicit PcgRng(u64 seed, u64 stream = 1)
            : m_state(seed + (stream | 1)), m_inc((stream << 1u) | 1u)
        {
            next();
        }

        u32 next()
        {
            const u64 old = m_state;
            m_state = old * 6364136223846793005ULL + m_inc;
            const auto xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
            const auto rot = static_cast<u32>(old >> 59u);
            return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
        }

        /// Uniform double in [0, 1)
        f64 next_double()
        {
            return static_cast<f64>(next()) / 4294967296.0;
        }

        /// Uniform double in [lo, hi)
        f64 next_in_range(f64 lo, f64 hi)
        {
            return lo + next_double() * (hi - lo);
        }

        /// Integer in [lo, hi] (inclusive). Returns lo when hi <= lo.
        u32 next_int(u32 lo, u32 hi)
        {
            if (hi <= lo)
            {
                return lo;
            }
            return lo + next() % (hi - lo + 1u);
        }

        /// True with probability p
        bool next_bool(f64 p)
        {
            return next_double() < p;
        }

    private:
        u64 m_state;
        u64 m_inc;
    };

    // -----------------------------------------------------------------
    // Seed mixing
    // -----------------------------------------------------------------

    /// @brief FNV-1a 64-bit hash, stable across platforms and runs.
    [[nodiscard]] constexpr u64 stable_hash(std::string_view text)
    {
        u64 h = 14695981039346656037ULL;
        for (const char c : text)
        {
            h ^= static_cast<u8>(c);
            h *= 1099511628211ULL;
        }
        return h;
    }

    /// @brief SplitMix64 finalizer: combine two values into a well-spread seed.
    [[nodiscard]] constexpr u64 mix_seed(u64 a, u64 b)
    {
        u64 z = a ^ (b + 0x9E3779B97F4A7C15ULL + (a << 6u) + (a >> 2u));
        z = (z ^ (z >> 30u)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27u)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31u);
    }

    /// @brief Raw IEEE-754 bits of a double, for hashing feature parameters.
    [[nodiscard]] constexpr u64 float_bits(f64 value)
    {
        return std::bit_cast<u64>(value);
    }

} // namespace orrery::universe
