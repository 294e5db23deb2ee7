#pragma once

/// @file multi_system_config.hpp
/// @brief Operator-facing thresholds of the system fidelity scheduler.

#include "core/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace orrery::sim
{
    /// @brief Scheduler limits, cadences and distance thresholds (light-years).
    ///
    /// Loaded once at startup. Defaults keep a single Active system, up to
    /// ten Background systems updated every tenth frame.
    struct MultiSystemConfig
    {
        u32 max_active_systems = 1;
        u32 max_background_systems = 10;
        u32 background_update_interval = 10;    ///< Frames between Background propagations
        bool auto_transition_systems = true;
        f64 activation_distance_ly = 0.0;
        f64 background_distance_ly = 50.0;
        f64 dormant_distance_ly = 100.0;        ///< Background systems fall Dormant beyond this

        /// @brief Check limits and threshold ordering.
        /// @return Empty string when valid, otherwise the first problem found.
        [[nodiscard]] std::string validate() const;

        /// @brief Overlay values present in a JSON object onto the defaults.
        /// @return std::nullopt if a key has the wrong type or the result is invalid.
        [[nodiscard]] static std::optional<MultiSystemConfig> from_json(const nlohmann::json& j);

        /// @brief Read a JSON config file. Keys absent from the file keep their defaults.
        /// @return std::nullopt if the file cannot be read, parsed or validated.
        [[nodiscard]] static std::optional<MultiSystemConfig> load(const std::filesystem::path& path);

        [[nodiscard]] nlohmann::json to_json() const;
    };

} // namespace orrery::sim
