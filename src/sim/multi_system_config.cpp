/// @file multi_system_config.cpp
/// @brief JSON loading and validation of MultiSystemConfig.

#include "sim/multi_system_config.hpp"

#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>

namespace orrery::sim
{

namespace
{
    // Counts must be whole non-negative numbers that fit in u32
    std::optional<u32> read_count(const nlohmann::json& j, const char* key, u32 fallback)
    {
        const auto it = j.find(key);
        if (it == j.end())
        {
            return fallback;
        }
        if (it->is_number_integer())
        {
            const i64 value = it->get<i64>();
            if (value >= 0 && value <= static_cast<i64>(std::numeric_limits<u32>::max()))
            {
                return static_cast<u32>(value);
            }
        }
        ORR_CORE_ERROR("MultiSystemConfig: {} must be a non-negative integer, got {}", key, it->dump());
        return std::nullopt;
    }
}

std::string MultiSystemConfig::validate() const
{
    if (max_active_systems < 1)
    {
        return "max_active_systems must be at least 1";
    }
    if (background_update_interval < 1)
    {
        return "background_update_interval must be at least 1";
    }
    if (activation_distance_ly < 0.0)
    {
        return "activation_distance_ly must not be negative";
    }
    if (background_distance_ly < activation_distance_ly)
    {
        return "background_distance_ly must not be below activation_distance_ly";
    }
    if (dormant_distance_ly < background_distance_ly)
    {
        return "dormant_distance_ly must not be below background_distance_ly";
    }
    return {};
}

// -----------------------------------------------------------------
// JSON: every key optional, defaults for anything absent
// -----------------------------------------------------------------

std::optional<MultiSystemConfig> MultiSystemConfig::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        ORR_CORE_ERROR("MultiSystemConfig: Expected a JSON object, got {}", j.type_name());
        return std::nullopt;
    }

    MultiSystemConfig config;
    const auto max_active = read_count(j, "max_active_systems", config.max_active_systems);
    const auto max_background = read_count(j, "max_background_systems", config.max_background_systems);
    const auto interval = read_count(j, "background_update_interval", config.background_update_interval);
    if (!max_active || !max_background || !interval)
    {
        return std::nullopt;
    }
    config.max_active_systems = *max_active;
    config.max_background_systems = *max_background;
    config.background_update_interval = *interval;

    try
    {
        config.auto_transition_systems = j.value("auto_transition_systems", config.auto_transition_systems);
        config.activation_distance_ly = j.value("activation_distance_ly", config.activation_distance_ly);
        config.background_distance_ly = j.value("background_distance_ly", config.background_distance_ly);
        config.dormant_distance_ly = j.value("dormant_distance_ly", config.dormant_distance_ly);
    }
    catch (const nlohmann::json::exception& e)
    {
        ORR_CORE_ERROR("MultiSystemConfig: Invalid value: {}", e.what());
        return std::nullopt;
    }

    if (const std::string problem = config.validate(); !problem.empty())
    {
        ORR_CORE_ERROR("MultiSystemConfig: {}", problem);
        return std::nullopt;
    }
    return config;
}

std::optional<MultiSystemConfig> MultiSystemConfig::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ORR_CORE_ERROR("MultiSystemConfig: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    const nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded())
    {
        ORR_CORE_ERROR("MultiSystemConfig: Malformed JSON in {}", path.string());
        return std::nullopt;
    }

    auto config = from_json(j);
    if (config)
    {
        ORR_CORE_INFO("MultiSystemConfig: Loaded {} (active<={}, background<={}, every {} frames, {:.1f}/{:.1f}/{:.1f} ly)",
                      path.string(), config->max_active_systems, config->max_background_systems,
                      config->background_update_interval, config->activation_distance_ly,
                      config->background_distance_ly, config->dormant_distance_ly);
    }
    return config;
}

nlohmann::json MultiSystemConfig::to_json() const
{
    return nlohmann::json{
        {"max_active_systems", max_active_systems},
        {"max_background_systems", max_background_systems},
        {"background_update_interval", background_update_interval},
        {"auto_transition_systems", auto_transition_systems},
        {"activation_distance_ly", activation_distance_ly},
        {"background_distance_ly", background_distance_ly},
        {"dormant_distance_ly", dormant_distance_ly},
    };
}

} // namespace orrery::sim
