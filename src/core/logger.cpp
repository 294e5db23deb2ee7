/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers sharing console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace orrery::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{
    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

    std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                const std::vector<spdlog::sink_ptr>& sinks,
                                                spdlog::level::level_enum level)
    {
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        return logger;
    }
}

void Logger::init(const LoggerOptions& options)
{
    if (is_initialized())
    {
        shutdown();
    }

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (options.file_sink)
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file_path, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger("ORRERY", sinks, options.level);
    spdlog::register_logger(s_core_logger);

    s_app_logger = make_logger("APP", sinks, options.level);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

bool Logger::is_initialized()
{
    return s_core_logger != nullptr && s_app_logger != nullptr;
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace orrery::core
