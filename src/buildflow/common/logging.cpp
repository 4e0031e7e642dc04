#include "buildflow/common/logging.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace buildflow
{

spdlog::level::level_enum parse_log_level(const std::string& name)
{
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    };

    auto it = levels.find(name);
    if (it == levels.end())
    {
        throw SettingsError("Unknown verbosity '" + name + "'");
    }
    return it->second;
}

void configure_logging(spdlog::level::level_enum level)
{
    auto logger = spdlog::get("buildflow");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("buildflow");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace buildflow
