/**
 * @file logging.hpp
 * @brief spdlog setup for the buildflow executable and tests.
 */
#pragma once
#include "buildflow/common/common.hpp"

#include <spdlog/common.h>

namespace buildflow
{

/**
 * @brief Parse a verbosity name (trace, debug, info, warn, error, off).
 * @throws SettingsError for an unknown name.
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Install a colored stderr logger named "buildflow" as spdlog's
 *        default logger and set its level.
 */
void configure_logging(spdlog::level::level_enum level);

} // namespace buildflow
