/**
 * @file settings.hpp
 * @brief Command-line parsing and precedence-resolved run settings.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/config/environment.hpp"

namespace buildflow
{

inline constexpr const char* kDefaultTarget = "Default";
inline constexpr const char* kDefaultConfiguration = "Release";
inline constexpr const char* kDefaultVerbosity = "info";
inline constexpr const char* kDefaultArtefactsDirectoryName = "Artefacts";

/**
 * @brief Values given on the command line, before defaults are applied.
 */
struct CommandLine
{
    std::optional<std::string> target;
    std::optional<std::string> configuration;
    std::optional<std::string> root_directory;
    std::optional<std::string> artefacts_directory;
    std::optional<std::string> verbosity;
    std::optional<std::string> version_suffix;
    bool collect_timing{false};
    bool list_tasks{false};
    bool show_help{false};
    bool show_version{false};
};

/**
 * @brief Fully resolved settings for one invocation.
 */
struct Settings
{
    std::string target{kDefaultTarget};
    std::string configuration{kDefaultConfiguration};
    std::string root_directory;
    std::string artefacts_directory;
    std::string verbosity{kDefaultVerbosity};
    std::string version_suffix;
    bool collect_timing{false};
    bool list_tasks{false};
};

/**
 * @brief Parse program arguments (without argv[0]).
 *
 * @details
 * Accepts `--name value` and `--name=value` forms and a single positional
 * target name.
 *
 * @throws SettingsError for unknown options, missing values, or more than one
 *         positional argument.
 */
CommandLine parse_command_line(const std::vector<std::string>& args);

/**
 * @brief Resolve one setting: argument, then each environment variable in
 *        order, then the default. Empty values count as unset.
 */
std::string resolve_setting(const std::optional<std::string>& argument,
                            const std::vector<std::string>& environment_names,
                            const EnvironmentReader& env,
                            const std::string& default_value);

/**
 * @brief Apply environment variables and defaults to a parsed command line.
 * @param current_directory Used as the root when none is given.
 */
Settings resolve_settings(const CommandLine& command_line,
                          const EnvironmentReader& env,
                          const std::string& current_directory);

/**
 * @brief Usage text printed by --help.
 */
std::string usage_text();

} // namespace buildflow
