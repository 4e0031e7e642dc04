/**
 * @file standard_pipeline.hpp
 * @brief The clean/restore/build/test/pack pipeline for a .NET solution.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/task_registry.hpp"
#include "buildflow/pipeline/test_filter.hpp"
#include "buildflow/process/process_launcher.hpp"

namespace buildflow
{

namespace task_names
{
inline constexpr const char* kClean = "Clean";
inline constexpr const char* kRestore = "Restore";
inline constexpr const char* kBuild = "Build";
inline constexpr const char* kInstallDeveloperCertificate = "InstallDeveloperCertificate";
inline constexpr const char* kTest = "Test";
inline constexpr const char* kPack = "Pack";
inline constexpr const char* kDefault = "Default";
} // namespace task_names

/**
 * @brief Tool names, discovery patterns and certificate settings for the
 *        standard pipeline.
 */
struct PipelineOptions
{
    /// The dotnet CLI, looked up on PATH unless it contains a slash.
    std::string dotnet_tool{"dotnet"};

    /// Root-relative pattern for test projects; every match is tested.
    std::string test_project_pattern{"Tests/**/*.csproj"};

    /// Root-relative pattern for the package project; exactly one must match.
    std::string package_project_pattern{"Source/**/*.csproj"};

    /// File name of the exported developer certificate inside the artefacts.
    std::string certificate_file_name{"developer.pfx"};

    std::string certificate_password{"password"};

    /// Test traits excluded when their capability is missing.
    std::vector<TraitExclusion> trait_exclusions{default_trait_exclusions()};
};

/**
 * @brief Environment applied to every dotnet invocation.
 * @details Opts out of telemetry, the first-run experience and the logo.
 */
EnvironmentOverrides dotnet_environment();

/**
 * @brief Register Clean, Restore, Build, InstallDeveloperCertificate, Test,
 *        Pack and Default.
 *
 * @details
 * Dependencies:
 * - Restore -> Clean
 * - Build -> Restore
 * - Test -> Build, InstallDeveloperCertificate
 * - Pack -> Build
 * - Default -> Build, Test, Pack
 *
 * @throws DuplicateTaskError if any of these names is already registered.
 */
void register_standard_pipeline(TaskRegistry& registry, const PipelineOptions& options = {});

} // namespace buildflow
