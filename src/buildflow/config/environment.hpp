/**
 * @file environment.hpp
 * @brief Environment variable access and CI host detection.
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

/**
 * @brief Reads an environment variable; nullopt when unset.
 *
 * @details
 * Settings and CI detection take this as a parameter instead of calling
 * getenv directly, so tests can supply a fixed environment.
 */
using EnvironmentReader = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief EnvironmentReader over the real process environment.
 */
EnvironmentReader process_environment();

/**
 * @brief EnvironmentReader over a fixed map.
 */
EnvironmentReader fixed_environment(std::map<std::string, std::string> variables);

/**
 * @brief Known continuous integration providers.
 */
enum class CiProvider
{
    None,
    AzurePipelines,
    AppVeyor,
    GitHubActions,
    Generic
};

const char* ci_provider_name(CiProvider provider) noexcept;

/**
 * @brief The CI host the process runs on, if any.
 */
struct CiEnvironment
{
    CiProvider provider{CiProvider::None};

    /// True on provider-hosted (shared) agents rather than self-hosted ones.
    bool hosted{false};

    bool is_ci() const noexcept { return provider != CiProvider::None; }

    /**
     * @brief Hosts where installing into the system certificate store is
     *        known not to work, so certificate trust failures are tolerated.
     */
    bool is_trusted_ci_host() const noexcept
    {
        return (provider == CiProvider::AzurePipelines && hosted) ||
               provider == CiProvider::AppVeyor;
    }
};

/**
 * @brief Detect the CI provider from well-known environment variables.
 */
CiEnvironment detect_ci_environment(const EnvironmentReader& env);

} // namespace buildflow
