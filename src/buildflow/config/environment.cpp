#include "buildflow/config/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace buildflow
{

namespace
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_truthy(const std::optional<std::string>& value)
{
    if (!value)
    {
        return false;
    }
    const std::string v = to_lower(*value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

EnvironmentReader process_environment()
{
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    };
}

EnvironmentReader fixed_environment(std::map<std::string, std::string> variables)
{
    return [variables = std::move(variables)](const std::string& name)
               -> std::optional<std::string> {
        auto it = variables.find(name);
        if (it == variables.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
}

const char* ci_provider_name(CiProvider provider) noexcept
{
    switch (provider)
    {
        case CiProvider::None:
            return "None";
        case CiProvider::AzurePipelines:
            return "AzurePipelines";
        case CiProvider::AppVeyor:
            return "AppVeyor";
        case CiProvider::GitHubActions:
            return "GitHubActions";
        case CiProvider::Generic:
            return "Generic";
    }
    return "Unknown";
}

CiEnvironment detect_ci_environment(const EnvironmentReader& env)
{
    CiEnvironment ci;

    if (is_truthy(env("TF_BUILD")))
    {
        ci.provider = CiProvider::AzurePipelines;
        // Microsoft-hosted agents are named "Hosted ..." or "Azure Pipelines N"
        const std::string agent = env("AGENT_NAME").value_or("");
        ci.hosted = agent.rfind("Hosted", 0) == 0 || agent.rfind("Azure Pipelines", 0) == 0;
    }
    else if (is_truthy(env("APPVEYOR")))
    {
        ci.provider = CiProvider::AppVeyor;
        ci.hosted = true;
    }
    else if (is_truthy(env("GITHUB_ACTIONS")))
    {
        ci.provider = CiProvider::GitHubActions;
        ci.hosted = env("RUNNER_ENVIRONMENT").value_or("github-hosted") == "github-hosted";
    }
    else if (is_truthy(env("CI")))
    {
        ci.provider = CiProvider::Generic;
    }

    return ci;
}

} // namespace buildflow
