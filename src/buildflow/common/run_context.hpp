/**
 * @file run_context.hpp
 * @brief RunContext carries the run-scoped state handed to every task.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/config/environment.hpp"
#include "buildflow/process/capability_probe.hpp"
#include "buildflow/process/process_invoker.hpp"

namespace buildflow
{

/**
 * @brief Explicit run-scoped state passed to task actions, guards and item
 *        sources.
 *
 * @details
 * Nothing about a run is kept in globals: the target, configuration,
 * detected capabilities and the process invoker all reach task code through
 * this object. The engine copies its base context for every run and fills in
 * the target name, so runs never share mutable state.
 *
 * @par Ownership
 * - The invoker is not owned; it must outlive every run using this context.
 */
class RunContext
{
public:
    explicit RunContext(ProcessInvoker& invoker)
        : m_invoker{&invoker}
    {}

    /// Name of the task requested for this run.
    std::string target;

    /// Build configuration, e.g. "Debug" or "Release".
    std::string configuration;

    /// Repository root that file discovery runs against.
    std::string root_directory;

    /// Directory receiving packages, test results and exported certificates.
    std::string artefacts_directory;

    /// Pre-release suffix for packages; empty for a stable version.
    std::string version_suffix;

    /// Capabilities detected before the run.
    CapabilitySet capabilities;

    /// CI host the process runs on.
    CiEnvironment ci;

    /**
     * @brief The invoker task actions use to run external commands.
     */
    ProcessInvoker& invoker() const noexcept
    {
        return *m_invoker;
    }

private:
    ProcessInvoker* m_invoker;
};

} // namespace buildflow
