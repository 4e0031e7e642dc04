/**
 * @file process_invoker.hpp
 * @brief ProcessInvoker applies the exit-code error contract to a launcher.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/process/process_launcher.hpp"

namespace buildflow
{

/**
 * @brief State of a single invocation.
 *
 * @details
 * `Pending -> Running -> {Succeeded, Failed}`. `Failed` is terminal; there is
 * no automatic retry.
 */
enum class ProcessState
{
    Pending,
    Running,
    Succeeded,
    Failed
};

/**
 * @brief Outcome of ProcessInvoker::invoke().
 */
struct ProcessResult
{
    int exit_code{0};
    ProcessState state{ProcessState::Pending};

    /// True if the process failed but the request's leniency predicate
    /// allowed the run to continue.
    bool tolerated{false};

    bool succeeded() const noexcept { return state == ProcessState::Succeeded; }
};

/**
 * @brief Runs external commands and turns non-zero exits into errors.
 *
 * @details
 * Every invocation blocks until the child exits. A non-zero exit code raises
 * ProcessFailedError unless the request carries a `tolerate_failure`
 * predicate that returns true, in which case the failure is logged as a
 * warning and returned with `tolerated` set.
 *
 * Invocations are not idempotent: each call reruns the command.
 */
class ProcessInvoker
{
public:
    explicit ProcessInvoker(ProcessLauncherPtr launcher);

    /**
     * @brief Run a command and apply the failure policy.
     * @param request The command, arguments, overrides and leniency predicate.
     * @return The invocation outcome.
     * @throws ProcessFailedError on non-zero exit without leniency, or when the
     *         process could not be started.
     */
    ProcessResult invoke(const ProcessRequest& request);

    /**
     * @brief Run a command whose exit code is an answer rather than a verdict.
     * @details Non-zero exits are returned as `Failed` without consulting the
     *          leniency predicate and logged at debug level only.
     * @throws ProcessFailedError when the process could not be started.
     */
    ProcessResult check(const ProcessRequest& request);

    /**
     * @brief Convenience overload for a command without overrides.
     */
    ProcessResult invoke(const std::string& command,
                         const std::vector<std::string>& arguments,
                         const EnvironmentOverrides& environment = {});

    /**
     * @brief Overrides merged into every request before launch.
     * @details Request-level overrides win over these for the same variable.
     */
    void set_base_environment(EnvironmentOverrides environment);

    const EnvironmentOverrides& base_environment() const noexcept
    {
        return m_base_environment;
    }

    /**
     * @brief Number of invocations launched so far.
     */
    size_t invocation_count() const noexcept
    {
        return m_invocation_count;
    }

private:
    ProcessResult launch(const ProcessRequest& effective, const std::string& command_line);

    ProcessRequest with_base_environment(const ProcessRequest& request) const;

    ProcessLauncherPtr m_launcher;
    EnvironmentOverrides m_base_environment;
    size_t m_invocation_count{0};
};

} // namespace buildflow
