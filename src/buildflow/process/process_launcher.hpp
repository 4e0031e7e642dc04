/**
 * @file process_launcher.hpp
 * @brief ProcessRequest and the IProcessLauncher interface.
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

/**
 * @brief Environment variable overrides applied to a child process.
 */
using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Description of one external command invocation.
 */
struct ProcessRequest
{
    /// Executable name or path. Looked up on PATH when it has no slash.
    std::string command;

    /// Arguments, not including the command itself.
    std::vector<std::string> arguments;

    /// Variables set in the child's environment on top of the inherited one.
    EnvironmentOverrides environment;

    /// Working directory for the child; empty means inherit.
    std::string working_directory;

    /**
     * @brief Per-call leniency predicate.
     * @details When set and returning true at the time a non-zero exit code is
     *          observed, the failure is logged instead of thrown.
     */
    std::function<bool()> tolerate_failure;

    /// Send the child's stdout and stderr to /dev/null.
    bool discard_output{false};
};

/**
 * @brief Launches a child process and waits for it to exit.
 *
 * @details
 * Implementations only start the process and report its exit code; deciding
 * whether an exit code is a failure is ProcessInvoker's job. This keeps the
 * error contract in one place and lets tests substitute a scripted launcher.
 *
 * @par Thread Safety
 * - Implementations must allow concurrent launch() calls.
 */
class IProcessLauncher
{
public:
    virtual ~IProcessLauncher() = default;

    /**
     * @brief Start the command described by request and block until it exits.
     * @return The child's exit code. 127 if the command could not be executed,
     *         128 + signal number if the child was killed by a signal.
     * @throws ProcessFailedError with exit code -1 if no child could be created.
     */
    virtual int launch(const ProcessRequest& request) = 0;
};

using ProcessLauncherPtr = std::shared_ptr<IProcessLauncher>;

} // namespace buildflow
