/**
 * @file posix_process_launcher.hpp
 * @brief IProcessLauncher backed by fork/execvp/waitpid.
 */
#pragma once
#include "buildflow/process/process_launcher.hpp"

namespace buildflow
{

/**
 * @brief Launches commands with fork/execvp and waits with waitpid.
 *
 * @details
 * The child inherits stdin, stdout and stderr from the parent, so tool output
 * appears directly on the console. Environment overrides and the working
 * directory are applied in the child between fork and exec.
 */
class PosixProcessLauncher : public IProcessLauncher
{
public:
    PosixProcessLauncher() = default;

    int launch(const ProcessRequest& request) override;
};

/**
 * @brief Factory function to create a PosixProcessLauncher.
 */
inline std::shared_ptr<PosixProcessLauncher> make_posix_process_launcher()
{
    return std::make_shared<PosixProcessLauncher>();
}

} // namespace buildflow
