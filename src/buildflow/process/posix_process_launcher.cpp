#include "buildflow/process/posix_process_launcher.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace buildflow
{

namespace
{

constexpr int kExecFailedExitCode = 127;
constexpr int kSignalExitCodeBase = 128;

// Runs in the forked child; never returns.
[[noreturn]] void exec_child(const ProcessRequest& request, std::vector<char*>& argv)
{
    for (const auto& entry : request.environment)
    {
        ::setenv(entry.first.c_str(), entry.second.c_str(), 1);
    }

    if (request.discard_output)
    {
        const int null_fd = ::open("/dev/null", O_WRONLY);
        if (null_fd < 0)
        {
            ::_exit(kExecFailedExitCode);
        }
        ::dup2(null_fd, STDOUT_FILENO);
        ::dup2(null_fd, STDERR_FILENO);
        ::close(null_fd);
    }

    if (!request.working_directory.empty() &&
        ::chdir(request.working_directory.c_str()) != 0)
    {
        ::_exit(kExecFailedExitCode);
    }

    ::execvp(argv[0], argv.data());

    // Only reached if execvp failed
    ::_exit(kExecFailedExitCode);
}

} // namespace

int PosixProcessLauncher::launch(const ProcessRequest& request)
{
    // Build argv before forking so the child does not allocate
    std::vector<std::string> args;
    args.reserve(request.arguments.size() + 1);
    args.push_back(request.command);
    args.insert(args.end(), request.arguments.begin(), request.arguments.end());

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if (pid < 0)
    {
        spdlog::error("Failed to fork for '{}': {}", request.command, std::strerror(errno));
        throw ProcessFailedError(request.command, request.arguments, -1);
    }

    if (pid == 0)
    {
        exec_child(request, argv);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            spdlog::error("waitpid failed for '{}': {}", request.command, std::strerror(errno));
            throw ProcessFailedError(request.command, request.arguments, -1);
        }
    }

    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return kSignalExitCodeBase + WTERMSIG(status);
    }
    return -1;
}

} // namespace buildflow
