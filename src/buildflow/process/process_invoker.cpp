#include "buildflow/process/process_invoker.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

ProcessInvoker::ProcessInvoker(ProcessLauncherPtr launcher)
    : m_launcher{std::move(launcher)}
{
    if (!m_launcher)
    {
        throw std::invalid_argument("ProcessInvoker requires a launcher");
    }
}

ProcessResult ProcessInvoker::launch(const ProcessRequest& effective,
                                     const std::string& command_line)
{
    ProcessResult result;
    result.state = ProcessState::Running;
    ++m_invocation_count;

    spdlog::debug("Running: {}", command_line);
    result.exit_code = m_launcher->launch(effective);
    result.state = result.exit_code == 0 ? ProcessState::Succeeded : ProcessState::Failed;
    return result;
}

ProcessResult ProcessInvoker::invoke(const ProcessRequest& request)
{
    const ProcessRequest effective = with_base_environment(request);
    const std::string command_line =
        ProcessFailedError::format_command_line(effective.command, effective.arguments);

    ProcessResult result = launch(effective, command_line);
    if (result.succeeded())
    {
        return result;
    }

    if (effective.tolerate_failure && effective.tolerate_failure())
    {
        spdlog::warn("'{}' exited with code {}; continuing because failures are tolerated here",
                     command_line, result.exit_code);
        result.tolerated = true;
        return result;
    }

    spdlog::error("'{}' exited with code {}", command_line, result.exit_code);
    throw ProcessFailedError(effective.command, effective.arguments, result.exit_code);
}

ProcessResult ProcessInvoker::check(const ProcessRequest& request)
{
    const ProcessRequest effective = with_base_environment(request);
    const std::string command_line =
        ProcessFailedError::format_command_line(effective.command, effective.arguments);

    ProcessResult result = launch(effective, command_line);
    if (!result.succeeded())
    {
        spdlog::debug("'{}' exited with code {}", command_line, result.exit_code);
    }
    return result;
}

ProcessResult ProcessInvoker::invoke(const std::string& command,
                                     const std::vector<std::string>& arguments,
                                     const EnvironmentOverrides& environment)
{
    ProcessRequest request;
    request.command = command;
    request.arguments = arguments;
    request.environment = environment;
    return invoke(request);
}

void ProcessInvoker::set_base_environment(EnvironmentOverrides environment)
{
    m_base_environment = std::move(environment);
}

ProcessRequest ProcessInvoker::with_base_environment(const ProcessRequest& request) const
{
    if (m_base_environment.empty())
    {
        return request;
    }

    // Base entries first so that the child's setenv calls let request
    // entries overwrite them.
    ProcessRequest merged = request;
    merged.environment = m_base_environment;
    merged.environment.insert(merged.environment.end(),
                              request.environment.begin(),
                              request.environment.end());
    return merged;
}

} // namespace buildflow
