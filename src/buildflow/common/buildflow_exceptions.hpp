/**
 * @file buildflow_exceptions.hpp
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

/**
 * @brief Error codes for all buildflow failures.
 *
 * @details
 * Configuration-time codes (`DuplicateTask`, `UnknownTask`, `CyclicDependency`,
 * `InvalidTaskDefinition`) are raised before any task action runs. Run-time
 * codes (`ProcessFailed`, `DiscoveryMismatch`, `TaskExecution`) may leave
 * partial external state behind from tasks that already completed.
 */
enum class BuildFlowErrorCode
{
    DuplicateTask,
    UnknownTask,
    CyclicDependency,
    InvalidTaskDefinition,
    ProcessFailed,
    DiscoveryMismatch,
    TaskExecution,
    InvalidSettings
};

/**
 * @brief Get a short name for an error code, for log and console output.
 */
inline const char* error_code_name(BuildFlowErrorCode code) noexcept
{
    switch (code)
    {
        case BuildFlowErrorCode::DuplicateTask:
            return "DuplicateTask";
        case BuildFlowErrorCode::UnknownTask:
            return "UnknownTask";
        case BuildFlowErrorCode::CyclicDependency:
            return "CyclicDependency";
        case BuildFlowErrorCode::InvalidTaskDefinition:
            return "InvalidTaskDefinition";
        case BuildFlowErrorCode::ProcessFailed:
            return "ProcessFailed";
        case BuildFlowErrorCode::DiscoveryMismatch:
            return "DiscoveryMismatch";
        case BuildFlowErrorCode::TaskExecution:
            return "TaskExecution";
        case BuildFlowErrorCode::InvalidSettings:
            return "InvalidSettings";
    }
    return "Unknown";
}

/**
 * @brief Base class of every exception thrown by buildflow.
 *
 * @details
 * Each exception carries an error code and a descriptive message. Derived
 * classes add the structured data a caller needs for diagnostics (task names,
 * commands, exit codes).
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class BuildFlowError : public std::exception
{
public:
    /**
     * @brief Construct a BuildFlowError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    BuildFlowError(BuildFlowErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    BuildFlowErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    BuildFlowErrorCode m_code;
    std::string m_message;
};

/**
 * @brief A task with the same name is already registered.
 */
class DuplicateTaskError : public BuildFlowError
{
public:
    explicit DuplicateTaskError(std::string task_name)
        : BuildFlowError(BuildFlowErrorCode::DuplicateTask,
                         "Task '" + task_name + "' is already registered")
        , m_task_name(std::move(task_name))
    {
    }

    const std::string& task_name() const noexcept { return m_task_name; }

private:
    std::string m_task_name;
};

/**
 * @brief A target or dependency refers to a task that is not registered.
 *
 * @details
 * `referenced_by()` is empty when the unknown name was the requested target
 * itself, otherwise it names the task whose dependency list holds the name.
 */
class UnknownTaskError : public BuildFlowError
{
public:
    explicit UnknownTaskError(std::string task_name, std::string referenced_by = {})
        : BuildFlowError(BuildFlowErrorCode::UnknownTask,
                         make_message(task_name, referenced_by))
        , m_task_name(std::move(task_name))
        , m_referenced_by(std::move(referenced_by))
    {
    }

    const std::string& task_name() const noexcept { return m_task_name; }
    const std::string& referenced_by() const noexcept { return m_referenced_by; }

private:
    static std::string make_message(const std::string& task_name,
                                    const std::string& referenced_by)
    {
        if (referenced_by.empty())
        {
            return "Task '" + task_name + "' is not registered";
        }
        return "Task '" + task_name + "' (dependency of '" + referenced_by +
               "') is not registered";
    }

    std::string m_task_name;
    std::string m_referenced_by;
};

/**
 * @brief The dependency graph reachable from a target contains a cycle.
 *
 * @details
 * `cycle()` lists the task names along the cycle, with the first name
 * repeated at the end (e.g. `A, B, A`).
 */
class CyclicDependencyError : public BuildFlowError
{
public:
    explicit CyclicDependencyError(std::vector<std::string> cycle)
        : BuildFlowError(BuildFlowErrorCode::CyclicDependency,
                         "Cyclic dependency detected: " + join_cycle(cycle))
        , m_cycle(std::move(cycle))
    {
    }

    const std::vector<std::string>& cycle() const noexcept { return m_cycle; }

private:
    static std::string join_cycle(const std::vector<std::string>& cycle)
    {
        std::string text;
        for (size_t i = 0; i < cycle.size(); ++i)
        {
            if (i != 0)
            {
                text += " -> ";
            }
            text += cycle[i];
        }
        return text;
    }

    std::vector<std::string> m_cycle;
};

/**
 * @brief A task definition is malformed and cannot be turned into a Task.
 */
class InvalidTaskDefinitionError : public BuildFlowError
{
public:
    explicit InvalidTaskDefinitionError(std::string message)
        : BuildFlowError(BuildFlowErrorCode::InvalidTaskDefinition, std::move(message))
    {
    }
};

/**
 * @brief An external command exited with a non-zero code.
 *
 * @details
 * An exit code of -1 means the child process could not be started at all.
 */
class ProcessFailedError : public BuildFlowError
{
public:
    ProcessFailedError(std::string command, std::vector<std::string> arguments, int exit_code)
        : BuildFlowError(BuildFlowErrorCode::ProcessFailed,
                         make_message(command, arguments, exit_code))
        , m_command(std::move(command))
        , m_arguments(std::move(arguments))
        , m_exit_code(exit_code)
    {
    }

    const std::string& command() const noexcept { return m_command; }
    const std::vector<std::string>& arguments() const noexcept { return m_arguments; }
    int exit_code() const noexcept { return m_exit_code; }

    /**
     * @brief Get the command and its arguments as a single display string.
     */
    std::string command_line() const
    {
        return format_command_line(m_command, m_arguments);
    }

    /**
     * @brief Join a command and arguments with spaces for display.
     */
    static std::string format_command_line(const std::string& command,
                                           const std::vector<std::string>& arguments)
    {
        std::string text = command;
        for (const auto& arg : arguments)
        {
            text += ' ';
            text += arg;
        }
        return text;
    }

private:
    static std::string make_message(const std::string& command,
                                    const std::vector<std::string>& arguments,
                                    int exit_code)
    {
        return "Process '" + format_command_line(command, arguments) +
               "' failed with exit code " + std::to_string(exit_code);
    }

    std::string m_command;
    std::vector<std::string> m_arguments;
    int m_exit_code;
};

/**
 * @brief A discovery that expects exactly one file found zero or several.
 */
class DiscoveryMismatchError : public BuildFlowError
{
public:
    DiscoveryMismatchError(std::string pattern, std::vector<std::string> matches)
        : BuildFlowError(BuildFlowErrorCode::DiscoveryMismatch,
                         "Expected exactly one file matching '" + pattern + "' but found " +
                             std::to_string(matches.size()))
        , m_pattern(std::move(pattern))
        , m_matches(std::move(matches))
    {
    }

    const std::string& pattern() const noexcept { return m_pattern; }
    const std::vector<std::string>& matches() const noexcept { return m_matches; }

private:
    std::string m_pattern;
    std::vector<std::string> m_matches;
};

/**
 * @brief A task failed while running; wraps the underlying cause.
 *
 * @details
 * Thrown by the executor for any exception escaping a task's guard, item
 * source or action. The underlying exception is available through `cause()`
 * and can be rethrown to inspect its concrete type. `completed_tasks()` lists
 * the tasks that ran their action before the failure.
 */
class TaskExecutionError : public BuildFlowError
{
public:
    TaskExecutionError(std::string task_name,
                       std::exception_ptr cause,
                       std::string cause_message,
                       std::vector<std::string> completed_tasks)
        : BuildFlowError(BuildFlowErrorCode::TaskExecution,
                         "Task '" + task_name + "' failed: " + cause_message)
        , m_task_name(std::move(task_name))
        , m_cause(std::move(cause))
        , m_completed_tasks(std::move(completed_tasks))
    {
    }

    const std::string& task_name() const noexcept { return m_task_name; }
    std::exception_ptr cause() const noexcept { return m_cause; }
    const std::vector<std::string>& completed_tasks() const noexcept { return m_completed_tasks; }

private:
    std::string m_task_name;
    std::exception_ptr m_cause;
    std::vector<std::string> m_completed_tasks;
};

/**
 * @brief A command-line argument or setting value is invalid.
 */
class SettingsError : public BuildFlowError
{
public:
    explicit SettingsError(std::string message)
        : BuildFlowError(BuildFlowErrorCode::InvalidSettings, std::move(message))
    {
    }
};

} // namespace buildflow
