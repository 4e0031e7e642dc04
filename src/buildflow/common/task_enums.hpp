/**
 * @file task_enums.hpp
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

/**
 * @brief Execution state of a task within a single run.
 *
 * @details
 * Every task in an execution plan starts as `Pending`. The executor moves it
 * to `Running` when it is reached, and from there to exactly one terminal
 * state. Tasks that are never reached because an earlier task failed end the
 * run in `Cancelled`.
 *
 * - `Succeeded`: the guard passed and the action (or every item action) ran
 *   without throwing.
 * - `Skipped`: the guard returned false; the action did not run but the task
 *   counts as done for its dependents.
 * - `Failed`: the guard, item source or action threw.
 */
enum class TaskState
{
    Pending,
    Running,
    Succeeded,
    Skipped,
    Failed,
    Cancelled
};

inline const char* task_state_name(TaskState state) noexcept
{
    switch (state)
    {
        case TaskState::Pending:
            return "Pending";
        case TaskState::Running:
            return "Running";
        case TaskState::Succeeded:
            return "Succeeded";
        case TaskState::Skipped:
            return "Skipped";
        case TaskState::Failed:
            return "Failed";
        case TaskState::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

} // namespace buildflow
