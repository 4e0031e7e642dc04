/**
 * @file task_runner.hpp
 * @brief TaskRunner wraps one Task for one run.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/task.hpp"
#include "buildflow/common/task_enums.hpp"

namespace buildflow
{

class RunContext;

/**
 * @brief Runs a single task within a run and records the outcome.
 *
 * @details
 * TaskRunner is the unit of work the executor walks through. It handles:
 * - Guard evaluation (skip vs. run)
 * - Snapshotting the item source once, then one action call per item
 * - Capturing the first exception and stopping further items
 * - State transitions and timing
 *
 * A runner is used for exactly one run() call; the executor creates fresh
 * runners for every run so no state leaks between runs.
 */
class TaskRunner
{
public:
    explicit TaskRunner(TaskPtr task);

    // Non-copyable, non-movable
    TaskRunner(const TaskRunner&) = delete;
    TaskRunner(TaskRunner&&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;
    TaskRunner& operator=(TaskRunner&&) = delete;

    /**
     * @brief Execute this task.
     *
     * @details
     * Performs the full lifecycle:
     * 1. Transition Pending -> Running
     * 2. Evaluate the guard; false -> Skipped
     * 3. Run the action, or evaluate the item source and run each item
     * 4. Catch exceptions, transition to Succeeded/Failed
     *
     * Never throws for failures inside task code; inspect state() and
     * exception() afterwards.
     */
    void run(RunContext& context);

    /**
     * @brief Mark a task that was never reached.
     * @pre state() == Pending
     */
    void cancel();

    TaskState state() const noexcept
    {
        return m_state;
    }

    /**
     * @brief Get the captured exception (if Failed).
     */
    std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Message of the captured exception, for diagnostics.
     */
    std::string error_message() const;

    /**
     * @brief Items processed successfully so far, in order.
     */
    const std::vector<std::string>& completed_items() const noexcept
    {
        return m_completed_items;
    }

    /**
     * @brief The item whose action failed; empty otherwise.
     */
    const std::string& failed_item() const noexcept
    {
        return m_failed_item;
    }

    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    const TaskPtr& task() const noexcept
    {
        return m_task;
    }

private:
    void run_items(RunContext& context);

    TaskPtr m_task;
    TaskState m_state{TaskState::Pending};
    std::exception_ptr m_exception{};
    std::vector<std::string> m_completed_items;
    std::string m_failed_item;
    std::chrono::nanoseconds m_duration{0};
};

using TaskRunnerPtr = std::unique_ptr<TaskRunner>;

} // namespace buildflow
