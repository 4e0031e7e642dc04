/**
 * @file execution_plan.hpp
 * @brief Definition of ExecutionPlan produced by DependencyResolver::resolve().
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/task.hpp"

namespace buildflow
{

/**
 * @brief Immutable, fully resolved execution order for one target.
 *
 * @details
 * ExecutionPlan contains everything the executor needs to run a target:
 * - Tasks in an order where every task follows all of its dependencies
 * - For each task, the plan positions of its direct dependencies
 *
 * Producing a plan validates every name and rules out cycles, so once a plan
 * exists no configuration error can surface during execution.
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 * - Execution state is tracked externally (in TaskRunner).
 */
struct ExecutionPlan
{
    /**
     * @brief The target the plan was resolved for. Always the last task.
     */
    std::string target;

    /**
     * @brief Tasks in execution order.
     */
    std::vector<TaskPtr> tasks;

    /**
     * @brief Direct dependency positions for each task.
     *
     * @details
     * dependency_positions[i] holds indices into `tasks` for the dependencies
     * of tasks[i]. Every index is smaller than i.
     */
    std::vector<std::vector<size_t>> dependency_positions;

    /**
     * @brief Task names in execution order.
     */
    std::vector<std::string> task_names() const
    {
        std::vector<std::string> names;
        names.reserve(tasks.size());
        for (const auto& task : tasks)
        {
            names.push_back(task->name());
        }
        return names;
    }

    /**
     * @brief Get the total number of tasks.
     */
    size_t task_count() const noexcept
    {
        return tasks.size();
    }
};

} // namespace buildflow
