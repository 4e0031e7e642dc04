/**
 * @file run_report.hpp
 * @brief Definition of RunReport returned by IExecutor::execute().
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

/**
 * @brief Result of a successful run.
 *
 * @details
 * RunReport captures what a run did:
 * - Which tasks ran their action, in execution order
 * - Which tasks were skipped by their guard
 * - Timing information (if collected)
 *
 * Failed runs do not produce a report; they throw TaskExecutionError, which
 * carries the tasks completed before the failure.
 */
struct RunReport
{
    /**
     * @brief The target the run was resolved for.
     */
    std::string target;

    /**
     * @brief Tasks whose action ran, in execution order.
     * @details Aggregate tasks without an action are included when their
     *          guard passed.
     */
    std::vector<std::string> executed_tasks;

    /**
     * @brief Tasks whose guard returned false, in plan order.
     */
    std::vector<std::string> skipped_tasks;

    /**
     * @brief Number of item actions run across all iterating tasks.
     */
    size_t item_count{0};

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-task durations, parallel to executed_tasks.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<std::chrono::nanoseconds> task_durations;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Target '" + target + "' succeeded";
        result += " (executed=" + std::to_string(executed_tasks.size());
        result += ", skipped=" + std::to_string(skipped_tasks.size());
        result += ", items=" + std::to_string(item_count) + ")";
        return result;
    }
};

} // namespace buildflow
