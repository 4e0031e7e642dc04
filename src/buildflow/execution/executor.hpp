/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/execution/execution_plan.hpp"
#include "buildflow/execution/run_report.hpp"

namespace buildflow
{

class RunContext;

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Whether to collect per-task timing.
     */
    bool collect_timing{false};
};

/**
 * @brief Interface for execution plan executors.
 *
 * @details
 * IExecutor defines the contract for running an ExecutionPlan:
 * - A task's action never starts before all of its dependencies finished.
 * - The first failure aborts the run; no later task starts.
 * - Failures surface as TaskExecutionError naming the failing task.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Execute a plan.
     * @param plan The resolved plan to run.
     * @param context Run-scoped state handed to every task.
     * @return RunReport describing the tasks that ran.
     * @throws TaskExecutionError if any task fails.
     */
    virtual RunReport execute(const ExecutionPlan& plan, RunContext& context) = 0;
};

using ExecutorPtr = std::shared_ptr<IExecutor>;

} // namespace buildflow
