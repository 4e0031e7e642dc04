/**
 * @file sequential_executor.hpp
 * @brief SequentialExecutor runs a plan one task at a time.
 */
#pragma once
#include "buildflow/execution/executor.hpp"

namespace buildflow
{

/**
 * @brief Runs tasks strictly in plan order on the calling thread.
 *
 * @details
 * Each call to execute() creates fresh TaskRunners, so nothing is memoized
 * across runs. Within a run every task appears once in the plan and therefore
 * runs at most once.
 *
 * @par Thread Safety
 * - execute() keeps all run state local; concurrent calls with distinct
 *   contexts are safe.
 */
class SequentialExecutor : public IExecutor
{
public:
    /**
     * @brief Construct a sequential executor.
     * @param config Configuration options.
     */
    explicit SequentialExecutor(ExecutorConfig config = {});

    RunReport execute(const ExecutionPlan& plan, RunContext& context) override;

private:
    ExecutorConfig m_config;
};

/**
 * @brief Factory function to create a SequentialExecutor.
 */
inline std::shared_ptr<SequentialExecutor> make_sequential_executor(ExecutorConfig config = {})
{
    return std::make_shared<SequentialExecutor>(std::move(config));
}

} // namespace buildflow
