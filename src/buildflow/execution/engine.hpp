/**
 * @file engine.hpp
 * @brief Engine resolves a target and runs it.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/dependency_resolver.hpp"
#include "buildflow/common/run_context.hpp"
#include "buildflow/common/task_registry.hpp"
#include "buildflow/execution/executor.hpp"

namespace buildflow
{

/**
 * @brief Entry point for running a target against a registry.
 *
 * @details
 * run() performs the two phases of a run:
 * 1. Resolve the complete plan. Unknown names and cycles are reported here,
 *    before any task has had a chance to touch the outside world.
 * 2. Hand the plan to the executor with a fresh copy of the base context.
 *
 * The engine re-uses the registry between runs but nothing else: each run
 * gets its own context copy and its own execution state.
 */
class Engine
{
public:
    /**
     * @param registry Task definitions. Must outlive the engine.
     * @param base_context Copied for every run; its target is overwritten.
     * @param executor Executor to use; a SequentialExecutor when null.
     */
    Engine(const TaskRegistry& registry, RunContext base_context, ExecutorPtr executor = nullptr);

    /**
     * @brief Resolve and execute a target.
     * @return Report of the tasks that ran.
     * @throws UnknownTaskError, CyclicDependencyError before anything runs.
     * @throws TaskExecutionError when a task fails.
     */
    RunReport run(const std::string& target);

    /**
     * @brief Resolve a target without running it.
     */
    ExecutionPlan plan(const std::string& target) const;

    const RunContext& base_context() const noexcept
    {
        return m_base_context;
    }

    const TaskRegistry& registry() const noexcept
    {
        return m_registry;
    }

private:
    const TaskRegistry& m_registry;
    DependencyResolver m_resolver;
    RunContext m_base_context;
    ExecutorPtr m_executor;
};

} // namespace buildflow
