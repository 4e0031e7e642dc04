#include "buildflow/execution/engine.hpp"
#include "buildflow/execution/sequential_executor.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

Engine::Engine(const TaskRegistry& registry, RunContext base_context, ExecutorPtr executor)
    : m_registry(registry)
    , m_resolver(registry)
    , m_base_context(std::move(base_context))
    , m_executor(std::move(executor))
{
    if (!m_executor)
    {
        m_executor = make_sequential_executor();
    }
}

ExecutionPlan Engine::plan(const std::string& target) const
{
    return m_resolver.resolve(target);
}

RunReport Engine::run(const std::string& target)
{
    ExecutionPlan execution_plan = plan(target);

    spdlog::info("Target '{}' resolves to {} task(s)", target, execution_plan.task_count());
    for (size_t i = 0; i < execution_plan.task_count(); ++i)
    {
        spdlog::debug("  {}. {}", i + 1, execution_plan.tasks[i]->name());
    }

    RunContext context = m_base_context;
    context.target = target;

    RunReport report = m_executor->execute(execution_plan, context);
    spdlog::info("{}", report.summary());
    return report;
}

} // namespace buildflow
