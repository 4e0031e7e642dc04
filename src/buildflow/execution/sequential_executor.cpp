#include "buildflow/execution/sequential_executor.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"
#include "buildflow/common/run_context.hpp"
#include "buildflow/execution/task_runner.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

namespace
{

bool is_done(TaskState state) noexcept
{
    return state == TaskState::Succeeded || state == TaskState::Skipped;
}

} // namespace

SequentialExecutor::SequentialExecutor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

RunReport SequentialExecutor::execute(const ExecutionPlan& plan, RunContext& context)
{
    RunReport report;
    report.target = plan.target;
    auto start_time = std::chrono::steady_clock::now();

    // Fresh runners per run: the "done" state never outlives this call
    std::vector<TaskRunnerPtr> runners;
    runners.reserve(plan.task_count());
    for (const auto& task : plan.tasks)
    {
        runners.push_back(std::make_unique<TaskRunner>(task));
    }

    for (size_t idx = 0; idx < runners.size(); ++idx)
    {
        TaskRunner& runner = *runners[idx];

        // Plans are topologically ordered; this only guards against a
        // hand-built plan that is not.
        for (size_t dep : plan.dependency_positions[idx])
        {
            if (dep >= idx || !is_done(runners[dep]->state()))
            {
                throw std::logic_error("Execution plan lists task '" + runner.task()->name() +
                                       "' before its dependencies");
            }
        }

        runner.run(context);

        switch (runner.state())
        {
            case TaskState::Succeeded:
                report.executed_tasks.push_back(runner.task()->name());
                report.item_count += runner.completed_items().size();
                if (m_config.collect_timing)
                {
                    report.task_durations.push_back(runner.duration());
                }
                break;

            case TaskState::Skipped:
                report.skipped_tasks.push_back(runner.task()->name());
                break;

            case TaskState::Failed:
            {
                for (size_t rest = idx + 1; rest < runners.size(); ++rest)
                {
                    runners[rest]->cancel();
                }

                const std::string message = runner.error_message();
                if (runner.failed_item().empty())
                {
                    spdlog::error("Task '{}' failed: {}", runner.task()->name(), message);
                }
                else
                {
                    spdlog::error("Task '{}' failed on '{}': {}", runner.task()->name(),
                                  runner.failed_item(), message);
                }
                spdlog::error("{} remaining task(s) not run", runners.size() - idx - 1);

                throw TaskExecutionError(runner.task()->name(), runner.exception(), message,
                                         report.executed_tasks);
            }

            case TaskState::Pending:
            case TaskState::Running:
            case TaskState::Cancelled:
                throw std::logic_error("Task '" + runner.task()->name() + "' ended in state " +
                                       task_state_name(runner.state()));
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    report.total_duration =
        std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
    return report;
}

} // namespace buildflow
