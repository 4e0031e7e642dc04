#include "buildflow/execution/task_runner.hpp"
#include "buildflow/common/run_context.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

TaskRunner::TaskRunner(TaskPtr task)
    : m_task{std::move(task)}
{}

void TaskRunner::run(RunContext& context)
{
    if (m_state != TaskState::Pending)
    {
        throw std::logic_error("Task '" + m_task->name() + "' has already been run");
    }
    m_state = TaskState::Running;

    auto start_time = std::chrono::steady_clock::now();

    try
    {
        if (!m_task->should_run(context))
        {
            spdlog::info("Skipping task '{}': guard not satisfied", m_task->name());
            m_state = TaskState::Skipped;
        }
        else
        {
            spdlog::info("Running task '{}'", m_task->name());
            if (m_task->is_iterating())
            {
                run_items(context);
            }
            else
            {
                m_task->run(context);
            }
            m_state = TaskState::Succeeded;
        }
    }
    catch (...)
    {
        m_exception = std::current_exception();
        m_state = TaskState::Failed;
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    if (m_state == TaskState::Succeeded)
    {
        spdlog::info("Finished task '{}' in {} ms", m_task->name(),
                     std::chrono::duration_cast<std::chrono::milliseconds>(m_duration).count());
    }
}

void TaskRunner::run_items(RunContext& context)
{
    // One snapshot per run; later file system changes are not seen
    const std::vector<std::string> items = m_task->items(context);
    spdlog::debug("Task '{}' iterates over {} item(s)", m_task->name(), items.size());

    for (const auto& item : items)
    {
        m_failed_item = item;
        m_task->run_item(context, item);
        m_completed_items.push_back(item);
    }
    m_failed_item.clear();
}

void TaskRunner::cancel()
{
    if (m_state == TaskState::Pending)
    {
        m_state = TaskState::Cancelled;
    }
}

std::string TaskRunner::error_message() const
{
    if (!m_exception)
    {
        return {};
    }
    try
    {
        std::rethrow_exception(m_exception);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

} // namespace buildflow
