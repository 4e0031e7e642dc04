#include "buildflow/common/task_registry.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

namespace buildflow
{

void TaskRegistry::register_task(TaskPtr task)
{
    if (!task)
    {
        throw InvalidTaskDefinitionError("Cannot register a null task");
    }
    if (contains(task->name()))
    {
        throw DuplicateTaskError(task->name());
    }

    m_index_by_name.emplace(task->name(), m_tasks.size());
    m_tasks.push_back(std::move(task));
}

TaskPtr TaskRegistry::register_task(TaskDefinition definition)
{
    TaskPtr task = make_task(std::move(definition));
    register_task(task);
    return task;
}

const TaskPtr& TaskRegistry::lookup(const std::string& name) const
{
    auto it = m_index_by_name.find(name);
    if (it == m_index_by_name.end())
    {
        throw UnknownTaskError(name);
    }
    return m_tasks[it->second];
}

bool TaskRegistry::contains(const std::string& name) const noexcept
{
    return m_index_by_name.find(name) != m_index_by_name.end();
}

std::vector<std::string> TaskRegistry::task_names() const
{
    std::vector<std::string> names;
    names.reserve(m_tasks.size());
    for (const auto& task : m_tasks)
    {
        names.push_back(task->name());
    }
    return names;
}

} // namespace buildflow
