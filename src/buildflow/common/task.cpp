#include "buildflow/common/task.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

namespace buildflow
{

Task::Task(TaskDefinition definition)
    : m_name{std::move(definition.name)}
    , m_description{std::move(definition.description)}
    , m_action{std::move(definition.action)}
    , m_item_source{std::move(definition.item_source)}
    , m_item_action{std::move(definition.item_action)}
    , m_guard{std::move(definition.guard)}
{
    // Keep declaration order, drop repeats
    std::unordered_set<std::string> seen;
    for (auto& dependency : definition.dependencies)
    {
        if (seen.insert(dependency).second)
        {
            m_dependencies.push_back(std::move(dependency));
        }
    }
}

bool Task::should_run(const RunContext& context) const
{
    return !m_guard || m_guard(context);
}

std::vector<std::string> Task::items(const RunContext& context) const
{
    if (!m_item_source)
    {
        throw std::logic_error("Task '" + m_name + "' does not iterate");
    }
    return m_item_source(context);
}

void Task::run(RunContext& context) const
{
    if (m_action)
    {
        m_action(context);
    }
}

void Task::run_item(RunContext& context, const std::string& item) const
{
    if (!m_item_action)
    {
        throw std::logic_error("Task '" + m_name + "' does not iterate");
    }
    m_item_action(context, item);
}

TaskPtr make_task(TaskDefinition definition)
{
    if (definition.name.empty())
    {
        throw InvalidTaskDefinitionError("Task name must not be empty");
    }

    for (const auto& dependency : definition.dependencies)
    {
        if (dependency.empty())
        {
            throw InvalidTaskDefinitionError(
                "Task '" + definition.name + "' has an empty dependency name");
        }
        // Self-loop is caught here rather than at resolution time
        if (dependency == definition.name)
        {
            throw CyclicDependencyError({definition.name, definition.name});
        }
    }

    if (static_cast<bool>(definition.item_source) != static_cast<bool>(definition.item_action))
    {
        throw InvalidTaskDefinitionError(
            "Task '" + definition.name +
            "' must set both item_source and item_action, or neither");
    }

    if (definition.action && definition.item_source)
    {
        throw InvalidTaskDefinitionError(
            "Task '" + definition.name + "' cannot have both an action and an item source");
    }

    return TaskPtr(new Task(std::move(definition)));
}

} // namespace buildflow
