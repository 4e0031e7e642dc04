/**
 * @file task_registry.hpp
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/task.hpp"

namespace buildflow
{

/**
 * @brief Name-keyed store of task definitions.
 *
 * @details
 * The registry is filled once per process and read by every run afterwards.
 * There is no removal: a task, once registered, stays until the registry is
 * destroyed. Tasks are kept in registration order so that listings and
 * whole-registry validation are deterministic.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe once registration has finished.
 */
class TaskRegistry
{
public:
    TaskRegistry() = default;

    /**
     * @brief Add a task.
     * @throws DuplicateTaskError if a task with the same name exists.
     * @throws InvalidTaskDefinitionError if task is null.
     */
    void register_task(TaskPtr task);

    /**
     * @brief Build a task from a definition and add it.
     * @return The registered task.
     */
    TaskPtr register_task(TaskDefinition definition);

    /**
     * @brief Find a task by name.
     * @throws UnknownTaskError if no task has that name.
     */
    const TaskPtr& lookup(const std::string& name) const;

    bool contains(const std::string& name) const noexcept;

    size_t size() const noexcept { return m_tasks.size(); }

    /**
     * @brief Task names in registration order.
     */
    std::vector<std::string> task_names() const;

    /**
     * @brief Tasks in registration order.
     */
    const std::vector<TaskPtr>& tasks() const noexcept { return m_tasks; }

private:
    std::vector<TaskPtr> m_tasks;
    std::unordered_map<std::string, size_t> m_index_by_name;
};

} // namespace buildflow
