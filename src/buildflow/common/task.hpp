/**
 * @file task.hpp
 * @brief Task definitions: TaskDefinition (mutable) and Task (immutable).
 */
#pragma once
#include "buildflow/common/common.hpp"

namespace buildflow
{

class RunContext;

/// Unit of work run once per task.
using TaskAction = std::function<void(RunContext&)>;

/// Unit of work run once per item produced by the task's item source.
using ItemAction = std::function<void(RunContext&, const std::string&)>;

/// Produces the items a task iterates over. Called once per run.
using ItemSource = std::function<std::vector<std::string>(const RunContext&)>;

/// Decides whether a task's action runs. Absent means always.
using TaskGuard = std::function<bool(const RunContext&)>;

/**
 * @brief Plain description of a task, filled in by the caller.
 *
 * @details
 * A definition is turned into an immutable Task by make_task(), which
 * validates it. A task either has a plain `action`, or an `item_source`
 * together with an `item_action`; a task with neither is an aggregate that
 * exists only to pull in its dependencies.
 */
struct TaskDefinition
{
    std::string name;
    std::string description;
    std::vector<std::string> dependencies;
    TaskAction action;
    ItemSource item_source;
    ItemAction item_action;
    TaskGuard guard;
};

/**
 * @brief An immutable, validated task.
 *
 * @details
 * Created only through make_task(). Once constructed nothing about the task
 * can change, so it can be shared between the registry, execution plans and
 * concurrent runs.
 */
class Task
{
public:
    const std::string& name() const noexcept { return m_name; }
    const std::string& description() const noexcept { return m_description; }

    /**
     * @brief Dependencies in declaration order, without duplicates.
     */
    const std::vector<std::string>& dependencies() const noexcept { return m_dependencies; }

    bool has_action() const noexcept { return static_cast<bool>(m_action) || is_iterating(); }
    bool is_iterating() const noexcept { return static_cast<bool>(m_item_source); }
    bool has_guard() const noexcept { return static_cast<bool>(m_guard); }

    /**
     * @brief Evaluate the guard; true when the task has none.
     */
    bool should_run(const RunContext& context) const;

    /**
     * @brief Evaluate the item source. Only valid for iterating tasks.
     */
    std::vector<std::string> items(const RunContext& context) const;

    /**
     * @brief Run the plain action. No-op for aggregate tasks.
     */
    void run(RunContext& context) const;

    /**
     * @brief Run the item action for one item. Only valid for iterating tasks.
     */
    void run_item(RunContext& context, const std::string& item) const;

private:
    explicit Task(TaskDefinition definition);

    friend std::shared_ptr<const Task> make_task(TaskDefinition definition);

    std::string m_name;
    std::string m_description;
    std::vector<std::string> m_dependencies;
    TaskAction m_action;
    ItemSource m_item_source;
    ItemAction m_item_action;
    TaskGuard m_guard;
};

using TaskPtr = std::shared_ptr<const Task>;

/**
 * @brief Validate a definition and produce an immutable Task.
 * @throws InvalidTaskDefinitionError if the name or a dependency name is
 *         empty, it has both a plain action and an item source, or only one
 *         of item_source / item_action is set.
 * @throws CyclicDependencyError if the task lists itself as a dependency.
 */
TaskPtr make_task(TaskDefinition definition);

} // namespace buildflow
