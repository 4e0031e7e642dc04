/**
 * @file dependency_resolver.cpp
 */
#include "buildflow/common/dependency_resolver.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <algorithm>

namespace buildflow
{

namespace
{

/// Traversal state for one resolve() call.
struct ResolveState
{
    const TaskRegistry& registry;
    ExecutionPlan plan;

    /// Tasks on the current DFS path, outermost first.
    std::vector<std::string> path;
    std::unordered_set<std::string> visiting;

    /// Plan position of every emitted task.
    std::unordered_map<std::string, size_t> done;
};

void visit(ResolveState& state, const std::string& name, const std::string& referenced_by)
{
    if (state.done.count(name) != 0)
    {
        return;
    }

    if (state.visiting.count(name) != 0)
    {
        // Cycle runs from the first occurrence of name on the path back to it
        auto first = std::find(state.path.begin(), state.path.end(), name);
        std::vector<std::string> cycle(first, state.path.end());
        cycle.push_back(name);
        throw CyclicDependencyError(std::move(cycle));
    }

    if (!state.registry.contains(name))
    {
        throw UnknownTaskError(name, referenced_by);
    }
    const TaskPtr& task = state.registry.lookup(name);

    state.visiting.insert(name);
    state.path.push_back(name);

    for (const auto& dependency : task->dependencies())
    {
        visit(state, dependency, name);
    }

    state.path.pop_back();
    state.visiting.erase(name);

    std::vector<size_t> positions;
    positions.reserve(task->dependencies().size());
    for (const auto& dependency : task->dependencies())
    {
        positions.push_back(state.done.at(dependency));
    }

    state.done.emplace(name, state.plan.tasks.size());
    state.plan.tasks.push_back(task);
    state.plan.dependency_positions.push_back(std::move(positions));
}

} // namespace

DependencyResolver::DependencyResolver(const TaskRegistry& registry)
    : m_registry(registry)
{
}

ExecutionPlan DependencyResolver::resolve(const std::string& target) const
{
    ResolveState state{m_registry, {}, {}, {}, {}};
    state.plan.target = target;
    visit(state, target, std::string());
    return std::move(state.plan);
}

void DependencyResolver::validate_all() const
{
    for (const auto& task : m_registry.tasks())
    {
        resolve(task->name());
    }
}

} // namespace buildflow
