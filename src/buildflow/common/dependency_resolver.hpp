/**
 * @file dependency_resolver.hpp
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/common/task_registry.hpp"
#include "buildflow/execution/execution_plan.hpp"

namespace buildflow
{

/**
 * @brief Expands a target into an ordered, deduplicated execution plan.
 *
 * @details
 * Resolution is a depth-first traversal from the target. Dependencies are
 * visited in declaration order and each task is emitted after all of its
 * dependencies, so the first path that reaches a shared dependency decides
 * where it appears.
 *
 * Two marker sets drive the traversal:
 * - "visiting": tasks on the current path. Reaching one again is a cycle.
 * - "done": tasks already emitted. They are neither re-emitted nor
 *   re-traversed.
 *
 * The whole plan is computed before anything runs, so unknown names and
 * cycles are reported without any task having produced side effects.
 *
 * @par Thread safety
 * - resolve() does not modify the registry; concurrent calls are safe if the
 *   registry is not being modified.
 */
class DependencyResolver
{
public:
    explicit DependencyResolver(const TaskRegistry& registry);

    /**
     * @brief Compute the execution plan for a target.
     * @param target Name of the requested task.
     * @return The plan; the target is its last task.
     * @throws UnknownTaskError if the target or any transitive dependency is
     *         not registered.
     * @throws CyclicDependencyError if a cycle is reachable from the target.
     */
    ExecutionPlan resolve(const std::string& target) const;

    /**
     * @brief Resolve every registered task.
     * @details Surfaces unknown dependencies and cycles anywhere in the
     *          registry, not only those reachable from one target.
     * @throws UnknownTaskError, CyclicDependencyError as resolve().
     */
    void validate_all() const;

private:
    const TaskRegistry& m_registry;
};

} // namespace buildflow
