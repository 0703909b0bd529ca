/**
 * @file executable_graph.hpp
 * @brief Definition of ExecutableGraph structure for task execution.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/dependency_graph.hpp"
#include "genoflow/common/enums.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

class TaskRegistry;

/**
 * @brief Immutable scheduling view of a validated Plan.
 *
 * @details
 * ExecutableGraph contains everything the executor needs to walk a plan:
 * - The plan itself (shared, read-only)
 * - A deterministic topological order and each task's rank in it
 * - Predecessor counts for ready-queue tracking
 * - Successor lists for completion notification
 * - The dependency graph, for transitive skip propagation
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 * - Execution state is tracked externally (in ResultStore and TaskWrapper).
 */
struct ExecutableGraph
{
    std::shared_ptr<const Plan> plan;

    DependencyGraph dependencies;

    /**
     * @brief Task indices in topological order.
     * @details Ties are broken by declaration order.
     */
    std::vector<TaskIdx> topological_order;

    /**
     * @brief topological_rank[tidx] is the position of tidx in topological_order.
     */
    std::vector<size_t> topological_rank;

    /**
     * @brief Number of distinct predecessors for each task.
     */
    std::vector<size_t> predecessor_counts;

    /**
     * @brief successors[tidx] contains the indices of tasks that depend on tidx.
     */
    std::vector<std::vector<TaskIdx>> successors;

    /**
     * @brief Get indices of tasks with no predecessors.
     */
    std::vector<TaskIdx> get_initial_ready_tasks() const
    {
        std::vector<TaskIdx> result;
        for (size_t i = 0; i < predecessor_counts.size(); ++i)
        {
            if (predecessor_counts[i] == 0)
            {
                result.push_back(i);
            }
        }
        return result;
    }

    size_t task_count() const noexcept
    {
        return predecessor_counts.size();
    }
};

/**
 * @brief Validate @p plan and build its ExecutableGraph.
 * @param registry If non-null, task types must be registered in it.
 * @throws PlanError if validation fails; see validate_plan().
 * @throws std::invalid_argument if @p plan is null.
 */
std::shared_ptr<ExecutableGraph> build_executable_graph(std::shared_ptr<const Plan> plan,
                                                        const TaskRegistry* registry);

} // namespace genoflow
