/**
 * @file dependency_graph.hpp
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"

namespace genoflow
{

/**
 * @brief Execution order dependency between two tasks, as (before, after).
 */
using TaskLinkPair = std::pair<TaskIdx, TaskIdx>;

/**
 * @brief Index-based directed graph of task ordering constraints.
 *
 * @details
 * `DependencyGraph` tracks tasks by index (their position in a Plan) and the
 * "before must complete before after" links between them. It answers the
 * questions the planner and executor need: a deterministic topological order,
 * which tasks sit on a cycle, reachability, and the downstream closure of a
 * task.
 *
 * @par Index requirements
 * Tasks are added sequentially starting from 0. Links may only name tasks
 * that were already added.
 *
 * @par Cycles
 * Links are recorded even when they close a cycle (including self-links) so
 * that validation can report every offending task rather than stopping at the
 * first bad link.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class DependencyGraph
{
public:
    DependencyGraph() = default;

    /**
     * @brief Construct a graph with tasks 0..task_count-1 and no links.
     */
    explicit DependencyGraph(size_t task_count);

    size_t task_count() const noexcept
    {
        return m_successors.size();
    }

    size_t link_count() const noexcept
    {
        return m_links.size();
    }

    /**
     * @brief Add a task.
     * @param task_idx Must equal the current `task_count()`.
     * @throw std::out_of_range if task_idx is out of sequence.
     */
    void add_task(TaskIdx task_idx);

    /**
     * @brief Record that @p before must complete before @p after starts.
     * @throw std::out_of_range if either index does not exist.
     * @note Duplicate links are ignored.
     */
    void link_tasks(TaskIdx before, TaskIdx after);

    /**
     * @brief Compute a topological order using Kahn's algorithm.
     *
     * @details
     * Among tasks that are ready at the same time, the one with the lowest
     * index (earliest declaration) comes first, so the order is fully
     * deterministic.
     *
     * @return The order, or std::nullopt if the graph contains a cycle.
     */
    std::optional<std::vector<TaskIdx>> topological_order() const;

    /**
     * @brief Tasks that cannot be ordered because they lie on, or downstream of, a cycle.
     * @return Empty if the graph is acyclic. Sorted by index.
     */
    std::vector<TaskIdx> unordered_tasks() const;

    /**
     * @brief Check whether @p target can be reached from @p from along links.
     * @note A task is reachable from itself.
     */
    bool is_reachable_from(TaskIdx from, TaskIdx target) const;

    /**
     * @brief All tasks transitively downstream of @p task_idx, excluding itself.
     * @return Sorted by index.
     */
    std::vector<TaskIdx> descendants(TaskIdx task_idx) const;

    /**
     * @brief All tasks transitively upstream of @p task_idx, excluding itself.
     * @return Sorted by index.
     */
    std::vector<TaskIdx> ancestors(TaskIdx task_idx) const;

    const std::vector<TaskIdx>& successors(TaskIdx task_idx) const
    {
        return m_successors.at(task_idx);
    }

    const std::vector<TaskIdx>& predecessors(TaskIdx task_idx) const
    {
        return m_predecessors.at(task_idx);
    }

    const std::vector<TaskLinkPair>& links() const noexcept
    {
        return m_links;
    }

private:
    /// Kahn's algorithm; fills @p order and returns the in-degree left on each task.
    std::vector<size_t> run_kahn(std::vector<TaskIdx>& order) const;

    /// Iterative DFS over either adjacency direction.
    std::vector<TaskIdx> closure(TaskIdx start,
                                 const std::vector<std::vector<TaskIdx>>& adjacency) const;

    void check_index(TaskIdx task_idx, const char* role) const;

    /// Links in insertion order: (before, after).
    std::vector<TaskLinkPair> m_links;

    /// Adjacency lists, indexed by task index.
    std::vector<std::vector<TaskIdx>> m_successors;
    std::vector<std::vector<TaskIdx>> m_predecessors;
};

} // namespace genoflow
