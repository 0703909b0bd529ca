/**
 * @file dependency_graph.cpp
 */
#include "genoflow/common/dependency_graph.hpp"

#include <queue>

namespace genoflow
{

// ============================================================================
// Construction
// ============================================================================

DependencyGraph::DependencyGraph(size_t task_count)
    : m_successors(task_count)
    , m_predecessors(task_count)
{
}

void DependencyGraph::add_task(TaskIdx task_idx)
{
    if (task_idx != task_count())
    {
        throw std::out_of_range(
            "Task index " + std::to_string(task_idx) + " is out of sequence; expected " +
            std::to_string(task_count()));
    }
    m_successors.emplace_back();
    m_predecessors.emplace_back();
}

void DependencyGraph::link_tasks(TaskIdx before, TaskIdx after)
{
    check_index(before, "Before");
    check_index(after, "After");

    auto& succ = m_successors[before];
    if (std::find(succ.begin(), succ.end(), after) != succ.end())
    {
        return;
    }
    succ.push_back(after);
    m_predecessors[after].push_back(before);
    m_links.emplace_back(before, after);
}

void DependencyGraph::check_index(TaskIdx task_idx, const char* role) const
{
    if (task_idx >= task_count())
    {
        throw std::out_of_range(
            std::string{role} + " task index " + std::to_string(task_idx) + " does not exist");
    }
}

// ============================================================================
// Ordering
// ============================================================================

std::vector<size_t> DependencyGraph::run_kahn(std::vector<TaskIdx>& order) const
{
    const size_t n = task_count();
    std::vector<size_t> in_degree(n, 0);
    for (const auto& [before, after] : m_links)
    {
        ++in_degree[after];
    }

    // Min-heap on index: ties are broken by declaration order
    std::priority_queue<TaskIdx, std::vector<TaskIdx>, std::greater<TaskIdx>> ready;
    for (TaskIdx t = 0; t < n; ++t)
    {
        if (in_degree[t] == 0)
        {
            ready.push(t);
        }
    }

    order.clear();
    order.reserve(n);
    while (!ready.empty())
    {
        TaskIdx t = ready.top();
        ready.pop();
        order.push_back(t);

        for (TaskIdx succ : m_successors[t])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }
    return in_degree;
}

std::optional<std::vector<TaskIdx>> DependencyGraph::topological_order() const
{
    std::vector<TaskIdx> order;
    run_kahn(order);
    if (order.size() < task_count())
    {
        return std::nullopt;
    }
    return order;
}

std::vector<TaskIdx> DependencyGraph::unordered_tasks() const
{
    std::vector<TaskIdx> order;
    auto in_degree = run_kahn(order);

    std::vector<TaskIdx> result;
    for (TaskIdx t = 0; t < task_count(); ++t)
    {
        if (in_degree[t] > 0)
        {
            result.push_back(t);
        }
    }
    return result;
}

// ============================================================================
// Reachability
// ============================================================================

bool DependencyGraph::is_reachable_from(TaskIdx from, TaskIdx target) const
{
    check_index(from, "Source");
    check_index(target, "Target");
    if (from == target)
    {
        return true;
    }
    auto reachable = closure(from, m_successors);
    return std::binary_search(reachable.begin(), reachable.end(), target);
}

std::vector<TaskIdx> DependencyGraph::descendants(TaskIdx task_idx) const
{
    check_index(task_idx, "Source");
    return closure(task_idx, m_successors);
}

std::vector<TaskIdx> DependencyGraph::ancestors(TaskIdx task_idx) const
{
    check_index(task_idx, "Source");
    return closure(task_idx, m_predecessors);
}

std::vector<TaskIdx> DependencyGraph::closure(
    TaskIdx start,
    const std::vector<std::vector<TaskIdx>>& adjacency) const
{
    // Iterative DFS
    std::vector<bool> visited(task_count(), false);
    std::vector<TaskIdx> stack(adjacency[start].begin(), adjacency[start].end());
    std::vector<TaskIdx> result;

    while (!stack.empty())
    {
        TaskIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;
        if (current != start)
        {
            result.push_back(current);
        }

        for (TaskIdx next : adjacency[current])
        {
            if (!visited[next])
            {
                stack.push_back(next);
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace genoflow
