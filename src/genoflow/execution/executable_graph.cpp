#include "genoflow/execution/executable_graph.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/plan/plan_validator.hpp"

namespace genoflow
{

std::shared_ptr<ExecutableGraph> build_executable_graph(std::shared_ptr<const Plan> plan,
                                                        const TaskRegistry* registry)
{
    if (!plan)
    {
        throw std::invalid_argument("Cannot build an executable graph from a null plan");
    }

    validate_plan(*plan, registry);

    auto graph = std::make_shared<ExecutableGraph>();
    graph->dependencies = build_dependency_graph(*plan);

    auto order = graph->dependencies.topological_order();
    if (!order)
    {
        // Unreachable after validation
        throw PlanError(PlanErrorCode::CyclicDependency, "Plan has no topological order");
    }
    graph->topological_order = std::move(*order);

    const size_t n = plan->task_count();
    graph->topological_rank.resize(n);
    for (size_t rank = 0; rank < n; ++rank)
    {
        graph->topological_rank[graph->topological_order[rank]] = rank;
    }

    graph->predecessor_counts.resize(n);
    graph->successors.resize(n);
    for (TaskIdx tidx = 0; tidx < n; ++tidx)
    {
        graph->predecessor_counts[tidx] = graph->dependencies.predecessors(tidx).size();
        graph->successors[tidx] = graph->dependencies.successors(tidx);
    }

    graph->plan = std::move(plan);
    return graph;
}

} // namespace genoflow
