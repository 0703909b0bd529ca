/**
 * @file plan_validator.hpp
 * @brief Structural validation of a Plan.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/dependency_graph.hpp"
#include "genoflow/plan/plan.hpp"
#include "genoflow/plan/plan_diagnostics.hpp"

namespace genoflow
{

class TaskRegistry;

/**
 * @brief Check a Plan and collect every problem found.
 *
 * @details
 * Phases, in order:
 * 0. Task ids are non-empty and unique; task types are registered (only
 *    when @p registry is given); config holds no unparsed reference text.
 * 1. Every dependsOn entry names a task of the plan.
 * 2. The dependency relation is acyclic (a self-dependency is a cycle).
 * 3. Every reference in a task's config names a task in its dependsOn.
 *
 * All phases run; each reports independently.
 */
std::shared_ptr<PlanDiagnostics> diagnose_plan(const Plan& plan,
                                               const TaskRegistry* registry = nullptr);

/**
 * @brief Validate a Plan, throwing on the first error category found.
 * @throws PlanError with the code of the first error and the full diagnostics.
 * @return The diagnostics (warnings only) of a valid plan.
 */
std::shared_ptr<const PlanDiagnostics> validate_plan(const Plan& plan,
                                                     const TaskRegistry* registry = nullptr);

/**
 * @brief Dependency graph of a plan, indexed by declaration order.
 * @details Unknown dependsOn entries are ignored.
 */
DependencyGraph build_dependency_graph(const Plan& plan);

} // namespace genoflow
