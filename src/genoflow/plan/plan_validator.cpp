#include "genoflow/plan/plan_validator.hpp"
#include "genoflow/common/value.inline.hpp"
#include "genoflow/execution/task_registry.hpp"
#include "genoflow/plan/references.hpp"
#include <sstream>

namespace genoflow
{

// ============================================================================
// Diagnostics helpers
// ============================================================================

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::EmptyTaskId:
        return "EmptyTaskId";
    case DiagnosticCategory::DuplicateTaskId:
        return "DuplicateTaskId";
    case DiagnosticCategory::UnknownTaskType:
        return "UnknownTaskType";
    case DiagnosticCategory::MalformedReference:
        return "MalformedReference";
    case DiagnosticCategory::UnknownDependency:
        return "UnknownDependency";
    case DiagnosticCategory::DuplicateDependency:
        return "DuplicateDependency";
    case DiagnosticCategory::Cycle:
        return "Cycle";
    case DiagnosticCategory::UndeclaredDependency:
        return "UndeclaredDependency";
    }
    return "Unknown";
}

PlanErrorCode error_code_for(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::UnknownDependency:
        return PlanErrorCode::UnknownDependency;
    case DiagnosticCategory::Cycle:
        return PlanErrorCode::CyclicDependency;
    case DiagnosticCategory::UndeclaredDependency:
        return PlanErrorCode::UndeclaredDependency;
    default:
        return PlanErrorCode::InvalidConfiguration;
    }
}

std::string PlanDiagnostics::describe_errors() const
{
    std::ostringstream oss;
    oss << "Plan validation failed with " << m_errors.size() << " error(s):";
    for (const auto& item : m_errors)
    {
        oss << "\n  - [" << to_string(item.category) << "] " << item.message;
    }
    return oss.str();
}

// ============================================================================
// Validation phases
// ============================================================================

namespace
{

using IdIndex = std::unordered_map<std::string, TaskIdx>;

void find_reference_text(const Value& value, std::vector<std::string>& out)
{
    switch (value.kind())
    {
    case ValueKind::String:
        if (OutputReference::mentions_reference(value.as<std::string>()))
        {
            out.push_back(value.as<std::string>());
        }
        break;
    case ValueKind::List:
        for (const auto& item : value.as<Value::List>())
        {
            find_reference_text(item, out);
        }
        break;
    case ValueKind::Map:
        for (const auto& [key, item] : value.as<Value::Map>())
        {
            find_reference_text(item, out);
        }
        break;
    default:
        break;
    }
}

IdIndex check_identity(const Plan& plan, const TaskRegistry* registry, PlanDiagnostics& diags)
{
    IdIndex index;
    for (TaskIdx tidx = 0; tidx < plan.task_count(); ++tidx)
    {
        const auto& task = plan.tasks[tidx];
        if (task.id.empty())
        {
            diags.add(DiagnosticItem{
                Severity::Error, DiagnosticCategory::EmptyTaskId,
                "Task #" + std::to_string(tidx) + " has an empty id", {}, {}});
        }
        else if (!index.emplace(task.id, tidx).second)
        {
            diags.add(DiagnosticItem{
                Severity::Error, DiagnosticCategory::DuplicateTaskId,
                "Task id '" + task.id + "' is declared more than once", {task.id}, {}});
        }

        if (registry && !registry->contains(task.type))
        {
            diags.add(DiagnosticItem{
                Severity::Error, DiagnosticCategory::UnknownTaskType,
                "Task '" + task.id + "' has unregistered type '" + task.type + "'", {task.id}, {}});
        }

        std::vector<std::string> texts;
        for (const auto& [key, value] : task.config)
        {
            find_reference_text(value, texts);
        }
        for (const auto& text : texts)
        {
            diags.add(DiagnosticItem{
                Severity::Error, DiagnosticCategory::MalformedReference,
                "Task '" + task.id + "' config contains unparsed reference text \"" + text + "\"",
                {task.id}, {}});
        }
    }
    return index;
}

void check_dependencies(const Plan& plan, const IdIndex& index, PlanDiagnostics& diags)
{
    for (const auto& task : plan.tasks)
    {
        std::set<std::string> seen;
        for (const auto& dep : task.depends_on)
        {
            if (!seen.insert(dep).second)
            {
                diags.add(DiagnosticItem{
                    Severity::Warning, DiagnosticCategory::DuplicateDependency,
                    "Task '" + task.id + "' lists dependency '" + dep + "' more than once",
                    {task.id, dep}, {}});
                continue;
            }
            if (index.find(dep) == index.end())
            {
                diags.add(DiagnosticItem{
                    Severity::Error, DiagnosticCategory::UnknownDependency,
                    "Task '" + task.id + "' depends on unknown task '" + dep + "'",
                    {task.id, dep}, {}});
            }
        }
    }
}

void check_cycles(const Plan& plan, PlanDiagnostics& diags)
{
    DependencyGraph graph = build_dependency_graph(plan);
    auto unordered = graph.unordered_tasks();
    if (unordered.empty())
    {
        return;
    }

    // Keep only tasks that lie on a cycle; the rest are merely downstream of one
    std::vector<std::string> on_cycle;
    for (TaskIdx tidx : unordered)
    {
        const auto& succ = graph.successors(tidx);
        bool cyclic = std::any_of(succ.begin(), succ.end(), [&](TaskIdx s) {
            return graph.is_reachable_from(s, tidx);
        });
        if (cyclic)
        {
            on_cycle.push_back(plan.tasks[tidx].id);
        }
    }

    std::string names;
    for (const auto& id : on_cycle)
    {
        if (!names.empty()) names += ", ";
        names += "'" + id + "'";
    }
    diags.add(DiagnosticItem{
        Severity::Error, DiagnosticCategory::Cycle,
        "Cyclic dependency among tasks " + names, on_cycle, {}});
}

void check_references(const Plan& plan, PlanDiagnostics& diags)
{
    for (const auto& task : plan.tasks)
    {
        std::set<OutputReference> reported;
        for (const auto& ref : collect_references(task.config))
        {
            if (task.depends_on_task(ref.task_id) || !reported.insert(ref).second)
            {
                continue;
            }
            diags.add(DiagnosticItem{
                Severity::Error, DiagnosticCategory::UndeclaredDependency,
                "Task '" + task.id + "' references " + ref.to_string() +
                    " but does not declare a dependency on '" + ref.task_id + "'",
                {task.id, ref.task_id}, ref.output_key});
        }
    }
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

DependencyGraph build_dependency_graph(const Plan& plan)
{
    DependencyGraph graph(plan.task_count());
    for (TaskIdx tidx = 0; tidx < plan.task_count(); ++tidx)
    {
        for (const auto& dep : plan.tasks[tidx].depends_on)
        {
            if (auto didx = plan.index_of(dep))
            {
                graph.link_tasks(*didx, tidx);
            }
        }
    }
    return graph;
}

std::shared_ptr<PlanDiagnostics> diagnose_plan(const Plan& plan, const TaskRegistry* registry)
{
    auto diags = std::make_shared<PlanDiagnostics>();
    IdIndex index = check_identity(plan, registry, *diags);
    check_dependencies(plan, index, *diags);
    check_cycles(plan, *diags);
    check_references(plan, *diags);
    return diags;
}

std::shared_ptr<const PlanDiagnostics> validate_plan(const Plan& plan, const TaskRegistry* registry)
{
    auto diags = diagnose_plan(plan, registry);
    if (diags->has_errors())
    {
        PlanErrorCode code = error_code_for(diags->errors().front().category);
        throw PlanError(code, diags->describe_errors(), diags);
    }
    return diags;
}

} // namespace genoflow
