#include "genoflow/critic/consistency_checks.hpp"
#include "genoflow/common/value.inline.hpp"
#include "genoflow/plan/references.hpp"
#include <cctype>
#include <set>
#include <sstream>

namespace genoflow
{

namespace
{

std::string quoted(const std::string& text)
{
    return "'" + text + "'";
}

std::string join_limited(const std::vector<std::string>& items, size_t limit = 5)
{
    std::string result;
    for (size_t i = 0; i < items.size() && i < limit; ++i)
    {
        if (i > 0) result += ", ";
        result += items[i];
    }
    if (items.size() > limit)
    {
        result += ", ... (" + std::to_string(items.size() - limit) + " more)";
    }
    return result;
}

/// Distinct references of a task's config, in order of first appearance.
std::vector<OutputReference> distinct_references(const TaskSpec& task)
{
    std::vector<OutputReference> result;
    std::set<OutputReference> seen;
    for (auto& ref : collect_references(task.config))
    {
        if (seen.insert(ref).second)
        {
            result.push_back(std::move(ref));
        }
    }
    return result;
}

std::string entity_name(const Value& value)
{
    if (auto text = value.try_as<std::string>())
    {
        return *text;
    }
    return value.describe();
}

/// Entity ids of a Succeeded task, or nullopt if it has none to compare.
std::optional<std::set<std::string>> entity_set(const CheckContext& context, const TaskSpec& task)
{
    const TaskContract* contract = context.contract_for(task);
    if (!contract || contract->entity_key.empty())
    {
        return std::nullopt;
    }
    const TaskResult* result = context.result_for(task.id);
    if (!result || result->status != TaskStatus::Succeeded)
    {
        return std::nullopt;
    }
    const Value* value = find_key(result->outputs, contract->entity_key);
    if (!value)
    {
        return std::nullopt;
    }
    const auto* list = value->try_as<Value::List>();
    if (!list)
    {
        return std::nullopt;
    }
    std::set<std::string> ids;
    for (const auto& item : *list)
    {
        ids.insert(entity_name(item));
    }
    return ids;
}

bool has_entity_key(const CheckContext& context, const TaskSpec& task)
{
    const TaskContract* contract = context.contract_for(task);
    return contract && !contract->entity_key.empty();
}

/// Nearest ancestors that carry an entity key: the search stops at each one found.
std::vector<TaskIdx> nearest_entity_ancestors(const CheckContext& context, TaskIdx start)
{
    const Plan& plan = context.plan();
    const DependencyGraph& graph = context.graph();

    std::vector<TaskIdx> found;
    std::vector<bool> visited(plan.task_count(), false);
    std::vector<TaskIdx> stack(graph.predecessors(start).begin(), graph.predecessors(start).end());
    while (!stack.empty())
    {
        TaskIdx tidx = stack.back();
        stack.pop_back();
        if (visited[tidx] || tidx == start)
        {
            continue;
        }
        visited[tidx] = true;
        if (has_entity_key(context, plan.tasks[tidx]))
        {
            found.push_back(tidx);
            continue;
        }
        for (TaskIdx pred : graph.predecessors(tidx))
        {
            stack.push_back(pred);
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

void collect_numbers(const Value& value, std::vector<double>& out)
{
    switch (value.kind())
    {
    case ValueKind::Int:
    case ValueKind::Double:
        out.push_back(value.to_double());
        break;
    case ValueKind::List:
        for (const auto& item : value.as<Value::List>())
        {
            collect_numbers(item, out);
        }
        break;
    case ValueKind::Map:
        for (const auto& [key, item] : value.as<Value::Map>())
        {
            collect_numbers(item, out);
        }
        break;
    default:
        break;
    }
}

std::string format_number(double value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

const Value::List* list_output(const TaskResult& result, const std::string& key)
{
    const Value* value = find_key(result.outputs, key);
    return value ? value->try_as<Value::List>() : nullptr;
}

bool is_pathogenic(const Value& significance)
{
    const auto* text = significance.try_as<std::string>();
    if (!text)
    {
        return false;
    }
    std::string lowered = *text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "pathogenic" || lowered == "likely_pathogenic" ||
           lowered == "pathogenic/likely_pathogenic";
}

} // namespace

// ============================================================================
// ResultAlignmentCheck
// ============================================================================

void ResultAlignmentCheck::run(const CheckContext& context, FindingsReport& report) const
{
    const Plan& plan = context.plan();
    const auto& results = context.results();

    for (const auto& task : plan.tasks)
    {
        auto count = std::count_if(results.begin(), results.end(),
                                   [&task](const TaskResult& r) { return r.task_id == task.id; });
        if (count == 0)
        {
            report.add(Finding{Severity::Error, FindingCategory::ResultAlignment, {task.id}, {},
                               "No result recorded for task " + quoted(task.id)});
        }
        else if (count > 1)
        {
            report.add(Finding{Severity::Error, FindingCategory::ResultAlignment, {task.id}, {},
                               std::to_string(count) + " results recorded for task " +
                                   quoted(task.id)});
        }
    }

    for (const auto& result : results)
    {
        if (!plan.find_task(result.task_id))
        {
            report.add(Finding{Severity::Warning, FindingCategory::ResultAlignment,
                               {result.task_id}, {},
                               "Result for task " + quoted(result.task_id) +
                                   " which is not in the plan"});
        }
        else if (!result.is_terminal())
        {
            report.add(Finding{Severity::Error, FindingCategory::ResultAlignment,
                               {result.task_id}, {},
                               "Task " + quoted(result.task_id) + " is still " +
                                   to_string(result.status) + " after the run"});
        }
    }
}

// ============================================================================
// ReferentialIntegrityCheck
// ============================================================================

void ReferentialIntegrityCheck::run(const CheckContext& context, FindingsReport& report) const
{
    for (const auto& consumer : context.plan().tasks)
    {
        for (const auto& ref : distinct_references(consumer))
        {
            const std::string& producer = ref.task_id;
            const std::string& key = ref.output_key;
            const std::string where = "output " + quoted(key) + " of task " + quoted(producer) +
                                      " referenced by task " + quoted(consumer.id);

            if (!context.plan().find_task(producer))
            {
                report.add(Finding{Severity::Error, FindingCategory::ReferentialIntegrity,
                                   {producer, consumer.id}, {key},
                                   "Reference to " + where + ": producer is not in the plan"});
                continue;
            }

            const TaskContract* contract = context.contract_for(producer);
            bool declared = contract && contract->declares_output(key);
            const TaskResult* result = context.result_for(producer);

            if (result && result->status == TaskStatus::Succeeded)
            {
                const Value* value = find_key(result->outputs, key);
                if (!value || value->is_null())
                {
                    report.add(Finding{Severity::Error, FindingCategory::ReferentialIntegrity,
                                       {producer, consumer.id}, {key},
                                       std::string(value ? "Null " : "Missing ") + where});
                }
                else if (contract && !declared)
                {
                    report.add(Finding{Severity::Info, FindingCategory::ReferentialIntegrity,
                                       {producer, consumer.id}, {key},
                                       "Present but undeclared " + where});
                }
            }
            else if (contract && !declared)
            {
                report.add(Finding{Severity::Error, FindingCategory::ReferentialIntegrity,
                                   {producer, consumer.id}, {key},
                                   "Undeclared " + where + " can never be satisfied"});
            }
        }
    }
}

// ============================================================================
// CoverageCheck
// ============================================================================

void CoverageCheck::run(const CheckContext& context, FindingsReport& report) const
{
    const Plan& plan = context.plan();

    for (TaskIdx tidx = 0; tidx < plan.task_count(); ++tidx)
    {
        const TaskSpec& task = plan.tasks[tidx];
        auto downstream = entity_set(context, task);
        if (!downstream)
        {
            continue;
        }
        const TaskContract* contract = context.contract_for(task);

        for (TaskIdx up_idx : nearest_entity_ancestors(context, tidx))
        {
            const TaskSpec& upstream_task = plan.tasks[up_idx];
            auto upstream = entity_set(context, upstream_task);
            if (!upstream)
            {
                continue;
            }

            std::vector<std::string> added;
            std::set_difference(downstream->begin(), downstream->end(),
                                upstream->begin(), upstream->end(),
                                std::back_inserter(added));
            if (!added.empty())
            {
                report.add(Finding{Severity::Warning, FindingCategory::Coverage,
                                   {upstream_task.id, task.id}, {contract->entity_key},
                                   "Task " + quoted(task.id) + " reports " +
                                       std::to_string(added.size()) +
                                       " entity id(s) absent upstream in " +
                                       quoted(upstream_task.id) + ": " + join_limited(added)});
            }

            std::vector<std::string> dropped;
            std::set_difference(upstream->begin(), upstream->end(),
                                downstream->begin(), downstream->end(),
                                std::back_inserter(dropped));
            if (!dropped.empty() && !contract->is_filter)
            {
                report.add(Finding{Severity::Warning, FindingCategory::Coverage,
                                   {upstream_task.id, task.id}, {contract->entity_key},
                                   "Task " + quoted(task.id) + " dropped " +
                                       std::to_string(dropped.size()) + " of " +
                                       std::to_string(upstream->size()) + " entity id(s) from " +
                                       quoted(upstream_task.id) + ": " + join_limited(dropped)});
            }
        }
    }
}

// ============================================================================
// ValueRangeCheck
// ============================================================================

void ValueRangeCheck::run(const CheckContext& context, FindingsReport& report) const
{
    for (const auto& task : context.plan().tasks)
    {
        const TaskContract* contract = context.contract_for(task);
        const TaskResult* result = context.result_for(task.id);
        if (!contract || !result || result->status != TaskStatus::Succeeded)
        {
            continue;
        }

        for (const auto& [key, range] : contract->ranges)
        {
            const Value* value = find_key(result->outputs, key);
            if (!value)
            {
                continue;
            }
            std::vector<double> numbers;
            collect_numbers(*value, numbers);

            size_t offending = 0;
            std::optional<double> first;
            for (double number : numbers)
            {
                if (!range.contains(number))
                {
                    ++offending;
                    if (!first) first = number;
                }
            }
            if (offending > 0)
            {
                report.add(Finding{Severity::Warning, FindingCategory::ValueRange,
                                   {task.id}, {key},
                                   "Output " + quoted(key) + " of task " + quoted(task.id) + " has " +
                                       std::to_string(offending) + " value(s) outside [" +
                                       format_number(range.min) + ", " +
                                       format_number(range.max) + "], first " +
                                       format_number(*first)});
            }
        }
    }
}

// ============================================================================
// SkippedImpactCheck
// ============================================================================

void SkippedImpactCheck::run(const CheckContext& context, FindingsReport& report) const
{
    for (const auto& task : context.plan().tasks)
    {
        const TaskResult* result = context.result_for(task.id);
        if (!result || result->status != TaskStatus::Succeeded)
        {
            continue;
        }

        std::vector<std::string> inputs = task.depends_on;
        for (const auto& ref : distinct_references(task))
        {
            if (!task.depends_on_task(ref.task_id))
            {
                inputs.push_back(ref.task_id);
            }
        }

        std::set<std::string> seen;
        for (const auto& input : inputs)
        {
            if (!seen.insert(input).second)
            {
                continue;
            }
            const TaskResult* input_result = context.result_for(input);
            if (input_result && input_result->status != TaskStatus::Succeeded)
            {
                report.add(Finding{Severity::Error, FindingCategory::SkippedImpact,
                                   {task.id, input}, {},
                                   "Task " + quoted(task.id) + " succeeded although its input " +
                                       quoted(input) + " is " + to_string(input_result->status) +
                                       " (executor defect)"});
            }
        }
    }
}

// ============================================================================
// ScoreEvidenceCheck
// ============================================================================

ScoreEvidenceCheck::ScoreEvidenceCheck(const CriticSettings& settings)
    : m_scoring_task{settings.scoring_task}
    , m_evidence_task{settings.evidence_task}
    , m_high_score{settings.high_score}
    , m_low_score{settings.low_score}
{
}

void ScoreEvidenceCheck::run(const CheckContext& context, FindingsReport& report) const
{
    if (!context.plan().find_task(m_scoring_task) || !context.plan().find_task(m_evidence_task))
    {
        return;
    }
    const TaskResult* scoring = context.result_for(m_scoring_task);
    const TaskResult* evidence = context.result_for(m_evidence_task);
    if (!scoring || scoring->status != TaskStatus::Succeeded ||
        !evidence || evidence->status != TaskStatus::Succeeded)
    {
        return;
    }

    const Value::List* scored_ids = list_output(*scoring, "variant_ids");
    const Value::List* scores = list_output(*scoring, "scores");
    const Value::List* evidence_ids = list_output(*evidence, "variant_ids");
    if (!scored_ids || !scores || !evidence_ids)
    {
        return;
    }
    const Value::List* counts = list_output(*evidence, "evidence_counts");
    const Value::List* significance = list_output(*evidence, "clinical_significance");

    auto misaligned = [&report](const std::string& task, const std::string& key, size_t values,
                                size_t ids) {
        report.add(Finding{Severity::Error, FindingCategory::ScoreEvidence, {task}, {key},
                           "Output " + quoted(key) + " of task " + quoted(task) + " has " +
                               std::to_string(values) + " value(s) for " +
                               std::to_string(ids) + " variant(s)"});
    };
    if (scores->size() != scored_ids->size())
    {
        misaligned(m_scoring_task, "scores", scores->size(), scored_ids->size());
        return;
    }
    if (counts && counts->size() != evidence_ids->size())
    {
        misaligned(m_evidence_task, "evidence_counts", counts->size(), evidence_ids->size());
        return;
    }
    if (significance && significance->size() != evidence_ids->size())
    {
        misaligned(m_evidence_task, "clinical_significance", significance->size(),
                   evidence_ids->size());
        return;
    }

    std::map<std::string, double> score_of;
    for (size_t i = 0; i < scored_ids->size(); ++i)
    {
        if ((*scores)[i].is_numeric())
        {
            score_of.emplace(entity_name((*scored_ids)[i]), (*scores)[i].to_double());
        }
    }

    for (size_t i = 0; i < evidence_ids->size(); ++i)
    {
        const std::string variant = entity_name((*evidence_ids)[i]);
        auto it = score_of.find(variant);
        if (it == score_of.end())
        {
            continue;
        }
        double score = it->second;

        if (counts && (*counts)[i].is_numeric() && score > m_high_score &&
            (*counts)[i].to_double() <= 0.0)
        {
            report.add(Finding{Severity::Warning, FindingCategory::ScoreEvidence,
                               {m_scoring_task, m_evidence_task}, {"scores", "evidence_counts"},
                               "Variant " + variant + " has high impact score " +
                                   format_number(score) + " but no supporting evidence"});
        }
        if (significance && score < m_low_score && is_pathogenic((*significance)[i]))
        {
            report.add(Finding{Severity::Error, FindingCategory::ScoreEvidence,
                               {m_scoring_task, m_evidence_task},
                               {"scores", "clinical_significance"},
                               "Variant " + variant + " has low impact score " +
                                   format_number(score) + " but is classified " +
                                   (*significance)[i].as<std::string>()});
        }
    }
}

std::vector<ConsistencyCheckPtr> default_consistency_checks(const CriticSettings& settings)
{
    std::vector<ConsistencyCheckPtr> checks{
        std::make_shared<ResultAlignmentCheck>(),
        std::make_shared<ReferentialIntegrityCheck>(),
        std::make_shared<CoverageCheck>(),
        std::make_shared<ValueRangeCheck>(),
        std::make_shared<SkippedImpactCheck>()};
    if (settings.check_score_evidence)
    {
        checks.push_back(std::make_shared<ScoreEvidenceCheck>(settings));
    }
    return checks;
}

} // namespace genoflow
