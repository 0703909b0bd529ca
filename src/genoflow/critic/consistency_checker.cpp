#include "genoflow/critic/consistency_checker.hpp"
#include "genoflow/critic/consistency_checks.hpp"
#include "genoflow/plan/plan_validator.hpp"

namespace genoflow
{

// ============================================================================
// CheckContext
// ============================================================================

CheckContext::CheckContext(const Plan& plan,
                           const std::vector<TaskResult>& results,
                           const TaskRegistry* registry)
    : m_plan{plan}
    , m_results{results}
    , m_registry{registry}
    , m_graph{build_dependency_graph(plan)}
{
}

const TaskResult* CheckContext::result_for(const std::string& task_id) const
{
    return find_result(m_results, task_id);
}

const TaskContract* CheckContext::contract_for(const TaskSpec& task) const
{
    return m_registry ? m_registry->contract(task.type) : nullptr;
}

const TaskContract* CheckContext::contract_for(const std::string& task_id) const
{
    const TaskSpec* task = m_plan.find_task(task_id);
    return task ? contract_for(*task) : nullptr;
}

// ============================================================================
// ConsistencyChecker
// ============================================================================

ConsistencyChecker::ConsistencyChecker(std::shared_ptr<const TaskRegistry> registry,
                                       LoggerPtr logger,
                                       const CriticSettings& settings)
    : m_registry{std::move(registry)}
    , m_logger{std::move(logger)}
    , m_checks{default_consistency_checks(settings)}
{
}

void ConsistencyChecker::add_check(ConsistencyCheckPtr check)
{
    if (!check)
    {
        throw std::invalid_argument("ConsistencyChecker::add_check: check is null");
    }
    m_checks.push_back(std::move(check));
}

FindingsReport ConsistencyChecker::check(const Plan& plan,
                                         const std::vector<TaskResult>& results) const
{
    FindingsReport report;

    bool any_succeeded = std::any_of(results.begin(), results.end(), [](const TaskResult& r) {
        return r.status == TaskStatus::Succeeded;
    });
    if (!any_succeeded)
    {
        report.add(Finding{Severity::Info, FindingCategory::NothingToCheck, {}, {},
                           "No task succeeded; consistency checks skipped"});
        if (m_logger)
        {
            SPDLOG_LOGGER_INFO(m_logger, "Consistency check: {}", report.summary());
        }
        return report;
    }

    CheckContext context{plan, results, m_registry.get()};

    for (const auto& check : m_checks)
    {
        std::string failure;
        try
        {
            check->run(context, report);
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }
        catch (...)
        {
            failure = "unknown exception";
        }

        if (!failure.empty())
        {
            report.add(Finding{Severity::Error, FindingCategory::CheckAborted, {}, {},
                               "Check '" + check->name() + "' aborted: " + failure});
            if (m_logger)
            {
                SPDLOG_LOGGER_ERROR(m_logger, "Consistency check '{}' aborted: {}",
                                    check->name(), failure);
            }
        }
    }

    if (m_logger)
    {
        for (const auto& finding : report.findings())
        {
            switch (finding.severity)
            {
            case Severity::Error:
                SPDLOG_LOGGER_ERROR(m_logger, "[{}] {}", to_string(finding.category), finding.message);
                break;
            case Severity::Warning:
                SPDLOG_LOGGER_WARN(m_logger, "[{}] {}", to_string(finding.category), finding.message);
                break;
            case Severity::Info:
                SPDLOG_LOGGER_DEBUG(m_logger, "[{}] {}", to_string(finding.category), finding.message);
                break;
            }
        }
        SPDLOG_LOGGER_INFO(m_logger, "Consistency check: {}", report.summary());
    }
    return report;
}

} // namespace genoflow
