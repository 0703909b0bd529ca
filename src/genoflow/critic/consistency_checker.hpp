/**
 * @file consistency_checker.hpp
 * @brief Post-run consistency checks over a Plan and its TaskResults.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/dependency_graph.hpp"
#include "genoflow/common/log.hpp"
#include "genoflow/critic/findings.hpp"
#include "genoflow/execution/task_registry.hpp"
#include "genoflow/execution/task_result.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

/**
 * @brief Read-only view of one completed run, shared by all checks.
 */
class CheckContext
{
public:
    /**
     * @param registry Source of task contracts; may be null, in which case
     *        contract-based checks find nothing to compare against.
     */
    CheckContext(const Plan& plan,
                 const std::vector<TaskResult>& results,
                 const TaskRegistry* registry);

    const Plan& plan() const noexcept
    {
        return m_plan;
    }

    const std::vector<TaskResult>& results() const noexcept
    {
        return m_results;
    }

    /**
     * @brief Links from `depends_on`; unknown dependencies are left out.
     */
    const DependencyGraph& graph() const noexcept
    {
        return m_graph;
    }

    /**
     * @brief The first result recorded for @p task_id, or nullptr.
     */
    const TaskResult* result_for(const std::string& task_id) const;

    /**
     * @brief The contract of @p task's type, or nullptr.
     */
    const TaskContract* contract_for(const TaskSpec& task) const;

    const TaskContract* contract_for(const std::string& task_id) const;

private:
    const Plan& m_plan;
    const std::vector<TaskResult>& m_results;
    const TaskRegistry* m_registry;
    DependencyGraph m_graph;
};

/**
 * @brief One consistency check.
 *
 * @details
 * A check appends findings to the report and never mutates results. A
 * check may throw; the checker turns the exception into a CheckAborted
 * finding and carries on with the next check.
 */
class IConsistencyCheck
{
public:
    virtual ~IConsistencyCheck() = default;

    /**
     * @brief Short name used in logs and CheckAborted findings.
     */
    virtual std::string name() const = 0;

    virtual void run(const CheckContext& context, FindingsReport& report) const = 0;
};

using ConsistencyCheckPtr = std::shared_ptr<const IConsistencyCheck>;

/**
 * @brief Settings of the default checks.
 */
struct CriticSettings
{
    /// Cross-check impact scores against retrieved evidence.
    bool check_score_evidence{true};

    std::string scoring_task{"scoring"};
    std::string evidence_task{"evidence_rag"};

    /// A score above this needs at least one piece of supporting evidence.
    double high_score{0.7};

    /// A score below this must not come with pathogenic evidence.
    double low_score{0.3};
};

/**
 * @brief Runs a list of checks over a completed run and collects the findings.
 *
 * @details
 * The default checks, in order: result alignment, referential integrity,
 * coverage, value range, skipped-task impact and, unless switched off in
 * the settings, score/evidence agreement. Every check runs even if an
 * earlier one reported errors.
 *
 * If no task Succeeded, no check runs and the report holds a single Info
 * finding of category NothingToCheck.
 *
 * @par Thread safety
 * - check() is const and may be called concurrently once setup is done.
 * - add_check() is not synchronized.
 */
class ConsistencyChecker
{
public:
    /**
     * @brief Create a checker with the default checks.
     */
    explicit ConsistencyChecker(std::shared_ptr<const TaskRegistry> registry = nullptr,
                                LoggerPtr logger = nullptr,
                                const CriticSettings& settings = {});

    /**
     * @brief Append a check; it runs after the ones already present.
     * @throws std::invalid_argument if @p check is null.
     */
    void add_check(ConsistencyCheckPtr check);

    const std::vector<ConsistencyCheckPtr>& checks() const noexcept
    {
        return m_checks;
    }

    /**
     * @brief Check @p results against @p plan and the registered contracts.
     * @note Never throws for inconsistent input; problems become findings.
     */
    FindingsReport check(const Plan& plan, const std::vector<TaskResult>& results) const;

private:
    std::shared_ptr<const TaskRegistry> m_registry;
    LoggerPtr m_logger;
    std::vector<ConsistencyCheckPtr> m_checks;
};

} // namespace genoflow
