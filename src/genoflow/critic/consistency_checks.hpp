/**
 * @file consistency_checks.hpp
 * @brief The built-in consistency checks.
 */
#pragma once
#include "genoflow/critic/consistency_checker.hpp"

namespace genoflow
{

/**
 * @brief Every plan task has exactly one terminal result.
 *
 * @details
 * - Error: a plan task has no result, or more than one.
 * - Error: a result is still Pending or Running.
 * - Warning: a result names a task that is not in the plan.
 */
class ResultAlignmentCheck : public IConsistencyCheck
{
public:
    std::string name() const override
    {
        return "result_alignment";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;
};

/**
 * @brief Every output reference in the plan has a value in the producer's outputs.
 *
 * @details
 * Reported once per distinct (consumer, producer, key):
 * - Error: the producer Succeeded but the key is absent or null.
 * - Error: the producer did not succeed and its contract does not declare
 *   the key, so the reference could never have been satisfied.
 * - Info: the key is present but not declared in the producer's contract.
 *
 * Findings list the producer first and the consumer second.
 */
class ReferentialIntegrityCheck : public IConsistencyCheck
{
public:
    std::string name() const override
    {
        return "referential_integrity";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;
};

/**
 * @brief Entity sets do not grow, and only shrink at declared filters.
 *
 * @details
 * For each Succeeded task whose contract names an entity key, its entity set
 * is compared with that of every nearest upstream task with an entity key.
 * Entities present downstream only, and entities dropped by a task not
 * declared as a filter, each give a Warning.
 */
class CoverageCheck : public IConsistencyCheck
{
public:
    std::string name() const override
    {
        return "coverage";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;
};

/**
 * @brief Numeric outputs fall within the ranges their contracts declare.
 *
 * @details
 * Numbers, and lists or maps of numbers, are checked; other values are
 * ignored. One Warning per offending key, naming the number of offending
 * values and the first of them.
 */
class ValueRangeCheck : public IConsistencyCheck
{
public:
    std::string name() const override
    {
        return "value_range";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;
};

/**
 * @brief No task Succeeded while one of its inputs did not.
 *
 * @details
 * Inputs are the declared dependencies plus referenced producers. Such a
 * result cannot come out of a correct executor, so each is an Error.
 */
class SkippedImpactCheck : public IConsistencyCheck
{
public:
    std::string name() const override
    {
        return "skipped_impact";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;
};

/**
 * @brief Impact scores agree with the evidence retrieved for each variant.
 *
 * @details
 * Compares `variant_ids`/`scores` of the scoring task with `variant_ids`,
 * `evidence_counts` and `clinical_significance` of the evidence task,
 * matching variants by id. Per variant:
 * - Warning: score above the high threshold with no supporting evidence.
 * - Error: score below the low threshold while the clinical significance
 *   is pathogenic or likely pathogenic.
 *
 * Nothing is checked unless both tasks are in the plan and Succeeded.
 * Parallel lists of different lengths give one Error.
 */
class ScoreEvidenceCheck : public IConsistencyCheck
{
public:
    explicit ScoreEvidenceCheck(const CriticSettings& settings = {});

    std::string name() const override
    {
        return "score_evidence";
    }

    void run(const CheckContext& context, FindingsReport& report) const override;

private:
    std::string m_scoring_task;
    std::string m_evidence_task;
    double m_high_score;
    double m_low_score;
};

/**
 * @brief The default checks, in the order they run.
 */
std::vector<ConsistencyCheckPtr> default_consistency_checks(const CriticSettings& settings = {});

} // namespace genoflow
