/**
 * @file findings.hpp
 * @brief Finding and FindingsReport, the output of the consistency checker.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"

namespace genoflow
{

/**
 * @brief Which check produced a finding.
 */
enum class FindingCategory
{
    NothingToCheck,         ///< No task succeeded; no check ran.
    ResultAlignment,        ///< Plan tasks and results do not line up one-to-one.
    ReferentialIntegrity,   ///< A declared reference has no value in the producer's outputs.
    Coverage,               ///< Entity sets shrink or grow unexpectedly downstream.
    ValueRange,             ///< A numeric output is outside its declared range.
    SkippedImpact,          ///< A task succeeded although an input did not.
    ScoreEvidence,          ///< A variant's impact score disagrees with its retrieved evidence.
    CheckAborted            ///< A check failed internally.
};

inline const char* to_string(FindingCategory category) noexcept
{
    switch (category)
    {
    case FindingCategory::NothingToCheck:
        return "NothingToCheck";
    case FindingCategory::ResultAlignment:
        return "ResultAlignment";
    case FindingCategory::ReferentialIntegrity:
        return "ReferentialIntegrity";
    case FindingCategory::Coverage:
        return "Coverage";
    case FindingCategory::ValueRange:
        return "ValueRange";
    case FindingCategory::SkippedImpact:
        return "SkippedImpact";
    case FindingCategory::ScoreEvidence:
        return "ScoreEvidence";
    case FindingCategory::CheckAborted:
        return "CheckAborted";
    }
    return "Unknown";
}

inline std::optional<FindingCategory> parse_finding_category(std::string_view name) noexcept
{
    if (name == "NothingToCheck") return FindingCategory::NothingToCheck;
    if (name == "ResultAlignment") return FindingCategory::ResultAlignment;
    if (name == "ReferentialIntegrity") return FindingCategory::ReferentialIntegrity;
    if (name == "Coverage") return FindingCategory::Coverage;
    if (name == "ValueRange") return FindingCategory::ValueRange;
    if (name == "SkippedImpact") return FindingCategory::SkippedImpact;
    if (name == "ScoreEvidence") return FindingCategory::ScoreEvidence;
    if (name == "CheckAborted") return FindingCategory::CheckAborted;
    return std::nullopt;
}

/**
 * @brief One observation of the consistency checker.
 */
struct Finding
{
    Severity severity{Severity::Info};
    FindingCategory category{FindingCategory::NothingToCheck};

    /// Tasks implicated, most relevant first (e.g. producer then consumer).
    std::vector<std::string> tasks;

    /// Output keys implicated.
    std::vector<std::string> output_keys;

    std::string message;
};

inline bool operator==(const Finding& a, const Finding& b)
{
    return a.severity == b.severity &&
           a.category == b.category &&
           a.tasks == b.tasks &&
           a.output_keys == b.output_keys &&
           a.message == b.message;
}

inline bool operator!=(const Finding& a, const Finding& b)
{
    return !(a == b);
}

/**
 * @brief Ordered list of findings with per-severity counts.
 *
 * @details
 * Purely derived data: regenerated on every checker invocation and never fed
 * back into execution.
 */
class FindingsReport
{
public:
    void add(Finding finding)
    {
        m_findings.push_back(std::move(finding));
    }

    const std::vector<Finding>& findings() const noexcept
    {
        return m_findings;
    }

    size_t size() const noexcept
    {
        return m_findings.size();
    }

    bool empty() const noexcept
    {
        return m_findings.empty();
    }

    size_t count(Severity severity) const
    {
        return static_cast<size_t>(
            std::count_if(m_findings.begin(), m_findings.end(),
                          [severity](const Finding& f) { return f.severity == severity; }));
    }

    size_t count(FindingCategory category) const
    {
        return static_cast<size_t>(
            std::count_if(m_findings.begin(), m_findings.end(),
                          [category](const Finding& f) { return f.category == category; }));
    }

    bool has_errors() const
    {
        return count(Severity::Error) > 0;
    }

    /**
     * @brief Findings of one category, in report order.
     */
    std::vector<Finding> by_category(FindingCategory category) const
    {
        std::vector<Finding> result;
        std::copy_if(m_findings.begin(), m_findings.end(), std::back_inserter(result),
                     [category](const Finding& f) { return f.category == category; });
        return result;
    }

    /**
     * @brief One-line summary, e.g. "3 finding(s): 1 error(s), 1 warning(s), 1 info".
     */
    std::string summary() const
    {
        std::string result = std::to_string(m_findings.size()) + " finding(s): ";
        result += std::to_string(count(Severity::Error)) + " error(s), ";
        result += std::to_string(count(Severity::Warning)) + " warning(s), ";
        result += std::to_string(count(Severity::Info)) + " info";
        return result;
    }

    friend bool operator==(const FindingsReport& a, const FindingsReport& b)
    {
        return a.m_findings == b.m_findings;
    }

    friend bool operator!=(const FindingsReport& a, const FindingsReport& b)
    {
        return !(a == b);
    }

private:
    std::vector<Finding> m_findings;
};

} // namespace genoflow
