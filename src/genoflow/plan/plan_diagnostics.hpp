/**
 * @file plan_diagnostics.hpp
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"
#include "genoflow/common/errors.hpp"

namespace genoflow
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of plan validation issue.
 */
enum class DiagnosticCategory
{
    EmptyTaskId,            ///< A task has an empty id.
    DuplicateTaskId,        ///< Two tasks share an id.
    UnknownTaskType,        ///< A task type is not registered.
    MalformedReference,     ///< A config string mentions a reference but is not one.
    UnknownDependency,      ///< dependsOn names a task that is not in the plan.
    DuplicateDependency,    ///< dependsOn lists the same task twice.
    Cycle,                  ///< Tasks that cannot be topologically ordered.
    UndeclaredDependency    ///< config references a task missing from dependsOn.
};

const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief The PlanErrorCode an error of this category is reported as.
 */
PlanErrorCode error_code_for(DiagnosticCategory category) noexcept;

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    Severity severity{Severity::Error};
    DiagnosticCategory category{DiagnosticCategory::Cycle};
    std::string message;

    /// Ids of the tasks involved, the offending task first.
    std::vector<std::string> involved_tasks;

    /// Output key involved (UndeclaredDependency only).
    std::string output_key;
};

// ============================================================================
// PlanDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while validating a Plan.
 *
 * @details
 * Produced by diagnose_plan(). Errors are blocking: a plan with errors is
 * never executed. Warnings (duplicate dependsOn entries) are informational.
 *
 * Errors are recorded in validation phase order: task identity and types,
 * then unknown dependencies, then cycles, then undeclared dependencies. The
 * first error therefore determines the error code reported for the plan.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once populated, the data is immutable; concurrent reads are safe.
 */
class PlanDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Check whether any error of the given category was recorded.
     */
    bool has_error(DiagnosticCategory category) const noexcept
    {
        return std::any_of(m_errors.begin(), m_errors.end(),
                           [category](const DiagnosticItem& item) {
                               return item.category == category;
                           });
    }

    /**
     * @brief Record an item; routed to errors or warnings by its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == Severity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    /**
     * @brief Multi-line description of all errors, for exception messages.
     */
    std::string describe_errors() const;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace genoflow
