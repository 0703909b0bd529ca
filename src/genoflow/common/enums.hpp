/**
 * @file enums.hpp
 */
#pragma once
#include "genoflow/common/common.hpp"

namespace genoflow
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for task indices.
 *
 * @details
 * `TaskIdx` is the position of a TaskSpec in its Plan's declaration order.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using TaskIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Lifecycle state of one task within one run.
 *
 * @details
 * Transitions are monotonic:
 * - `Pending` -> `Running` -> `Succeeded` or `Failed`
 * - `Pending` -> `Skipped`
 *
 * `Succeeded`, `Failed` and `Skipped` are terminal.
 */
enum class TaskStatus
{
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped
};

/**
 * @brief Severity of a finding or diagnostic.
 */
enum class Severity
{
    Info,
    Warning,
    Error
};

inline bool is_terminal(TaskStatus status) noexcept
{
    return status == TaskStatus::Succeeded ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Skipped;
}

inline const char* to_string(TaskStatus status) noexcept
{
    switch (status)
    {
    case TaskStatus::Pending:
        return "Pending";
    case TaskStatus::Running:
        return "Running";
    case TaskStatus::Succeeded:
        return "Succeeded";
    case TaskStatus::Failed:
        return "Failed";
    case TaskStatus::Skipped:
        return "Skipped";
    }
    return "Unknown";
}

inline const char* to_string(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Info:
        return "Info";
    case Severity::Warning:
        return "Warning";
    case Severity::Error:
        return "Error";
    }
    return "Unknown";
}

/**
 * @brief Parse a status name as written by to_string().
 * @return The status, or std::nullopt if the name is not recognized.
 */
inline std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept
{
    if (name == "Pending") return TaskStatus::Pending;
    if (name == "Running") return TaskStatus::Running;
    if (name == "Succeeded") return TaskStatus::Succeeded;
    if (name == "Failed") return TaskStatus::Failed;
    if (name == "Skipped") return TaskStatus::Skipped;
    return std::nullopt;
}

inline std::optional<Severity> parse_severity(std::string_view name) noexcept
{
    if (name == "Info") return Severity::Info;
    if (name == "Warning") return Severity::Warning;
    if (name == "Error") return Severity::Error;
    return std::nullopt;
}

} // namespace genoflow
