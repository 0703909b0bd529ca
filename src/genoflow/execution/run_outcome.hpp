/**
 * @file run_outcome.hpp
 * @brief Definition of RunOutcome returned by IExecutor::run().
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/execution/task_result.hpp"

namespace genoflow
{

/**
 * @brief Overall status of a run.
 */
enum class RunStatus
{
    /// Every task Succeeded.
    AllSucceeded,
    /// At least one task Failed or was Skipped; independent tasks still ran.
    PartiallyFailed,
    /// Scheduling stopped early (halt on error, stop request or timeout).
    HaltedOnError
};

inline const char* to_string(RunStatus status) noexcept
{
    switch (status)
    {
    case RunStatus::AllSucceeded:
        return "AllSucceeded";
    case RunStatus::PartiallyFailed:
        return "PartiallyFailed";
    case RunStatus::HaltedOnError:
        return "HaltedOnError";
    }
    return "Unknown";
}

/**
 * @brief Result of executing a Plan.
 *
 * @details
 * RunOutcome captures the outcome of one run:
 * - Overall status
 * - The final TaskResult of every task, in plan order
 * - Whether scheduling was stopped early, and whether by the run timeout
 * - Total wall-clock duration
 */
struct RunOutcome
{
    RunStatus status{RunStatus::AllSucceeded};

    /**
     * @brief Final results, one per plan task, in plan order.
     */
    std::vector<TaskResult> results;

    /**
     * @brief True if scheduling stopped before every task could run.
     */
    bool stopped{false};

    /**
     * @brief True if the run timeout expired.
     */
    bool timed_out{false};

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Last error raised while writing the result journal; empty if none.
     */
    std::string journal_error;

    bool success() const noexcept
    {
        return status == RunStatus::AllSucceeded;
    }

    size_t count(TaskStatus task_status) const
    {
        return static_cast<size_t>(
            std::count_if(results.begin(), results.end(),
                          [task_status](const TaskResult& r) { return r.status == task_status; }));
    }

    const TaskResult* find(const std::string& task_id) const
    {
        return find_result(results, task_id);
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Run ";
        result += to_string(status);
        if (timed_out)
        {
            result += " (timed out)";
        }
        result += ": succeeded=" + std::to_string(count(TaskStatus::Succeeded));
        result += ", failed=" + std::to_string(count(TaskStatus::Failed));
        result += ", skipped=" + std::to_string(count(TaskStatus::Skipped));
        result += ", total=" + std::to_string(results.size());
        return result;
    }

    /**
     * @brief Per-task status table, one line per task.
     */
    std::string status_table() const;
};

} // namespace genoflow
