/**
 * @file task_result.hpp
 * @brief Definition of TaskResult, the runtime record of one task in one run.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"
#include "genoflow/common/value.hpp"

namespace genoflow
{

/**
 * @brief Wall-clock timestamp with millisecond resolution.
 * @details Results are persisted as epoch milliseconds, so this is the
 *          precision at which they are recorded.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline Timestamp now_timestamp()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

/**
 * @brief Error captured from a Failed task.
 */
struct TaskFailure
{
    /// Machine-readable classification, e.g. "io", "exception", "MissingOutputKey".
    std::string kind;

    /// Verbatim message of the failure.
    std::string message;
};

inline bool operator==(const TaskFailure& a, const TaskFailure& b)
{
    return a.kind == b.kind && a.message == b.message;
}

inline bool operator!=(const TaskFailure& a, const TaskFailure& b)
{
    return !(a == b);
}

/**
 * @brief Runtime record of one task's execution.
 *
 * @details
 * - `outputs` is populated only when Succeeded.
 * - `error` is populated only when Failed.
 * - `skip_reason` is populated only when Skipped: the id of the failed
 *   upstream task, "run halted" or "run timeout".
 * - `attempt` starts at 1 and is incremented each time a task that did not
 *   succeed is re-run on resume.
 */
struct TaskResult
{
    std::string task_id;
    TaskStatus status{TaskStatus::Pending};
    Value::Map outputs;
    std::optional<TaskFailure> error;
    std::string skip_reason;
    int attempt{1};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;

    bool is_terminal() const noexcept
    {
        return genoflow::is_terminal(status);
    }

    /**
     * @brief Time between start and finish, or zero if either is missing.
     */
    std::chrono::milliseconds duration() const noexcept
    {
        if (!started_at || !finished_at)
        {
            return std::chrono::milliseconds{0};
        }
        return *finished_at - *started_at;
    }
};

inline bool operator==(const TaskResult& a, const TaskResult& b)
{
    return a.task_id == b.task_id &&
           a.status == b.status &&
           a.outputs == b.outputs &&
           a.error == b.error &&
           a.skip_reason == b.skip_reason &&
           a.attempt == b.attempt &&
           a.started_at == b.started_at &&
           a.finished_at == b.finished_at;
}

inline bool operator!=(const TaskResult& a, const TaskResult& b)
{
    return !(a == b);
}

/**
 * @brief Find the result for a task id in a result list.
 * @return Pointer into @p results, or nullptr.
 */
inline const TaskResult* find_result(const std::vector<TaskResult>& results,
                                     const std::string& task_id)
{
    auto it = std::find_if(results.begin(), results.end(),
                           [&task_id](const TaskResult& r) { return r.task_id == task_id; });
    return it == results.end() ? nullptr : &*it;
}

} // namespace genoflow
