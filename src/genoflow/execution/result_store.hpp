/**
 * @file result_store.hpp
 * @brief ResultStore: the per-run table of TaskResults, with task-scoped locking.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/execution/task_result.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

/**
 * @brief The Executor's output store: one TaskResult per task of a Plan.
 *
 * @details
 * Entries are created at Pending, in plan order, when the store is built.
 * Status transitions are monotonic and enforced here:
 * - `Pending` -> `Running` (mark_running)
 * - `Running` -> `Succeeded` (mark_succeeded)
 * - `Pending` or `Running` -> `Failed` (mark_failed; Pending covers
 *   resolution failures, which happen before the task body starts)
 * - `Pending` -> `Skipped` (mark_skipped)
 *
 * A rejected transition returns false and leaves the entry unchanged.
 *
 * @par Thread safety
 * - Each entry has its own mutex, held only for the duration of a single
 *   read or transition; never while a task body runs.
 * - The set of entries and the id index are fixed at construction, so
 *   lookups by id need no lock.
 * - Snapshots return copies; callers never hold references into the store.
 */
class ResultStore
{
public:
    explicit ResultStore(const Plan& plan);

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    std::optional<TaskIdx> index_of(const std::string& task_id) const;

    TaskStatus status(TaskIdx task_idx) const;

    /**
     * @brief Copy of one result.
     * @throws std::out_of_range if the index does not exist.
     */
    TaskResult snapshot(TaskIdx task_idx) const;

    /**
     * @brief Copy of the result of @p task_id, or std::nullopt if unknown.
     */
    std::optional<TaskResult> snapshot(const std::string& task_id) const;

    /**
     * @brief Copies of all results, in plan order.
     */
    std::vector<TaskResult> snapshot_all() const;

    /**
     * @brief Outcome of looking up one output of one task.
     */
    struct OutputLookup
    {
        /// False if the task is not part of the plan.
        bool known_task{false};
        TaskStatus status{TaskStatus::Pending};
        /// Set only if the task Succeeded and emitted the key.
        std::optional<Value> value;
    };

    /**
     * @brief Read status and one output of a task under the entry lock.
     */
    OutputLookup lookup_output(const std::string& task_id, const std::string& output_key) const;

    /**
     * @brief Seed an entry from a previous run's result.
     *
     * @details
     * A Succeeded prior result is copied verbatim (outputs, timestamps,
     * attempt). Any other prior result leaves the entry Pending with
     * `attempt` set to the prior attempt plus one.
     *
     * @pre Called before the run starts.
     */
    void restore(TaskIdx task_idx, const TaskResult& prior);

    bool mark_running(TaskIdx task_idx, Timestamp at);
    bool mark_succeeded(TaskIdx task_idx, Value::Map outputs, Timestamp at);
    bool mark_failed(TaskIdx task_idx, TaskFailure failure, Timestamp at);
    bool mark_skipped(TaskIdx task_idx, std::string reason, Timestamp at);

private:
    struct Entry
    {
        mutable std::mutex mutex;
        TaskResult result;
    };

    Entry& entry(TaskIdx task_idx);
    const Entry& entry(TaskIdx task_idx) const;

    std::vector<std::unique_ptr<Entry>> m_entries;
    std::unordered_map<std::string, TaskIdx> m_index;
};

} // namespace genoflow
