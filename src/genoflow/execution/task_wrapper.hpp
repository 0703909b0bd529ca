/**
 * @file task_wrapper.hpp
 * @brief TaskWrapper wraps one plan task for execution with framework orchestration.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"

namespace genoflow
{

// Forward declarations
class Executor;
class TaskWrapper;

using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;
using TaskWrapperWeakPtr = std::weak_ptr<TaskWrapper>;

/**
 * @brief Wraps one task of a run with pre/post orchestration.
 *
 * @details
 * TaskWrapper is the unit of work sent to workers. It handles:
 * - Pre-execution: stop check, reference resolution, Pending -> Running
 * - Task body invocation through the registry
 * - Post-execution: recording outputs or the failure, successor
 *   notification, completion notification
 *
 * TaskWrapper directly decrements predecessor counts on successors and
 * submits newly-ready tasks to the executor, enabling decentralized
 * orchestration. Successors are only notified when the task Succeeded; the
 * successors of a failed task never become ready and are Skipped by the
 * executor.
 *
 * @par Ownership Model
 * - Executor owns all TaskWrapper instances via shared_ptr.
 * - TaskWrappers hold weak_ptr to each other (successors).
 * - TaskWrappers hold weak_ptr to Executor (for queue access).
 *
 * @par Thread Safety
 * - The predecessor count is atomic.
 * - Successor list is immutable after setup.
 * - Multiple threads may call decrement_predecessor_count() concurrently.
 */
class TaskWrapper : public std::enable_shared_from_this<TaskWrapper>
{
public:
    /**
     * @brief Construct a TaskWrapper.
     * @param task_idx Index of the task in the plan.
     * @param rank Position of the task in the topological order.
     * @param predecessor_count Number of predecessors that must still succeed.
     * @param executor Weak reference to the owning executor.
     */
    TaskWrapper(TaskIdx task_idx,
                size_t rank,
                size_t predecessor_count,
                std::weak_ptr<Executor> executor);

    // Non-copyable, non-movable
    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    /**
     * @brief Add a successor that depends on this task.
     * @note Must be called during setup, before execution starts.
     */
    void add_successor(TaskWrapperWeakPtr successor);

    /**
     * @brief Execute this task (called by the scheduler).
     *
     * @details
     * Performs the full execution lifecycle:
     * 1. Check the stop flag; if set, leave the task Pending
     * 2. Resolve the config; a ResolutionError fails the task
     * 3. Transition to Running and invoke the task body
     * 4. Record outputs (Succeeded) or the captured error (Failed)
     * 5. On success, notify successors and enqueue ready ones
     * 6. Notify Executor of completion
     */
    void run();

    /**
     * @brief Check if task is ready to execute.
     * @return True if predecessor count is 0.
     */
    bool is_ready() const noexcept
    {
        return m_predecessors_remaining.load(std::memory_order_acquire) == 0;
    }

    /**
     * @brief Decrement predecessor count (called by predecessor's run()).
     * @return True if this call caused the task to become ready (count reached 0).
     */
    bool decrement_predecessor_count();

    /**
     * @brief Status this wrapper left the task in, once run() returned.
     */
    TaskStatus final_status() const noexcept
    {
        return m_final_status.load(std::memory_order_acquire);
    }

    /**
     * @brief Duration of the task body call, or zero if it did not run.
     */
    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    TaskIdx task_idx() const noexcept
    {
        return m_task_idx;
    }

    size_t rank() const noexcept
    {
        return m_rank;
    }

private:
    /**
     * @brief Notify all successors of successful completion.
     */
    void notify_successors();

    // Configuration (immutable after construction)
    TaskIdx m_task_idx;
    size_t m_rank;
    std::weak_ptr<Executor> m_executor;
    std::vector<TaskWrapperWeakPtr> m_successors;

    // Execution state
    std::atomic<size_t> m_predecessors_remaining;
    std::atomic<TaskStatus> m_final_status{TaskStatus::Pending};

    // Results (written once during run())
    std::chrono::nanoseconds m_duration{0};
};

/**
 * @brief Orders wrappers so that the lowest topological rank comes out of a
 *        std::priority_queue first.
 */
struct LaterRankFirst
{
    bool operator()(const TaskWrapperPtr& a, const TaskWrapperPtr& b) const noexcept
    {
        return a->rank() > b->rank();
    }
};

} // namespace genoflow
