/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential task execution.
 */
#pragma once
#include "genoflow/execution/executor.hpp"
#include "genoflow/execution/task_wrapper.hpp"
#include <queue>

namespace genoflow
{

/**
 * @brief Sequential executor; the default.
 *
 * @details
 * Executes tasks one at a time in the calling thread. Among ready tasks the
 * one earliest in the topological order runs first, so a run without
 * failures invokes tasks in exactly the plan's topological order, and
 * repeated runs of the same plan invoke the same tasks in the same order.
 *
 * @par Thread Safety
 * - run() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including from a task body.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param registry Task bodies.
     * @param config Configuration (thread_count ignored, always 1).
     * @param services Services made available to every run.
     */
    explicit SingleThreadedExecutor(std::shared_ptr<const TaskRegistry> registry,
                                    ExecutorConfig config = {},
                                    ServiceSet services = {});

    void enqueue(TaskWrapperPtr task) override;
    void notify_completion(TaskWrapper* task) override;

protected:
    void dispatch(std::vector<TaskWrapperPtr> initial_ready) override;

private:
    // Ready queue, lowest topological rank first
    std::priority_queue<TaskWrapperPtr, std::vector<TaskWrapperPtr>, LaterRankFirst> m_ready_queue;

    size_t m_completed_count{0};
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    std::shared_ptr<const TaskRegistry> registry,
    ExecutorConfig config = {},
    ServiceSet services = {})
{
    return std::make_shared<SingleThreadedExecutor>(
        std::move(registry), std::move(config), std::move(services));
}

} // namespace genoflow
