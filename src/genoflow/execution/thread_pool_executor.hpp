/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor running independent tasks concurrently.
 */
#pragma once
#include "genoflow/execution/executor.hpp"
#include "genoflow/execution/task_wrapper.hpp"
#include <condition_variable>
#include <queue>
#include <thread>

namespace genoflow
{

/**
 * @brief Bounded worker pool executor.
 *
 * @details
 * A fixed number of worker threads, started per run, take ready tasks from
 * a shared queue (lowest topological rank first). A task only becomes ready
 * after all of its dependencies Succeeded, so dependencies are always
 * observed as happens-before; unrelated tasks may complete in any order.
 *
 * The calling thread waits for the run to drain. When the run timeout
 * expires it halts scheduling and waits for running tasks to finish; they
 * are not interrupted.
 *
 * @par Thread Safety
 * - run() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread.
 */
class ThreadPoolExecutor : public Executor
{
public:
    /**
     * @param config Configuration; thread_count 0 means hardware concurrency.
     */
    explicit ThreadPoolExecutor(std::shared_ptr<const TaskRegistry> registry,
                                ExecutorConfig config = {},
                                ServiceSet services = {});

    void request_stop() override;
    void enqueue(TaskWrapperPtr task) override;
    void notify_completion(TaskWrapper* task) override;

    /**
     * @brief Number of worker threads a run uses.
     */
    size_t worker_count() const noexcept
    {
        return m_worker_count;
    }

protected:
    void dispatch(std::vector<TaskWrapperPtr> initial_ready) override;

private:
    void worker_loop();

    /// True when nothing runs and nothing more will be started. Requires m_mutex.
    bool drained() const;

    size_t m_worker_count;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::priority_queue<TaskWrapperPtr, std::vector<TaskWrapperPtr>, LaterRankFirst> m_ready_queue;
    size_t m_in_flight{0};
    bool m_shutdown{false};
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    std::shared_ptr<const TaskRegistry> registry,
    ExecutorConfig config = {},
    ServiceSet services = {})
{
    return std::make_shared<ThreadPoolExecutor>(
        std::move(registry), std::move(config), std::move(services));
}

/**
 * @brief Create the executor matching `config.thread_count`.
 * @return A SingleThreadedExecutor for thread_count 1, a ThreadPoolExecutor otherwise.
 */
std::shared_ptr<Executor> make_executor(std::shared_ptr<const TaskRegistry> registry,
                                        ExecutorConfig config = {},
                                        ServiceSet services = {});

} // namespace genoflow
