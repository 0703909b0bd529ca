#include "genoflow/execution/single_threaded_executor.hpp"

namespace genoflow
{

SingleThreadedExecutor::SingleThreadedExecutor(std::shared_ptr<const TaskRegistry> registry,
                                               ExecutorConfig config,
                                               ServiceSet services)
    : Executor(std::move(registry), std::move(config), std::move(services))
{}

void SingleThreadedExecutor::dispatch(std::vector<TaskWrapperPtr> initial_ready)
{
    // Reset internal state
    while (!m_ready_queue.empty()) m_ready_queue.pop();
    m_completed_count = 0;

    for (auto& task : initial_ready)
    {
        m_ready_queue.push(std::move(task));
    }

    // Process queue until empty or stopped
    while (!m_ready_queue.empty() && !should_stop())
    {
        if (deadline_passed())
        {
            halt(HaltReason::Timeout);
            break;
        }

        auto task = m_ready_queue.top();
        m_ready_queue.pop();
        task->run();
    }

    // Tasks left in the queue are skipped by the base class
    while (!m_ready_queue.empty()) m_ready_queue.pop();
}

void SingleThreadedExecutor::enqueue(TaskWrapperPtr task)
{
    m_ready_queue.push(std::move(task));
}

void SingleThreadedExecutor::notify_completion(TaskWrapper* task)
{
    m_completed_count++;
    handle_completion(task);
}

} // namespace genoflow
