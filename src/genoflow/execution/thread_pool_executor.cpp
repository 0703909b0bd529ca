#include "genoflow/execution/thread_pool_executor.hpp"
#include "genoflow/execution/single_threaded_executor.hpp"

namespace genoflow
{

namespace
{

size_t resolve_worker_count(size_t requested)
{
    if (requested != 0)
    {
        return requested;
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

} // namespace

ThreadPoolExecutor::ThreadPoolExecutor(std::shared_ptr<const TaskRegistry> registry,
                                       ExecutorConfig config,
                                       ServiceSet services)
    : Executor(std::move(registry), std::move(config), std::move(services))
    , m_worker_count{resolve_worker_count(m_config.thread_count)}
{}

void ThreadPoolExecutor::request_stop()
{
    Executor::request_stop();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cv.notify_all();
}

bool ThreadPoolExecutor::drained() const
{
    return m_in_flight == 0 && (m_ready_queue.empty() || should_stop());
}

void ThreadPoolExecutor::dispatch(std::vector<TaskWrapperPtr> initial_ready)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        while (!m_ready_queue.empty()) m_ready_queue.pop();
        m_in_flight = 0;
        m_shutdown = false;
        for (auto& task : initial_ready)
        {
            m_ready_queue.push(std::move(task));
        }
    }

    std::vector<std::thread> workers;
    workers.reserve(m_worker_count);
    for (size_t i = 0; i < m_worker_count; ++i)
    {
        workers.emplace_back(&ThreadPoolExecutor::worker_loop, this);
    }

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto is_drained = [this] { return drained(); };
        if (auto until = deadline())
        {
            if (!m_cv.wait_until(lock, *until, is_drained))
            {
                halt(HaltReason::Timeout);
                m_cv.notify_all();
                m_cv.wait(lock, is_drained);
            }
        }
        else
        {
            m_cv.wait(lock, is_drained);
        }

        m_shutdown = true;
        while (!m_ready_queue.empty()) m_ready_queue.pop();
    }
    m_cv.notify_all();

    for (auto& worker : workers)
    {
        worker.join();
    }
}

void ThreadPoolExecutor::worker_loop()
{
    while (true)
    {
        TaskWrapperPtr task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return m_shutdown || (!m_ready_queue.empty() && !should_stop());
            });
            if (m_shutdown)
            {
                return;
            }
            task = m_ready_queue.top();
            m_ready_queue.pop();
            ++m_in_flight;
        }

        if (deadline_passed())
        {
            halt(HaltReason::Timeout);
        }
        task->run();
    }
}

void ThreadPoolExecutor::enqueue(TaskWrapperPtr task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready_queue.push(std::move(task));
    }
    m_cv.notify_all();
}

void ThreadPoolExecutor::notify_completion(TaskWrapper* task)
{
    handle_completion(task);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_in_flight;
    }
    m_cv.notify_all();
}

std::shared_ptr<Executor> make_executor(std::shared_ptr<const TaskRegistry> registry,
                                        ExecutorConfig config,
                                        ServiceSet services)
{
    if (config.thread_count == 1)
    {
        return make_single_threaded_executor(
            std::move(registry), std::move(config), std::move(services));
    }
    return make_thread_pool_executor(std::move(registry), std::move(config), std::move(services));
}

} // namespace genoflow
