#include "genoflow/execution/task_wrapper.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/execution/executor.hpp"
#include "genoflow/execution/reference_resolver.hpp"

namespace genoflow
{

TaskWrapper::TaskWrapper(TaskIdx task_idx,
                         size_t rank,
                         size_t predecessor_count,
                         std::weak_ptr<Executor> executor)
    : m_task_idx{task_idx}
    , m_rank{rank}
    , m_executor{std::move(executor)}
    , m_predecessors_remaining{predecessor_count}
{
}

void TaskWrapper::add_successor(TaskWrapperWeakPtr successor)
{
    m_successors.push_back(std::move(successor));
}

void TaskWrapper::run()
{
    auto executor = m_executor.lock();
    if (!executor)
    {
        return;
    }

    // Not started: the executor skips it when the run ends
    if (executor->should_stop())
    {
        executor->notify_completion(this);
        return;
    }

    RunContext& ctx = executor->context();
    ResultStore& store = ctx.results();
    const TaskSpec& task_spec = ctx.plan().tasks[m_task_idx];
    const LoggerPtr& logger = executor->logger();

    Value::Map config;
    try
    {
        config = ReferenceResolver{store}.resolve_config(task_spec);
    }
    catch (const ResolutionError& e)
    {
        if (logger)
        {
            if (e.code() == ResolutionErrorCode::UnresolvedReference)
            {
                SPDLOG_LOGGER_ERROR(logger, "Executor defect while resolving '{}': {}", task_spec.id, e.what());
            }
            else
            {
                SPDLOG_LOGGER_ERROR(logger, "Task '{}' failed: {}", task_spec.id, e.what());
            }
        }
        bool recorded = store.mark_failed(
            m_task_idx, TaskFailure{to_string(e.code()), e.what()}, now_timestamp());
        m_final_status.store(recorded ? TaskStatus::Failed : store.status(m_task_idx),
                             std::memory_order_release);
        executor->notify_completion(this);
        return;
    }

    if (!store.mark_running(m_task_idx, now_timestamp()))
    {
        if (logger)
        {
            SPDLOG_LOGGER_ERROR(logger, "Task '{}' is no longer Pending; not started", task_spec.id);
        }
        m_final_status.store(store.status(m_task_idx), std::memory_order_release);
        executor->notify_completion(this);
        return;
    }

    if (logger)
    {
        SPDLOG_LOGGER_INFO(logger, "Task '{}' ({}) started", task_spec.id, task_spec.type);
    }

    auto start_time = std::chrono::steady_clock::now();
    std::optional<TaskFailure> failure;
    Value::Map outputs;

    try
    {
        outputs = ctx.registry().invoke(task_spec.type, config, ctx);
    }
    catch (const TaskError& e)
    {
        failure = TaskFailure{e.kind(), e.what()};
    }
    catch (const std::exception& e)
    {
        failure = TaskFailure{"exception", e.what()};
    }
    catch (...)
    {
        failure = TaskFailure{"unknown", "Unknown exception"};
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(m_duration).count();

    if (failure)
    {
        if (logger)
        {
            SPDLOG_LOGGER_ERROR(logger, "Task '{}' failed after {} ms: [{}] {}",
                                task_spec.id, duration_ms, failure->kind, failure->message);
        }
        if (!store.mark_failed(m_task_idx, std::move(*failure), now_timestamp()) && logger)
        {
            SPDLOG_LOGGER_ERROR(logger, "Task '{}' left Running unexpectedly", task_spec.id);
        }
        m_final_status.store(TaskStatus::Failed, std::memory_order_release);
    }
    else
    {
        if (logger)
        {
            SPDLOG_LOGGER_INFO(logger, "Task '{}' succeeded in {} ms ({} output(s))",
                               task_spec.id, duration_ms, outputs.size());
        }
        if (store.mark_succeeded(m_task_idx, std::move(outputs), now_timestamp()))
        {
            m_final_status.store(TaskStatus::Succeeded, std::memory_order_release);
            notify_successors();
        }
        else
        {
            if (logger)
            {
                SPDLOG_LOGGER_ERROR(logger, "Task '{}' left Running unexpectedly", task_spec.id);
            }
            m_final_status.store(store.status(m_task_idx), std::memory_order_release);
        }
    }

    executor->notify_completion(this);
}

bool TaskWrapper::decrement_predecessor_count()
{
    size_t prev = m_predecessors_remaining.fetch_sub(1, std::memory_order_acq_rel);
    return prev == 1;
}

void TaskWrapper::notify_successors()
{
    auto executor = m_executor.lock();
    if (!executor)
    {
        return;
    }

    for (auto& weak_succ : m_successors)
    {
        if (auto succ = weak_succ.lock())
        {
            if (succ->decrement_predecessor_count())
            {
                executor->enqueue(succ);
            }
        }
    }
}

} // namespace genoflow
