#include "genoflow/execution/executor.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/execution/task_wrapper.hpp"
#include "genoflow/io/plan_io.hpp"

namespace genoflow
{

namespace
{

constexpr const char* k_skip_halted = "run halted";
constexpr const char* k_skip_timeout = "run timeout";

} // namespace

Executor::Executor(std::shared_ptr<const TaskRegistry> registry,
                   ExecutorConfig config,
                   ServiceSet services)
    : m_config{std::move(config)}
    , m_registry{std::move(registry)}
    , m_services{std::move(services)}
{
    if (!m_registry)
    {
        throw std::invalid_argument("Executor requires a task registry");
    }
}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

bool Executor::should_stop() const noexcept
{
    return stop_requested() || halt_reason() != HaltReason::None;
}

void Executor::halt(HaltReason reason)
{
    HaltReason expected = HaltReason::None;
    if (m_halt_reason.compare_exchange_strong(expected, reason, std::memory_order_acq_rel) &&
        logger())
    {
        switch (reason)
        {
        case HaltReason::TaskFailed:
            SPDLOG_LOGGER_WARN(logger(), "Halting run after task failure");
            break;
        case HaltReason::Timeout:
            SPDLOG_LOGGER_WARN(logger(), "Run timeout expired; no further task will start");
            break;
        case HaltReason::StopRequested:
            SPDLOG_LOGGER_WARN(logger(), "Stop requested; no further task will start");
            break;
        case HaltReason::None:
            break;
        }
    }
}

bool Executor::deadline_passed() const
{
    return m_deadline && std::chrono::steady_clock::now() >= *m_deadline;
}

// ============================================================================
// Run
// ============================================================================

RunOutcome Executor::run(std::shared_ptr<const Plan> plan)
{
    return run(std::move(plan), {});
}

RunOutcome Executor::run(std::shared_ptr<const Plan> plan,
                         const std::vector<TaskResult>& prior_results)
{
    auto start_time = std::chrono::steady_clock::now();

    // Throws PlanError before any task runs
    m_graph = build_executable_graph(plan, m_registry.get());
    m_context = std::make_unique<RunContext>(plan, m_registry, m_services, m_config.logger);
    m_halt_reason.store(HaltReason::None, std::memory_order_release);
    m_journal_error.clear();
    m_deadline.reset();
    if (m_config.run_timeout)
    {
        m_deadline = start_time + *m_config.run_timeout;
    }

    if (logger())
    {
        SPDLOG_LOGGER_INFO(logger(), "Starting run of {} task(s)", plan->task_count());
    }

    restore_prior_results(prior_results);

    m_all_tasks = create_task_wrappers(*m_graph);
    wire_successors(m_all_tasks, *m_graph);

    const ResultStore& store = m_context->results();
    std::vector<TaskWrapperPtr> ready;
    for (TaskIdx tidx : m_graph->topological_order)
    {
        auto& task = m_all_tasks[tidx];
        if (store.status(tidx) == TaskStatus::Pending && task->is_ready())
        {
            ready.push_back(task);
        }
    }

    if (stop_requested())
    {
        halt(HaltReason::StopRequested);
    }
    if (!ready.empty() && !should_stop())
    {
        dispatch(std::move(ready));
    }
    if (stop_requested())
    {
        halt(HaltReason::StopRequested);
    }

    switch (halt_reason())
    {
    case HaltReason::Timeout:
        skip_pending(k_skip_timeout);
        break;
    case HaltReason::None:
        // Every task reachable through successes has run; anything still
        // Pending means a predecessor count went wrong.
        for (TaskIdx tidx = 0; tidx < store.size(); ++tidx)
        {
            if (store.status(tidx) == TaskStatus::Pending && logger())
            {
                SPDLOG_LOGGER_ERROR(logger(), "Executor defect: task '{}' never became ready",
                                    plan->tasks[tidx].id);
            }
        }
        skip_pending(k_skip_halted);
        break;
    default:
        skip_pending(k_skip_halted);
        break;
    }

    write_journal();
    RunOutcome outcome = build_outcome(start_time);

    if (logger())
    {
        SPDLOG_LOGGER_INFO(logger(), "{}", outcome.summary());
    }

    m_all_tasks.clear();
    m_context.reset();
    m_graph.reset();
    return outcome;
}

void Executor::restore_prior_results(const std::vector<TaskResult>& prior_results)
{
    ResultStore& store = m_context->results();
    size_t reused = 0;
    for (const auto& prior : prior_results)
    {
        auto tidx = store.index_of(prior.task_id);
        if (!tidx)
        {
            if (logger())
            {
                SPDLOG_LOGGER_WARN(logger(), "Ignoring prior result for unknown task '{}'",
                                   prior.task_id);
            }
            continue;
        }
        store.restore(*tidx, prior);
        if (prior.status == TaskStatus::Succeeded)
        {
            ++reused;
        }
    }
    if (!prior_results.empty() && logger())
    {
        SPDLOG_LOGGER_INFO(logger(), "Resuming: reusing {} succeeded task(s)", reused);
    }
}

std::vector<TaskWrapperPtr> Executor::create_task_wrappers(const ExecutableGraph& graph)
{
    std::vector<TaskWrapperPtr> wrappers;
    wrappers.reserve(graph.task_count());

    auto self = shared_from_this();
    const ResultStore& store = m_context->results();

    for (TaskIdx tidx = 0; tidx < graph.task_count(); ++tidx)
    {
        size_t waiting_on = 0;
        for (TaskIdx pred : graph.dependencies.predecessors(tidx))
        {
            if (store.status(pred) != TaskStatus::Succeeded)
            {
                ++waiting_on;
            }
        }
        wrappers.push_back(std::make_shared<TaskWrapper>(
            tidx, graph.topological_rank[tidx], waiting_on, self));
    }

    return wrappers;
}

void Executor::wire_successors(std::vector<TaskWrapperPtr>& wrappers, const ExecutableGraph& graph)
{
    for (TaskIdx tidx = 0; tidx < graph.task_count(); ++tidx)
    {
        for (TaskIdx succ_idx : graph.successors[tidx])
        {
            wrappers[tidx]->add_successor(wrappers[succ_idx]);
        }
    }
}

// ============================================================================
// Completion handling
// ============================================================================

void Executor::handle_completion(TaskWrapper* task)
{
    TaskStatus status = task->final_status();
    if (status == TaskStatus::Failed)
    {
        ResultStore& store = m_context->results();
        const std::string& failed_id = m_context->plan().tasks[task->task_idx()].id;
        for (TaskIdx desc : m_graph->dependencies.descendants(task->task_idx()))
        {
            if (store.mark_skipped(desc, failed_id, now_timestamp()) && logger())
            {
                SPDLOG_LOGGER_INFO(logger(), "Task '{}' skipped: upstream task '{}' failed",
                                   m_context->plan().tasks[desc].id, failed_id);
            }
        }
        if (m_config.halt_on_error)
        {
            halt(HaltReason::TaskFailed);
        }
    }
    if (is_terminal(status))
    {
        write_journal();
    }
}

void Executor::skip_pending(const std::string& reason)
{
    ResultStore& store = m_context->results();
    size_t skipped = 0;
    for (TaskIdx tidx = 0; tidx < store.size(); ++tidx)
    {
        if (store.mark_skipped(tidx, reason, now_timestamp()))
        {
            ++skipped;
        }
    }
    if (skipped > 0 && logger())
    {
        SPDLOG_LOGGER_WARN(logger(), "{} task(s) skipped: {}", skipped, reason);
    }
}

void Executor::write_journal()
{
    if (m_config.results_path.empty())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(m_journal_mutex);
    try
    {
        store_results_file(m_context->results().snapshot_all(), m_config.results_path);
    }
    catch (const PersistenceError& e)
    {
        m_journal_error = e.what();
        if (logger())
        {
            SPDLOG_LOGGER_ERROR(logger(), "Cannot write result journal: {}", e.what());
        }
    }
}

RunOutcome Executor::build_outcome(std::chrono::steady_clock::time_point start_time)
{
    RunOutcome outcome;
    outcome.results = m_context->results().snapshot_all();

    auto end_time = std::chrono::steady_clock::now();
    outcome.total_duration =
        std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    bool all_succeeded = std::all_of(
        outcome.results.begin(), outcome.results.end(),
        [](const TaskResult& r) { return r.status == TaskStatus::Succeeded; });

    HaltReason reason = halt_reason();
    outcome.timed_out = reason == HaltReason::Timeout;
    outcome.stopped = reason != HaltReason::None && !all_succeeded;

    if (all_succeeded)
    {
        outcome.status = RunStatus::AllSucceeded;
    }
    else if (reason != HaltReason::None)
    {
        outcome.status = RunStatus::HaltedOnError;
    }
    else
    {
        outcome.status = RunStatus::PartiallyFailed;
    }

    std::lock_guard<std::mutex> lock(m_journal_mutex);
    outcome.journal_error = m_journal_error;
    return outcome;
}

} // namespace genoflow
