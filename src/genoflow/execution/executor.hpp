/**
 * @file executor.hpp
 * @brief IExecutor interface, ExecutorConfig and the shared Executor base.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/log.hpp"
#include "genoflow/execution/executable_graph.hpp"
#include "genoflow/execution/run_context.hpp"
#include "genoflow/execution/run_outcome.hpp"
#include "genoflow/execution/services.hpp"
#include "genoflow/execution/task_registry.hpp"

namespace genoflow
{

// Forward declaration
class TaskWrapper;
using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means single-threaded execution.
     */
    size_t thread_count{1};

    /**
     * @brief Whether to halt scheduling on the first failure.
     * @details If true, every task not yet Running is Skipped after the first
     *          failure. If false, tasks outside the failed task's dependency
     *          closure continue to run.
     */
    bool halt_on_error{false};

    /**
     * @brief Run-level timeout; no timeout if unset.
     * @details When it expires no further task is started; running tasks
     *          finish on their own.
     */
    std::optional<std::chrono::milliseconds> run_timeout;

    /**
     * @brief If non-empty, the TaskResult map is rewritten to this YAML file
     *        after every terminal transition.
     */
    std::string results_path;

    /**
     * @brief Optional logger.
     */
    LoggerPtr logger;
};

/**
 * @brief Interface for plan executors.
 *
 * @details
 * IExecutor defines the contract for executing a Plan.
 * Implementations may be single-threaded or multi-threaded.
 *
 * @par Thread Safety
 * - run() must not be called concurrently on the same executor.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Execute a plan from scratch.
     * @throws PlanError if the plan fails validation; no task runs.
     */
    virtual RunOutcome run(std::shared_ptr<const Plan> plan) = 0;

    /**
     * @brief Resume a plan from the results of an earlier run.
     *
     * @details
     * Tasks whose prior result is Succeeded are not invoked again; their
     * stored outputs are reused verbatim. Every other task runs again with
     * its attempt counter incremented. Prior results naming tasks that are
     * not in the plan are ignored.
     *
     * @throws PlanError if the plan fails validation; no task runs.
     */
    virtual RunOutcome run(std::shared_ptr<const Plan> plan,
                           const std::vector<TaskResult>& prior_results) = 0;

    /**
     * @brief Request graceful stop of execution.
     *
     * @details
     * Sets a flag that the scheduler checks. Running tasks complete normally;
     * tasks not yet started are Skipped. This is cooperative, not preemptive.
     */
    virtual void request_stop() = 0;

    /**
     * @brief Check if stop has been requested.
     * @return True if request_stop() has been called.
     */
    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Why scheduling stopped before the plan was exhausted.
 */
enum class HaltReason
{
    None,
    StopRequested,
    TaskFailed,
    Timeout
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides the parts of a run that do not depend on the threading model:
 * - Plan validation and graph construction
 * - RunContext creation and restoring prior results
 * - TaskWrapper creation and successor linkage
 * - Failure handling (transitive skips, halt on error) and the result journal
 * - Building the RunOutcome
 *
 * Derived classes implement the actual scheduling and worker management in
 * dispatch().
 */
class Executor : public IExecutor, public std::enable_shared_from_this<Executor>
{
public:
    /**
     * @throws std::invalid_argument if @p registry is null.
     */
    Executor(std::shared_ptr<const TaskRegistry> registry,
             ExecutorConfig config,
             ServiceSet services = {});
    virtual ~Executor() = default;

    RunOutcome run(std::shared_ptr<const Plan> plan) override;
    RunOutcome run(std::shared_ptr<const Plan> plan,
                   const std::vector<TaskResult>& prior_results) override;

    void request_stop() override;
    bool stop_requested() const noexcept override;

    /**
     * @brief True if no further task may be started in the current run.
     */
    bool should_stop() const noexcept;

    /**
     * @brief Enqueue a task for execution.
     * @note Called by TaskWrapper when a successor becomes ready.
     */
    virtual void enqueue(TaskWrapperPtr task) = 0;

    /**
     * @brief Notify that a task has finished (or declined to start).
     * @note Called by TaskWrapper at the end of run().
     */
    virtual void notify_completion(TaskWrapper* task) = 0;

    /**
     * @brief The context of the current run.
     * @pre A run is in progress.
     */
    RunContext& context()
    {
        return *m_context;
    }

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

    const LoggerPtr& logger() const noexcept
    {
        return m_config.logger;
    }

    const ServiceSet& services() const noexcept
    {
        return m_services;
    }

protected:
    /**
     * @brief Run every task of @p initial_ready and whatever becomes ready after.
     *
     * @details
     * Returns once no task is running and either no task is ready or
     * should_stop() is true. Implementations must check the deadline before
     * starting each task and call halt(HaltReason::Timeout) once it passes.
     */
    virtual void dispatch(std::vector<TaskWrapperPtr> initial_ready) = 0;

    /**
     * @brief Common completion handling, called from notify_completion().
     *
     * @details
     * On failure: Skips every Pending task downstream of the failed one and,
     * with halt_on_error, halts scheduling. Rewrites the result journal.
     */
    void handle_completion(TaskWrapper* task);

    /**
     * @brief Stop scheduling for @p reason; the first reason sticks.
     */
    void halt(HaltReason reason);

    HaltReason halt_reason() const noexcept
    {
        return m_halt_reason.load(std::memory_order_acquire);
    }

    /**
     * @brief True if a run timeout is configured and has expired.
     */
    bool deadline_passed() const;

    std::optional<std::chrono::steady_clock::time_point> deadline() const noexcept
    {
        return m_deadline;
    }

    /**
     * @brief Create TaskWrappers for all tasks in the graph.
     * @details Predecessors that already Succeeded (restored from a prior
     *          run) are not counted.
     * @return Vector of TaskWrappers indexed by TaskIdx.
     */
    std::vector<TaskWrapperPtr> create_task_wrappers(const ExecutableGraph& graph);

    /**
     * @brief Wire up successor relationships between TaskWrappers.
     */
    void wire_successors(std::vector<TaskWrapperPtr>& wrappers, const ExecutableGraph& graph);

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};

private:
    void restore_prior_results(const std::vector<TaskResult>& prior_results);
    void skip_pending(const std::string& reason);
    void write_journal();
    RunOutcome build_outcome(std::chrono::steady_clock::time_point start_time);

    std::shared_ptr<const TaskRegistry> m_registry;
    ServiceSet m_services;

    // Per-run state
    std::shared_ptr<ExecutableGraph> m_graph;
    std::unique_ptr<RunContext> m_context;
    std::vector<TaskWrapperPtr> m_all_tasks;
    std::atomic<HaltReason> m_halt_reason{HaltReason::None};
    std::optional<std::chrono::steady_clock::time_point> m_deadline;

    std::mutex m_journal_mutex;
    std::string m_journal_error;
};

} // namespace genoflow
