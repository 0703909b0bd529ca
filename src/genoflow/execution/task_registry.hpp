/**
 * @file task_registry.hpp
 * @brief ITask interface, TaskContract and the TaskRegistry mapping task types to bodies.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/value.hpp"

namespace genoflow
{

class RunContext;

/**
 * @brief Interface for the body of a task type.
 *
 * @details
 * ITask represents the domain-specific work behind one task type. The
 * executor calls invoke() with the task's configuration after every output
 * reference has been resolved to a concrete value.
 *
 * @par Thread Safety
 * - One ITask instance serves every task of its type, possibly from several
 *   worker threads at once; invoke() must be safe to call concurrently.
 * - Implementations should not hold locks during invoke() that could cause
 *   deadlock with other tasks of the run.
 *
 * @par Lifecycle
 * - Created by user code and registered with a TaskRegistry.
 * - Object lifetime managed via shared_ptr.
 */
class ITask
{
public:
    virtual ~ITask() = 0;

    /**
     * @brief Run the task.
     *
     * @param config Resolved configuration; contains no OutputReference.
     * @param context The run this invocation belongs to (plan, results, services).
     * @return Named outputs of the task.
     *
     * @throws TaskError to signal a classified failure. Any other exception
     *         is captured as a failure of kind "exception".
     */
    virtual Value::Map invoke(const Value::Map& config, RunContext& context) = 0;

protected:
    ITask() = default;

private:
    ITask(const ITask&) = delete;
    ITask(ITask&&) = delete;
    ITask& operator=(const ITask&) = delete;
    ITask& operator=(ITask&&) = delete;
};

inline ITask::~ITask() = default;

using TaskPtr = std::shared_ptr<ITask>;

/**
 * @brief ITask backed by a callable.
 */
class FunctionTask : public ITask
{
public:
    using Function = std::function<Value::Map(const Value::Map&, RunContext&)>;

    explicit FunctionTask(Function fn)
        : m_fn{std::move(fn)}
    {
    }

    Value::Map invoke(const Value::Map& config, RunContext& context) override
    {
        return m_fn(config, context);
    }

private:
    Function m_fn;
};

/**
 * @brief Inclusive numeric interval.
 */
struct NumericRange
{
    double min{0.0};
    double max{0.0};

    bool contains(double value) const noexcept
    {
        return value >= min && value <= max;
    }
};

/**
 * @brief What a task type promises about its outputs.
 *
 * @details
 * Used by the consistency checker; the executor does not enforce it.
 */
struct TaskContract
{
    /// Output keys present on every successful invocation.
    std::vector<std::string> outputs;

    /// Expected range of numeric outputs (numbers, or lists/maps of numbers).
    std::map<std::string, NumericRange> ranges;

    /// Output key holding the list of entity ids this task covered; empty if none.
    std::string entity_key;

    /// True if the task intentionally narrows its upstream entity set.
    bool is_filter{false};

    bool declares_output(const std::string& key) const
    {
        return std::find(outputs.begin(), outputs.end(), key) != outputs.end();
    }
};

/**
 * @brief Maps task-type identifiers to task bodies and their contracts.
 *
 * @details
 * A registry is populated once at start-up and then shared read-only by the
 * compiler, the executor and the consistency checker.
 *
 * @par Thread safety
 * - Registration is not synchronized; finish it before any run starts.
 * - All const methods are safe for concurrent use afterwards.
 */
class TaskRegistry
{
public:
    /**
     * @brief Register a task body.
     * @throws std::invalid_argument if @p type is empty, already registered,
     *         or @p task is null.
     */
    void register_task(const std::string& type, TaskPtr task, TaskContract contract = {});

    /**
     * @brief Register a callable as a task body.
     */
    void register_function(const std::string& type,
                           FunctionTask::Function fn,
                           TaskContract contract = {});

    bool contains(const std::string& type) const
    {
        return m_entries.find(type) != m_entries.end();
    }

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    /**
     * @brief Registered types, sorted.
     */
    std::vector<std::string> task_types() const;

    /**
     * @brief The task body for @p type, or nullptr.
     */
    TaskPtr find(const std::string& type) const;

    /**
     * @brief The contract for @p type, or nullptr if unregistered.
     */
    const TaskContract* contract(const std::string& type) const;

    /**
     * @brief Invoke the body registered for @p type.
     * @throws TaskError with kind "unknown_task_type" if @p type is not registered.
     * @throws Whatever the body throws.
     */
    Value::Map invoke(const std::string& type, const Value::Map& config, RunContext& context) const;

private:
    struct Entry
    {
        TaskPtr task;
        TaskContract contract;
    };

    std::map<std::string, Entry> m_entries;
};

} // namespace genoflow
