/**
 * @file run_context.hpp
 * @brief RunContext: the state scoped to one Executor invocation.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/log.hpp"
#include "genoflow/execution/result_store.hpp"
#include "genoflow/execution/services.hpp"
#include "genoflow/execution/services.inline.hpp"
#include "genoflow/execution/task_registry.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

/**
 * @brief Everything a task body may consult during one run.
 *
 * @details
 * A RunContext is created when a run starts and discarded when it ends; it
 * is never shared between runs. It holds the Plan being executed, the result
 * store, the task registry and the named services registered for the run.
 *
 * Task bodies receive it by reference. They may read results of other tasks
 * and use services, but only the executor writes results.
 *
 * @par Thread safety
 * - The plan, registry and service set are read-only during the run.
 * - The result store synchronizes itself.
 */
class RunContext
{
public:
    /**
     * @throws std::invalid_argument if @p plan or @p registry is null.
     */
    RunContext(std::shared_ptr<const Plan> plan,
               std::shared_ptr<const TaskRegistry> registry,
               ServiceSet services = {},
               LoggerPtr logger = nullptr);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const Plan& plan() const noexcept
    {
        return *m_plan;
    }

    const std::shared_ptr<const Plan>& plan_ptr() const noexcept
    {
        return m_plan;
    }

    const TaskRegistry& registry() const noexcept
    {
        return *m_registry;
    }

    ResultStore& results() noexcept
    {
        return m_results;
    }

    const ResultStore& results() const noexcept
    {
        return m_results;
    }

    const ServiceSet& services() const noexcept
    {
        return m_services;
    }

    /**
     * @brief Look up a named service.
     * @return The service, or nullptr if none is registered under @p name.
     * @throws ServiceTypeError if the service has another type.
     */
    template <typename T>
    std::shared_ptr<T> service(const std::string& name) const
    {
        return m_services.get<T>(name);
    }

    /**
     * @brief The run's logger; may be null.
     */
    const LoggerPtr& logger() const noexcept
    {
        return m_logger;
    }

private:
    std::shared_ptr<const Plan> m_plan;
    std::shared_ptr<const TaskRegistry> m_registry;
    ServiceSet m_services;
    LoggerPtr m_logger;
    ResultStore m_results;
};

} // namespace genoflow
