#include "genoflow/execution/run_context.hpp"

namespace genoflow
{

namespace
{

const Plan& require_plan(const std::shared_ptr<const Plan>& plan)
{
    if (!plan)
    {
        throw std::invalid_argument("RunContext requires a plan");
    }
    return *plan;
}

} // namespace

RunContext::RunContext(std::shared_ptr<const Plan> plan,
                       std::shared_ptr<const TaskRegistry> registry,
                       ServiceSet services,
                       LoggerPtr logger)
    : m_plan{std::move(plan)}
    , m_registry{std::move(registry)}
    , m_services{std::move(services)}
    , m_logger{std::move(logger)}
    , m_results{require_plan(m_plan)}
{
    if (!m_registry)
    {
        throw std::invalid_argument("RunContext requires a task registry");
    }
}

} // namespace genoflow
