#include "genoflow/execution/task_registry.hpp"
#include "genoflow/common/errors.hpp"

namespace genoflow
{

void TaskRegistry::register_task(const std::string& type, TaskPtr task, TaskContract contract)
{
    if (type.empty())
    {
        throw std::invalid_argument("Task type must not be empty");
    }
    if (!task)
    {
        throw std::invalid_argument("Task body for type '" + type + "' is null");
    }
    auto inserted = m_entries.emplace(type, Entry{std::move(task), std::move(contract)});
    if (!inserted.second)
    {
        throw std::invalid_argument("Task type '" + type + "' is already registered");
    }
}

void TaskRegistry::register_function(const std::string& type,
                                     FunctionTask::Function fn,
                                     TaskContract contract)
{
    if (!fn)
    {
        throw std::invalid_argument("Task function for type '" + type + "' is empty");
    }
    register_task(type, std::make_shared<FunctionTask>(std::move(fn)), std::move(contract));
}

std::vector<std::string> TaskRegistry::task_types() const
{
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& [type, entry] : m_entries)
    {
        result.push_back(type);
    }
    return result;
}

TaskPtr TaskRegistry::find(const std::string& type) const
{
    auto it = m_entries.find(type);
    return it == m_entries.end() ? nullptr : it->second.task;
}

const TaskContract* TaskRegistry::contract(const std::string& type) const
{
    auto it = m_entries.find(type);
    return it == m_entries.end() ? nullptr : &it->second.contract;
}

Value::Map TaskRegistry::invoke(const std::string& type,
                                const Value::Map& config,
                                RunContext& context) const
{
    auto it = m_entries.find(type);
    if (it == m_entries.end())
    {
        throw TaskError("unknown_task_type", "No task body registered for type '" + type + "'");
    }
    return it->second.task->invoke(config, context);
}

} // namespace genoflow
