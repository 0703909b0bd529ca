#include "genoflow/execution/result_store.hpp"

namespace genoflow
{

ResultStore::ResultStore(const Plan& plan)
{
    m_entries.reserve(plan.task_count());
    for (TaskIdx tidx = 0; tidx < plan.task_count(); ++tidx)
    {
        auto e = std::make_unique<Entry>();
        e->result.task_id = plan.tasks[tidx].id;
        m_entries.push_back(std::move(e));
        m_index.emplace(plan.tasks[tidx].id, tidx);
    }
}

ResultStore::Entry& ResultStore::entry(TaskIdx task_idx)
{
    if (task_idx >= m_entries.size())
    {
        throw std::out_of_range("Task index " + std::to_string(task_idx) + " does not exist");
    }
    return *m_entries[task_idx];
}

const ResultStore::Entry& ResultStore::entry(TaskIdx task_idx) const
{
    if (task_idx >= m_entries.size())
    {
        throw std::out_of_range("Task index " + std::to_string(task_idx) + " does not exist");
    }
    return *m_entries[task_idx];
}

std::optional<TaskIdx> ResultStore::index_of(const std::string& task_id) const
{
    auto it = m_index.find(task_id);
    if (it == m_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

TaskStatus ResultStore::status(TaskIdx task_idx) const
{
    const auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    return e.result.status;
}

TaskResult ResultStore::snapshot(TaskIdx task_idx) const
{
    const auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    return e.result;
}

std::optional<TaskResult> ResultStore::snapshot(const std::string& task_id) const
{
    auto tidx = index_of(task_id);
    if (!tidx)
    {
        return std::nullopt;
    }
    return snapshot(*tidx);
}

std::vector<TaskResult> ResultStore::snapshot_all() const
{
    std::vector<TaskResult> result;
    result.reserve(m_entries.size());
    for (TaskIdx tidx = 0; tidx < m_entries.size(); ++tidx)
    {
        result.push_back(snapshot(tidx));
    }
    return result;
}

ResultStore::OutputLookup ResultStore::lookup_output(const std::string& task_id,
                                                     const std::string& output_key) const
{
    OutputLookup lookup;
    auto tidx = index_of(task_id);
    if (!tidx)
    {
        return lookup;
    }
    lookup.known_task = true;

    const auto& e = entry(*tidx);
    std::lock_guard<std::mutex> lock(e.mutex);
    lookup.status = e.result.status;
    if (e.result.status == TaskStatus::Succeeded)
    {
        if (const Value* value = find_key(e.result.outputs, output_key))
        {
            lookup.value = *value;
        }
    }
    return lookup;
}

void ResultStore::restore(TaskIdx task_idx, const TaskResult& prior)
{
    auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (prior.status == TaskStatus::Succeeded)
    {
        std::string task_id = std::move(e.result.task_id);
        e.result = prior;
        e.result.task_id = std::move(task_id);
        return;
    }
    TaskResult fresh;
    fresh.task_id = e.result.task_id;
    fresh.attempt = prior.attempt + 1;
    e.result = std::move(fresh);
}

bool ResultStore::mark_running(TaskIdx task_idx, Timestamp at)
{
    auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (e.result.status != TaskStatus::Pending)
    {
        return false;
    }
    e.result.status = TaskStatus::Running;
    e.result.started_at = at;
    return true;
}

bool ResultStore::mark_succeeded(TaskIdx task_idx, Value::Map outputs, Timestamp at)
{
    auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (e.result.status != TaskStatus::Running)
    {
        return false;
    }
    e.result.status = TaskStatus::Succeeded;
    e.result.outputs = std::move(outputs);
    e.result.finished_at = at;
    return true;
}

bool ResultStore::mark_failed(TaskIdx task_idx, TaskFailure failure, Timestamp at)
{
    auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (e.result.status != TaskStatus::Pending && e.result.status != TaskStatus::Running)
    {
        return false;
    }
    if (!e.result.started_at)
    {
        e.result.started_at = at;
    }
    e.result.status = TaskStatus::Failed;
    e.result.error = std::move(failure);
    e.result.finished_at = at;
    return true;
}

bool ResultStore::mark_skipped(TaskIdx task_idx, std::string reason, Timestamp at)
{
    auto& e = entry(task_idx);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (e.result.status != TaskStatus::Pending)
    {
        return false;
    }
    e.result.status = TaskStatus::Skipped;
    e.result.skip_reason = std::move(reason);
    e.result.finished_at = at;
    return true;
}

} // namespace genoflow
