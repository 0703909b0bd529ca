#include "genoflow/plan/plan.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace genoflow
{

bool operator==(const TaskSpec& a, const TaskSpec& b)
{
    return a.id == b.id &&
           a.type == b.type &&
           a.description == b.description &&
           a.depends_on == b.depends_on &&
           a.config == b.config;
}

bool operator!=(const TaskSpec& a, const TaskSpec& b)
{
    return !(a == b);
}

const TaskSpec* Plan::find_task(const std::string& task_id) const
{
    for (const auto& task : tasks)
    {
        if (task.id == task_id)
        {
            return &task;
        }
    }
    return nullptr;
}

std::optional<TaskIdx> Plan::index_of(const std::string& task_id) const
{
    for (TaskIdx i = 0; i < tasks.size(); ++i)
    {
        if (tasks[i].id == task_id)
        {
            return i;
        }
    }
    return std::nullopt;
}

bool Plan::equivalent(const Plan& other) const
{
    return format_version == other.format_version &&
           run_parameters == other.run_parameters &&
           tasks == other.tasks;
}

bool operator==(const Plan& a, const Plan& b)
{
    return a.equivalent(b) && a.created_at == b.created_at;
}

bool operator!=(const Plan& a, const Plan& b)
{
    return !(a == b);
}

std::string current_timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace genoflow
