/**
 * @file plan.hpp
 * @brief TaskSpec and Plan: the compiled, immutable task graph of one analysis run.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/enums.hpp"
#include "genoflow/common/value.hpp"

namespace genoflow
{

/**
 * @brief Current version of the persisted plan format.
 */
constexpr int k_plan_format_version = 1;

/**
 * @brief Declarative description of one unit of work.
 *
 * @details
 * `config` may contain OutputReference values at any depth; every referenced
 * task must also appear in `depends_on` (checked by plan validation).
 */
struct TaskSpec
{
    std::string id;
    std::string type;
    std::string description;
    std::vector<std::string> depends_on;
    Value::Map config;

    bool depends_on_task(const std::string& task_id) const
    {
        return std::find(depends_on.begin(), depends_on.end(), task_id) != depends_on.end();
    }
};

bool operator==(const TaskSpec& a, const TaskSpec& b);
bool operator!=(const TaskSpec& a, const TaskSpec& b);

/**
 * @brief Ordered collection of TaskSpecs plus plan-level metadata.
 *
 * @details
 * A Plan is produced by PlanCompiler::compile() or loaded from storage, and
 * is read-only afterwards; components share it as
 * `std::shared_ptr<const Plan>`. Task order is declaration order, which is
 * also the tie-breaker for topological ordering.
 */
struct Plan
{
    int format_version{k_plan_format_version};

    /// ISO-8601 UTC creation timestamp, e.g. "2026-10-17T09:30:00.125Z".
    std::string created_at;

    /// The run parameters the plan was compiled from.
    Value::Map run_parameters;

    std::vector<TaskSpec> tasks;

    size_t task_count() const noexcept
    {
        return tasks.size();
    }

    /**
     * @brief Find a task by id.
     * @return Pointer into `tasks`, or nullptr.
     */
    const TaskSpec* find_task(const std::string& task_id) const;

    /**
     * @brief Declaration index of a task.
     */
    std::optional<TaskIdx> index_of(const std::string& task_id) const;

    /**
     * @brief Compare everything except `created_at`.
     */
    bool equivalent(const Plan& other) const;
};

bool operator==(const Plan& a, const Plan& b);
bool operator!=(const Plan& a, const Plan& b);

/**
 * @brief Current time as an ISO-8601 UTC string with millisecond precision.
 */
std::string current_timestamp();

} // namespace genoflow
