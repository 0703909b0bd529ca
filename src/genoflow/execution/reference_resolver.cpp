#include "genoflow/execution/reference_resolver.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/common/value.inline.hpp"
#include "genoflow/execution/result_store.hpp"

namespace genoflow
{

Value ReferenceResolver::resolve_reference(const OutputReference& ref) const
{
    auto lookup = m_results.lookup_output(ref.task_id, ref.output_key);
    if (!lookup.known_task)
    {
        throw ResolutionError(ResolutionErrorCode::UnresolvedReference,
                              "Reference " + ref.to_string() + " names unknown task '" +
                                  ref.task_id + "'");
    }
    if (lookup.status != TaskStatus::Succeeded)
    {
        throw ResolutionError(ResolutionErrorCode::UnresolvedReference,
                              "Reference " + ref.to_string() + " cannot be resolved: task '" +
                                  ref.task_id + "' is " + to_string(lookup.status));
    }
    if (!lookup.value)
    {
        throw ResolutionError(ResolutionErrorCode::MissingOutputKey,
                              "Task '" + ref.task_id + "' did not produce output '" +
                                  ref.output_key + "'");
    }
    return std::move(*lookup.value);
}

Value ReferenceResolver::resolve(const Value& value) const
{
    switch (value.kind())
    {
    case ValueKind::Reference:
        return resolve_reference(value.as<OutputReference>());
    case ValueKind::List:
    {
        const auto& items = value.as<Value::List>();
        Value::List result;
        result.reserve(items.size());
        for (const auto& item : items)
        {
            result.push_back(resolve(item));
        }
        return Value{std::move(result)};
    }
    case ValueKind::Map:
        return Value{resolve(value.as<Value::Map>())};
    default:
        return value;
    }
}

Value::Map ReferenceResolver::resolve(const Value::Map& config) const
{
    Value::Map result;
    for (const auto& [key, item] : config)
    {
        result.emplace(key, resolve(item));
    }
    return result;
}

Value::Map ReferenceResolver::resolve_config(const TaskSpec& task) const
{
    try
    {
        return resolve(task.config);
    }
    catch (const ResolutionError& e)
    {
        throw ResolutionError(e.code(), "Task '" + task.id + "': " + e.what());
    }
}

} // namespace genoflow
