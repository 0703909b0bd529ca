/**
 * @file references.hpp
 * @brief Plan-time handling of output references: parsing and collection.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/value.hpp"

namespace genoflow
{

/**
 * @brief Make a reference value to output @p output_key of task @p task_id.
 */
inline Value output_ref(std::string task_id, std::string output_key)
{
    return Value{OutputReference{std::move(task_id), std::move(output_key)}};
}

/**
 * @brief Replace every string that is exactly `${output.T.K}` by a typed reference.
 *
 * @details
 * Lists and maps are walked recursively. Values that are already typed
 * references are kept.
 *
 * @param value The value to convert.
 * @param context Location used in error messages, e.g. "task 'scoring' config key 'x'".
 * @throws PlanError with `InvalidConfiguration` if a string mentions
 *         `${output.` without being exactly one well-formed reference.
 */
Value parse_references(const Value& value, const std::string& context);

/**
 * @brief Map overload of parse_references(); @p context names the owner.
 */
Value::Map parse_references(const Value::Map& config, const std::string& context);

/**
 * @brief Append every reference found in @p value, depth-first in document order.
 */
void collect_references(const Value& value, std::vector<OutputReference>& out);

/**
 * @brief Every reference in a config map, in key order then document order.
 */
std::vector<OutputReference> collect_references(const Value::Map& config);

} // namespace genoflow
