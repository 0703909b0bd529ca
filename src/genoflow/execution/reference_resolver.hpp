/**
 * @file reference_resolver.hpp
 * @brief ReferenceResolver: substitutes output references with the producers' outputs.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/value.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

class ResultStore;

/**
 * @brief Resolves every OutputReference in a configuration value.
 *
 * @details
 * Resolution is total and eager: a whole TaskSpec config is resolved
 * immediately before its task is invoked, and either every reference is
 * replaced by the referenced output or a ResolutionError is thrown.
 *
 * Non-reference parts are copied unchanged; artifact locators are passed
 * through without being inspected.
 *
 * @par Thread safety
 * - Stateless apart from the store reference; the store synchronizes reads.
 */
class ReferenceResolver
{
public:
    explicit ReferenceResolver(const ResultStore& results)
        : m_results{results}
    {
    }

    /**
     * @brief Resolve all references in @p value.
     *
     * @throws ResolutionError with `UnresolvedReference` if a referenced task
     *         is unknown or has not Succeeded.
     * @throws ResolutionError with `MissingOutputKey` if a referenced task
     *         Succeeded without emitting the key.
     */
    Value resolve(const Value& value) const;

    /**
     * @brief Resolve a whole config map.
     */
    Value::Map resolve(const Value::Map& config) const;

    /**
     * @brief Resolve the config of @p task.
     * @details Error messages name @p task as the consumer.
     */
    Value::Map resolve_config(const TaskSpec& task) const;

    /**
     * @brief Resolve a single reference.
     */
    Value resolve_reference(const OutputReference& ref) const;

private:
    const ResultStore& m_results;
};

} // namespace genoflow
