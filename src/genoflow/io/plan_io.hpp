/**
 * @file plan_io.hpp
 * @brief YAML persistence of Plans, TaskResults and FindingsReports.
 *
 * @details
 * Formats:
 * - Strings are always double-quoted.
 * - Integers and doubles are plain scalars; a double always carries a
 *   decimal point or exponent (or is one of .inf, -.inf, .nan).
 * - Artifact locators are written as `!artifact "<uri>"`.
 * - Output references are written as `"${output.<task>.<key>}"` and parsed
 *   back into typed references when a plan is loaded.
 * - Result timestamps are epoch milliseconds.
 *
 * Hand-written documents may use plain (unquoted) strings; a plain scalar is
 * read as null, bool, integer or double when it looks like one, otherwise
 * as a string.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/value.hpp"
#include "genoflow/critic/findings.hpp"
#include "genoflow/execution/task_result.hpp"
#include "genoflow/plan/plan.hpp"
#include <yaml-cpp/yaml.h>

namespace genoflow
{

constexpr int k_results_format_version = 1;

// ============================================================================
// Values
// ============================================================================

void emit_value(YAML::Emitter& out, const Value& value);

/**
 * @brief Read a Value from a YAML node.
 * @param context Location used in error messages.
 * @throws PersistenceError for unsupported tags or node types.
 */
Value load_value(const YAML::Node& node, const std::string& context);

// ============================================================================
// Documents
// ============================================================================

std::string store_plan(const Plan& plan);

/**
 * @brief Parse a plan document.
 * @throws PersistenceError if the document is malformed or its
 *         format_version is unsupported.
 * @throws PlanError with `InvalidConfiguration` if a config string is a
 *         malformed reference.
 * @note The plan is not validated; see validate_plan().
 */
Plan load_plan(const std::string& yaml_text);

std::string store_results(const std::vector<TaskResult>& results);

/**
 * @throws PersistenceError if the document is malformed.
 */
std::vector<TaskResult> load_results(const std::string& yaml_text);

std::string store_findings(const FindingsReport& report);

/**
 * @throws PersistenceError if the document is malformed.
 */
FindingsReport load_findings(const std::string& yaml_text);

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Write @p text to @p path, creating parent directories.
 * @details The file is written next to its destination and renamed into
 *          place, so readers never observe a partial document.
 * @throws PersistenceError on I/O failure.
 */
void write_text_file(const std::string& path, const std::string& text);

/**
 * @throws PersistenceError if the file cannot be read.
 */
std::string read_text_file(const std::string& path);

inline void store_plan_file(const Plan& plan, const std::string& path)
{
    write_text_file(path, store_plan(plan));
}

inline Plan load_plan_file(const std::string& path)
{
    return load_plan(read_text_file(path));
}

inline void store_results_file(const std::vector<TaskResult>& results, const std::string& path)
{
    write_text_file(path, store_results(results));
}

inline std::vector<TaskResult> load_results_file(const std::string& path)
{
    return load_results(read_text_file(path));
}

inline void store_findings_file(const FindingsReport& report, const std::string& path)
{
    write_text_file(path, store_findings(report));
}

} // namespace genoflow
