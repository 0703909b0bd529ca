/**
 * @file plan_templates.hpp
 * @brief Built-in plan templates.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/plan/plan.hpp"
#include "genoflow/plan/plan_compiler.hpp"

namespace genoflow
{

/**
 * @brief Full analysis: filter, sequence context, embedding, scoring,
 *        evidence lookup and report.
 *
 * @details
 * ```
 * variant_filter -> sequence_context -> genos_embedding -> scoring -> evidence_rag -> report_generation
 *                          \________________________________/   \_________________________/
 * ```
 * `scoring` also depends on `sequence_context`, and `report_generation` also
 * depends on `scoring`, because their configs reference those outputs.
 */
std::vector<TaskSpec> variant_analysis_template(const RunParameters& params);

/**
 * @brief Screening: the first four tasks of the full analysis.
 */
std::vector<TaskSpec> variant_screening_template(const RunParameters& params);

} // namespace genoflow
