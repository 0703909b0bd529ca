/**
 * @file simulated_tasks.hpp
 * @brief Deterministic stand-ins for the analysis task types.
 */
#pragma once
#include "genoflow/execution/task_registry.hpp"

namespace genoflow
{

/**
 * @brief Register the six task types used by the built-in plan templates.
 *
 * @details
 * Registered types: variant_filter, sequence_context, genos_embedding,
 * scoring, evidence_rag and report_generation. Each comes with its
 * TaskContract (guaranteed outputs, `variant_ids` as entity key, scores in
 * [0, 1], variant_filter declared as a filter).
 *
 * The bodies derive their outputs from their configuration only: they read
 * no genomic data, write no files and contact no server. Artifact outputs
 * point at the paths named in the configuration. The same configuration
 * always yields the same outputs. evidence_rag reports per-variant evidence
 * counts and clinical significance that agree with the incoming scores.
 *
 * @throws std::invalid_argument if any of the types is already registered.
 */
void register_simulated_tasks(TaskRegistry& registry);

/**
 * @brief Deterministic 64-bit FNV-1a hash of @p text.
 */
std::uint64_t stable_hash(std::string_view text) noexcept;

} // namespace genoflow
