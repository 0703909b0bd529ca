/**
 * @file run_config.hpp
 * @brief YAML run configuration loaded by the command-line front end.
 *
 * @details
 * Schema (every section and key is optional):
 *
 * @code{.yaml}
 * analysis_type: variant_analysis   # plan template to compile
 * sample_name: sample
 * phenotype: ""                     # free text, passed to evidence retrieval
 * input_vcf: in.vcf                 # usually given on the command line
 * output_dir: out                   # usually given on the command line
 *
 * variant_filter:
 *   min_quality: 30
 *   max_population_freq: 0.01
 *   consequence_types: [missense_variant, stop_gained]
 *
 * sequence_context:
 *   window_size: 2000               # bases on each side
 *
 * genos:
 *   server_url: ""
 *   model_name: "1.2B"
 *   pooling: mean
 *   timeout: 60                     # seconds
 *   mock_mode: false
 *
 * performance:
 *   batch_size: 10
 *
 * execution:
 *   threads: 1                      # 0 = hardware concurrency
 *   halt_on_error: false
 *   timeout_seconds: 0              # 0 = no run timeout
 *
 * logging:
 *   level: info                     # trace | debug | info | warn | error | critical | off
 *
 * critic:
 *   check_score_evidence: true
 *   high_score_threshold: 0.7       # high scores need supporting evidence
 *   low_score_threshold: 0.3        # low scores must not be pathogenic
 * @endcode
 *
 * Unknown keys are ignored. Range checks on the run parameters are left to
 * PlanCompiler::compile().
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/critic/consistency_checker.hpp"
#include "genoflow/execution/executor.hpp"
#include "genoflow/plan/plan_compiler.hpp"

namespace genoflow
{

struct AppConfig
{
    RunParameters run_parameters;

    // execution
    size_t threads{1};
    bool halt_on_error{false};
    std::int64_t timeout_seconds{0};

    // logging
    spdlog::level::level_enum log_level{spdlog::level::info};

    // critic
    CriticSettings critic;

    /**
     * @brief Executor settings derived from the execution section.
     * @note The logger and results path are left for the caller to fill in.
     */
    ExecutorConfig executor_config() const;
};

/**
 * @brief Parse a run configuration document.
 * @throws PersistenceError if the text is not valid YAML or not a mapping.
 * @throws PlanError with `InvalidConfiguration` if a key holds a value of
 *         the wrong type; the message names the key.
 */
AppConfig parse_run_config(const std::string& yaml_text);

/**
 * @brief Read and parse a run configuration file.
 * @throws PersistenceError if the file cannot be read or parsed.
 * @throws PlanError as for parse_run_config().
 */
AppConfig load_run_config(const std::string& path);

} // namespace genoflow
