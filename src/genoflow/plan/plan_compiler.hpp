/**
 * @file plan_compiler.hpp
 * @brief RunParameters and the PlanCompiler that turns them into a validated Plan.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include "genoflow/common/log.hpp"
#include "genoflow/plan/plan.hpp"

namespace genoflow
{

class TaskRegistry;

// ============================================================================
// Run parameters
// ============================================================================

struct VariantFilterSettings
{
    double min_quality{30.0};
    double max_population_freq{0.01};
    std::vector<std::string> consequence_types{
        "missense_variant",
        "stop_gained",
        "frameshift_variant",
        "splice_donor_variant",
        "splice_acceptor_variant"};
};

struct SequenceContextSettings
{
    /// Bases on each side of the variant.
    std::int64_t window_size{2000};
};

struct EmbeddingSettings
{
    std::string server_url;
    std::string model_name{"1.2B"};
    std::string pooling{"mean"};
    std::int64_t timeout_seconds{60};
    std::int64_t batch_size{10};
    bool mock_mode{false};
};

/**
 * @brief Inputs of one analysis run.
 *
 * @details
 * `input_vcf` and `output_dir` are required; everything else has a default.
 * The compiled Plan records these parameters (see to_value()).
 */
struct RunParameters
{
    std::string analysis_type{"variant_analysis"};
    std::string input_vcf;
    std::string output_dir;
    std::string sample_name{"sample"};
    std::string phenotype;

    VariantFilterSettings variant_filter;
    SequenceContextSettings sequence_context;
    EmbeddingSettings embedding;

    /**
     * @brief Map form, as recorded in Plan::run_parameters.
     */
    Value::Map to_value() const;
};

/**
 * @brief Builds the TaskSpecs of one analysis type from the run parameters.
 *
 * @details
 * Templates may rely on the parameters having passed the compiler's checks.
 * They may throw PlanError(InvalidConfiguration) for template-specific
 * requirements.
 */
using PlanTemplate = std::function<std::vector<TaskSpec>(const RunParameters&)>;

// ============================================================================
// PlanCompiler
// ============================================================================

/**
 * @brief Produces immutable, validated Plans from run parameters.
 *
 * @details
 * The compiler selects a template by `RunParameters::analysis_type`,
 * instantiates it, records the parameters and a creation timestamp, and
 * validates the result (see validate_plan()). The built-in templates
 * "variant_analysis" and "variant_screening" are registered on construction.
 *
 * Compiling the same parameters twice yields plans that differ only in
 * `created_at`.
 *
 * @par Thread safety
 * - compile() is const and may be called concurrently once all templates
 *   are registered.
 */
class PlanCompiler
{
public:
    /**
     * @param registry Used to check that every task type is registered; may be null
     *        to skip that check.
     * @param logger Optional logger.
     */
    explicit PlanCompiler(std::shared_ptr<const TaskRegistry> registry = nullptr,
                          LoggerPtr logger = nullptr);

    /**
     * @brief Register (or replace) the template of an analysis type.
     * @throws std::invalid_argument if the name is empty or the template is empty.
     */
    void register_template(const std::string& analysis_type, PlanTemplate tmpl);

    bool has_template(const std::string& analysis_type) const
    {
        return m_templates.find(analysis_type) != m_templates.end();
    }

    /**
     * @brief Registered analysis types, sorted.
     */
    std::vector<std::string> analysis_types() const;

    /**
     * @brief Compile a Plan.
     *
     * @throws PlanError with `InvalidConfiguration` for missing or out-of-range
     *         parameters, an unknown analysis type or an unregistered task type.
     * @throws PlanError with another code if the template yields a structurally
     *         invalid plan.
     */
    Plan compile(const RunParameters& params) const;

private:
    void check_parameters(const RunParameters& params) const;

    std::shared_ptr<const TaskRegistry> m_registry;
    LoggerPtr m_logger;
    std::map<std::string, PlanTemplate> m_templates;
};

} // namespace genoflow
