#include "genoflow/plan/plan_compiler.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/execution/task_registry.hpp"
#include "genoflow/plan/plan_templates.hpp"
#include "genoflow/plan/plan_validator.hpp"
#include "genoflow/plan/references.hpp"
#include <cmath>

namespace genoflow
{

Value::Map RunParameters::to_value() const
{
    Value::List consequences;
    for (const auto& c : variant_filter.consequence_types)
    {
        consequences.emplace_back(c);
    }

    return Value::Map{
        {"analysis_type", analysis_type},
        {"input_vcf", input_vcf},
        {"output_dir", output_dir},
        {"sample_name", sample_name},
        {"phenotype", phenotype},
        {"variant_filter", Value::Map{
            {"min_quality", variant_filter.min_quality},
            {"max_population_freq", variant_filter.max_population_freq},
            {"consequence_types", std::move(consequences)},
        }},
        {"sequence_context", Value::Map{
            {"window_size", sequence_context.window_size},
        }},
        {"genos", Value::Map{
            {"server_url", embedding.server_url},
            {"model_name", embedding.model_name},
            {"pooling", embedding.pooling},
            {"timeout", embedding.timeout_seconds},
            {"mock_mode", embedding.mock_mode},
        }},
        {"performance", Value::Map{
            {"batch_size", embedding.batch_size},
        }},
    };
}

PlanCompiler::PlanCompiler(std::shared_ptr<const TaskRegistry> registry, LoggerPtr logger)
    : m_registry{std::move(registry)}
    , m_logger{std::move(logger)}
{
    register_template("variant_analysis", variant_analysis_template);
    register_template("variant_screening", variant_screening_template);
}

void PlanCompiler::register_template(const std::string& analysis_type, PlanTemplate tmpl)
{
    if (analysis_type.empty())
    {
        throw std::invalid_argument("Analysis type must not be empty");
    }
    if (!tmpl)
    {
        throw std::invalid_argument("Template for '" + analysis_type + "' is empty");
    }
    m_templates[analysis_type] = std::move(tmpl);
}

std::vector<std::string> PlanCompiler::analysis_types() const
{
    std::vector<std::string> result;
    for (const auto& [name, tmpl] : m_templates)
    {
        result.push_back(name);
    }
    return result;
}

void PlanCompiler::check_parameters(const RunParameters& params) const
{
    auto invalid = [](const std::string& message) {
        return PlanError(PlanErrorCode::InvalidConfiguration, message);
    };

    if (params.input_vcf.empty())
    {
        throw invalid("Run parameter 'input_vcf' is required");
    }
    if (params.output_dir.empty())
    {
        throw invalid("Run parameter 'output_dir' is required");
    }
    if (params.sample_name.empty())
    {
        throw invalid("Run parameter 'sample_name' must not be empty");
    }
    if (!has_template(params.analysis_type))
    {
        std::string known;
        for (const auto& name : analysis_types())
        {
            if (!known.empty()) known += ", ";
            known += name;
        }
        throw invalid("Unknown analysis type '" + params.analysis_type + "' (known: " + known + ")");
    }

    const auto& vf = params.variant_filter;
    if (std::isnan(vf.min_quality) || vf.min_quality < 0.0)
    {
        throw invalid("variant_filter.min_quality must be non-negative, got " +
                      std::to_string(vf.min_quality));
    }
    if (std::isnan(vf.max_population_freq) ||
        vf.max_population_freq < 0.0 || vf.max_population_freq > 1.0)
    {
        throw invalid("variant_filter.max_population_freq must be within [0, 1], got " +
                      std::to_string(vf.max_population_freq));
    }
    if (params.sequence_context.window_size <= 0)
    {
        throw invalid("sequence_context.window_size must be positive, got " +
                      std::to_string(params.sequence_context.window_size));
    }
    if (params.embedding.timeout_seconds <= 0)
    {
        throw invalid("genos.timeout must be positive, got " +
                      std::to_string(params.embedding.timeout_seconds));
    }
    if (params.embedding.batch_size <= 0)
    {
        throw invalid("performance.batch_size must be positive, got " +
                      std::to_string(params.embedding.batch_size));
    }
}

Plan PlanCompiler::compile(const RunParameters& params) const
{
    check_parameters(params);

    if (m_logger)
    {
        SPDLOG_LOGGER_INFO(m_logger, "Compiling '{}' plan for sample '{}'",
                           params.analysis_type, params.sample_name);
    }

    Plan plan;
    plan.created_at = current_timestamp();
    plan.run_parameters = params.to_value();
    plan.tasks = m_templates.at(params.analysis_type)(params);

    try
    {
        auto diags = validate_plan(plan, m_registry.get());
        if (m_logger)
        {
            for (const auto& warning : diags->warnings())
            {
                SPDLOG_LOGGER_WARN(m_logger, "{}", warning.message);
            }
        }
    }
    catch (const PlanError& e)
    {
        if (m_logger)
        {
            SPDLOG_LOGGER_ERROR(m_logger, "{}", e.what());
        }
        throw;
    }

    if (m_logger)
    {
        SPDLOG_LOGGER_INFO(m_logger, "Plan compiled: {} task(s)", plan.task_count());
    }
    return plan;
}

} // namespace genoflow
