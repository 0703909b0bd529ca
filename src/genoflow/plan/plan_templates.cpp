#include "genoflow/plan/plan_templates.hpp"
#include "genoflow/plan/references.hpp"

namespace genoflow
{

namespace
{

std::string output_path(const RunParameters& params, const std::string& file_name)
{
    std::string dir = params.output_dir;
    if (!dir.empty() && dir.back() != '/')
    {
        dir += '/';
    }
    return dir + file_name;
}

Value string_list(const std::vector<std::string>& items)
{
    Value::List result;
    result.reserve(items.size());
    for (const auto& item : items)
    {
        result.emplace_back(item);
    }
    return Value{std::move(result)};
}

TaskSpec variant_filter_task(const RunParameters& params)
{
    TaskSpec task;
    task.id = "variant_filter";
    task.type = "variant_filter";
    task.description = "Candidate variant filtering (quality, population frequency, consequence)";
    task.config = {
        {"vcf_file", params.input_vcf},
        {"sample_name", params.sample_name},
        {"min_quality", params.variant_filter.min_quality},
        {"max_pop_freq", params.variant_filter.max_population_freq},
        {"consequence_types", string_list(params.variant_filter.consequence_types)},
        {"filtered_vcf_path", output_path(params, "variants.filtered.vcf")},
        {"filter_stats_path", output_path(params, "filter_stats.json")},
    };
    return task;
}

TaskSpec sequence_context_task(const RunParameters& params)
{
    TaskSpec task;
    task.id = "sequence_context";
    task.type = "sequence_context";
    task.description = "Reference/alternate sequence window extraction";
    task.depends_on = {"variant_filter"};
    task.config = {
        {"variants_file", output_ref("variant_filter", "filtered_vcf")},
        {"variant_ids", output_ref("variant_filter", "variant_ids")},
        {"window_size", params.sequence_context.window_size},
        {"contexts_path", output_path(params, "contexts.jsonl")},
    };
    return task;
}

TaskSpec genos_embedding_task(const RunParameters& params)
{
    const auto& e = params.embedding;
    TaskSpec task;
    task.id = "genos_embedding";
    task.type = "genos_embedding";
    task.description = "Sequence embedding generation";
    task.depends_on = {"sequence_context"};
    task.config = {
        {"contexts_file", output_ref("sequence_context", "contexts_file")},
        {"variant_ids", output_ref("sequence_context", "variant_ids")},
        {"server_url", e.server_url},
        {"model_name", e.model_name},
        {"pooling", e.pooling},
        {"timeout", e.timeout_seconds},
        {"batch_size", e.batch_size},
        {"mock_mode", e.mock_mode},
        {"embeddings_path", output_path(params, "genos_embeddings.parquet")},
    };
    return task;
}

TaskSpec scoring_task(const RunParameters& params)
{
    TaskSpec task;
    task.id = "scoring";
    task.type = "scoring";
    task.description = "Variant effect scoring";
    task.depends_on = {"genos_embedding", "sequence_context"};
    task.config = {
        {"embeddings_file", output_ref("genos_embedding", "embeddings_file")},
        {"contexts_file", output_ref("sequence_context", "contexts_file")},
        {"variant_ids", output_ref("genos_embedding", "variant_ids")},
        {"scores_path", output_path(params, "scores.tsv")},
    };
    return task;
}

TaskSpec evidence_rag_task(const RunParameters& params)
{
    TaskSpec task;
    task.id = "evidence_rag";
    task.type = "evidence_rag";
    task.description = "Evidence retrieval and attribution";
    task.depends_on = {"scoring"};
    task.config = {
        {"scores_file", output_ref("scoring", "scores_file")},
        {"variant_ids", output_ref("scoring", "variant_ids")},
        {"scores", output_ref("scoring", "scores")},
        {"phenotype", params.phenotype},
        {"evidence_path", output_path(params, "evidence.json")},
    };
    return task;
}

TaskSpec report_generation_task(const RunParameters& params)
{
    TaskSpec task;
    task.id = "report_generation";
    task.type = "report_generation";
    task.description = "Report generation";
    task.depends_on = {"evidence_rag", "scoring"};
    task.config = {
        {"scores_file", output_ref("scoring", "scores_file")},
        {"evidence_file", output_ref("evidence_rag", "evidence_file")},
        {"sample_name", params.sample_name},
        {"phenotype", params.phenotype},
        {"report_path", output_path(params, "report.md")},
    };
    return task;
}

} // namespace

std::vector<TaskSpec> variant_screening_template(const RunParameters& params)
{
    return {
        variant_filter_task(params),
        sequence_context_task(params),
        genos_embedding_task(params),
        scoring_task(params),
    };
}

std::vector<TaskSpec> variant_analysis_template(const RunParameters& params)
{
    auto tasks = variant_screening_template(params);
    tasks.push_back(evidence_rag_task(params));
    tasks.push_back(report_generation_task(params));
    return tasks;
}

} // namespace genoflow
