#include "genoflow/tasks/simulated_tasks.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/common/value.inline.hpp"
#include "genoflow/execution/run_context.hpp"

namespace genoflow
{

namespace
{

constexpr const char* k_entity_key = "variant_ids";

// ============================================================================
// Config access
// ============================================================================

const Value& require(const Value::Map& config, const std::string& key)
{
    const Value* value = find_key(config, key);
    if (!value || value->is_null())
    {
        throw TaskError("invalid_input", "Missing configuration key '" + key + "'");
    }
    return *value;
}

template <typename T>
const T& require_as(const Value::Map& config, const std::string& key)
{
    const Value& value = require(config, key);
    if (auto typed = value.try_as<T>())
    {
        return *typed;
    }
    throw TaskError("invalid_input", "Configuration key '" + key + "' has type " +
                                         to_string(value.kind()));
}

double require_number(const Value::Map& config, const std::string& key)
{
    const Value& value = require(config, key);
    if (!value.is_numeric())
    {
        throw TaskError("invalid_input", "Configuration key '" + key + "' must be a number");
    }
    return value.to_double();
}

/// Path of an artifact input, accepting a plain string as well.
std::string require_path(const Value::Map& config, const std::string& key)
{
    const Value& value = require(config, key);
    if (auto artifact = value.try_as<ArtifactLocator>())
    {
        return artifact->uri;
    }
    if (auto text = value.try_as<std::string>())
    {
        return *text;
    }
    throw TaskError("invalid_input", "Configuration key '" + key + "' must be a path");
}

const Value::List& require_ids(const Value::Map& config)
{
    return require_as<Value::List>(config, k_entity_key);
}

/// Pseudo-random fraction in [0, 1), fixed for a given seed.
double unit_fraction(std::uint64_t seed)
{
    return static_cast<double>(seed % 1000000) / 1000000.0;
}

void debug(RunContext& ctx, const std::string& message)
{
    if (ctx.logger())
    {
        SPDLOG_LOGGER_DEBUG(ctx.logger(), "{}", message);
    }
}

// ============================================================================
// Task bodies
// ============================================================================

Value::Map variant_filter(const Value::Map& config, RunContext& ctx)
{
    const std::string& vcf = require_as<std::string>(config, "vcf_file");
    const std::string& sample = require_as<std::string>(config, "sample_name");
    double min_quality = require_number(config, "min_quality");
    double max_pop_freq = require_number(config, "max_pop_freq");
    const auto& consequences = require_as<Value::List>(config, "consequence_types");
    if (vcf.empty())
    {
        throw TaskError("invalid_input", "No VCF file given");
    }
    if (consequences.empty())
    {
        throw TaskError("invalid_input", "No consequence types selected");
    }

    static const char* const k_bases[] = {"A", "C", "G", "T"};
    std::uint64_t seed = stable_hash(vcf + "|" + sample);
    std::int64_t candidates = 12 + static_cast<std::int64_t>(seed % 12);

    Value::List kept;
    for (std::int64_t i = 0; i < candidates; ++i)
    {
        std::uint64_t h = stable_hash(std::to_string(seed) + ":" + std::to_string(i));
        double quality = 100.0 * unit_fraction(h);
        double pop_freq = 0.05 * unit_fraction(h >> 20);
        if (quality < min_quality || pop_freq > max_pop_freq)
        {
            continue;
        }
        std::string id = "chr" + std::to_string(1 + h % 22) + ":" +
                         std::to_string(10000 + (h >> 8) % 90000000) + ":" +
                         k_bases[h % 4] + ">" + k_bases[(h / 4 + 1 + h % 4) % 4];
        kept.emplace_back(std::move(id));
    }

    debug(ctx, "variant_filter kept " + std::to_string(kept.size()) + " of " +
                   std::to_string(candidates) + " candidate(s)");

    auto count = static_cast<std::int64_t>(kept.size());
    return {
        {"filtered_vcf", ArtifactLocator{require_path(config, "filtered_vcf_path")}},
        {"filter_stats", ArtifactLocator{require_path(config, "filter_stats_path")}},
        {k_entity_key, Value{std::move(kept)}},
        {"variant_count", count},
        {"candidate_count", candidates},
    };
}

Value::Map sequence_context(const Value::Map& config, RunContext& ctx)
{
    require_path(config, "variants_file");
    const auto& ids = require_ids(config);
    const auto& window = require_as<std::int64_t>(config, "window_size");
    if (window <= 0)
    {
        throw TaskError("invalid_input", "window_size must be positive");
    }

    debug(ctx, "sequence_context extracted " + std::to_string(ids.size()) + " window(s)");

    return {
        {"contexts_file", ArtifactLocator{require_path(config, "contexts_path")}},
        {k_entity_key, Value{ids}},
        {"context_count", static_cast<std::int64_t>(ids.size())},
        {"sequence_length", 2 * window + 1},
    };
}

Value::Map genos_embedding(const Value::Map& config, RunContext& ctx)
{
    require_path(config, "contexts_file");
    const auto& ids = require_ids(config);
    const std::string& model = require_as<std::string>(config, "model_name");
    const auto& batch_size = require_as<std::int64_t>(config, "batch_size");
    if (batch_size <= 0)
    {
        throw TaskError("invalid_input", "batch_size must be positive");
    }

    std::int64_t dim = model == "10B" ? 4096 : 1024;
    auto batches = (static_cast<std::int64_t>(ids.size()) + batch_size - 1) / batch_size;

    debug(ctx, "genos_embedding embedded " + std::to_string(ids.size()) + " sequence(s) in " +
                   std::to_string(batches) + " batch(es)");

    return {
        {"embeddings_file", ArtifactLocator{require_path(config, "embeddings_path")}},
        {k_entity_key, Value{ids}},
        {"embedding_dim", dim},
        {"batch_count", batches},
        {"model_name", model},
    };
}

Value::Map scoring(const Value::Map& config, RunContext& ctx)
{
    require_path(config, "embeddings_file");
    require_path(config, "contexts_file");
    const auto& ids = require_ids(config);

    Value::List scores;
    double max_score = 0.0;
    for (const auto& id : ids)
    {
        double score = unit_fraction(stable_hash(id.describe()));
        max_score = std::max(max_score, score);
        scores.emplace_back(score);
    }

    debug(ctx, "scoring scored " + std::to_string(ids.size()) + " variant(s)");

    return {
        {"scores_file", ArtifactLocator{require_path(config, "scores_path")}},
        {k_entity_key, Value{ids}},
        {"scores", Value{std::move(scores)}},
        {"max_score", max_score},
    };
}

Value::Map evidence_rag(const Value::Map& config, RunContext& ctx)
{
    require_path(config, "scores_file");
    const auto& ids = require_ids(config);
    const auto& scores = require_as<Value::List>(config, "scores");
    const std::string& phenotype = require_as<std::string>(config, "phenotype");
    if (scores.size() != ids.size())
    {
        throw TaskError("invalid_input", std::to_string(scores.size()) + " score(s) for " +
                                             std::to_string(ids.size()) + " variant(s)");
    }

    // Retrieval is steered by the score: strongly scored variants always
    // find at least one record, and only they are classified pathogenic.
    std::int64_t evidence = 0;
    Value::List counts;
    Value::List significance;
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (!scores[i].is_numeric())
        {
            throw TaskError("invalid_input", "Score of variant " + ids[i].describe() +
                                                 " is not a number");
        }
        double score = scores[i].to_double();
        std::uint64_t h = stable_hash(ids[i].describe() + "|" + phenotype);

        auto count = static_cast<std::int64_t>(h % 4);
        if (score > 0.7 && count == 0)
        {
            count = 1;
        }
        evidence += count;
        counts.emplace_back(count);

        bool alt = ((h >> 8) & 1) != 0;
        if (score >= 0.7)
        {
            significance.emplace_back(alt ? "pathogenic" : "likely_pathogenic");
        }
        else if (score < 0.3)
        {
            significance.emplace_back(alt ? "benign" : "likely_benign");
        }
        else
        {
            significance.emplace_back("uncertain_significance");
        }
    }

    debug(ctx, "evidence_rag retrieved " + std::to_string(evidence) + " evidence item(s)");

    return {
        {"evidence_file", ArtifactLocator{require_path(config, "evidence_path")}},
        {k_entity_key, Value{ids}},
        {"evidence_count", evidence},
        {"evidence_counts", Value{std::move(counts)}},
        {"clinical_significance", Value{std::move(significance)}},
    };
}

Value::Map report_generation(const Value::Map& config, RunContext& ctx)
{
    require_path(config, "scores_file");
    require_path(config, "evidence_file");
    const std::string& sample = require_as<std::string>(config, "sample_name");

    debug(ctx, "report_generation wrote report for sample '" + sample + "'");

    return {
        {"report_file", ArtifactLocator{require_path(config, "report_path")}},
        {"sample_name", sample},
    };
}

TaskContract entity_contract(std::vector<std::string> outputs)
{
    TaskContract contract;
    contract.outputs = std::move(outputs);
    contract.entity_key = k_entity_key;
    return contract;
}

} // namespace

std::uint64_t stable_hash(std::string_view text) noexcept
{
    std::uint64_t hash = 14695981039346656037ull;
    for (char c : text)
    {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ull;
    }
    return hash;
}

void register_simulated_tasks(TaskRegistry& registry)
{
    auto filter = entity_contract({"filtered_vcf", "filter_stats", k_entity_key, "variant_count"});
    filter.is_filter = true;
    registry.register_function("variant_filter", variant_filter, std::move(filter));

    registry.register_function("sequence_context", sequence_context,
                               entity_contract({"contexts_file", k_entity_key, "context_count"}));

    registry.register_function("genos_embedding", genos_embedding,
                               entity_contract({"embeddings_file", k_entity_key, "embedding_dim"}));

    auto score = entity_contract({"scores_file", k_entity_key, "scores", "max_score"});
    score.ranges["scores"] = NumericRange{0.0, 1.0};
    score.ranges["max_score"] = NumericRange{0.0, 1.0};
    registry.register_function("scoring", scoring, std::move(score));

    registry.register_function("evidence_rag", evidence_rag,
                               entity_contract({"evidence_file", k_entity_key, "evidence_count",
                                                "evidence_counts", "clinical_significance"}));

    TaskContract report;
    report.outputs = {"report_file"};
    registry.register_function("report_generation", report_generation, std::move(report));
}

} // namespace genoflow
