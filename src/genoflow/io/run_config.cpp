#include "genoflow/io/run_config.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/io/plan_io.hpp"

namespace genoflow
{

namespace
{

[[noreturn]] void wrong_type(const std::string& key, const char* expected)
{
    throw PlanError(PlanErrorCode::InvalidConfiguration,
                    "Configuration key '" + key + "' must be " + expected);
}

template <typename T>
T read_as(const YAML::Node& node, const std::string& key, const char* expected)
{
    if (!node.IsScalar())
    {
        wrong_type(key, expected);
    }
    try
    {
        return node.as<T>();
    }
    catch (const YAML::BadConversion&)
    {
        wrong_type(key, expected);
    }
}

void read_string(const YAML::Node& parent, const char* name, const std::string& section,
                 std::string& out)
{
    if (auto n = parent[name])
    {
        out = read_as<std::string>(n, section + name, "a string");
    }
}

void read_int(const YAML::Node& parent, const char* name, const std::string& section,
              std::int64_t& out)
{
    if (auto n = parent[name])
    {
        out = read_as<std::int64_t>(n, section + name, "an integer");
    }
}

void read_double(const YAML::Node& parent, const char* name, const std::string& section,
                 double& out)
{
    if (auto n = parent[name])
    {
        out = read_as<double>(n, section + name, "a number");
    }
}

void read_bool(const YAML::Node& parent, const char* name, const std::string& section,
               bool& out)
{
    if (auto n = parent[name])
    {
        out = read_as<bool>(n, section + name, "true or false");
    }
}

YAML::Node section(const YAML::Node& root, const char* name)
{
    YAML::Node n = root[name];
    if (n && !n.IsMap() && !n.IsNull())
    {
        wrong_type(name, "a mapping");
    }
    return n;
}

void read_variant_filter(const YAML::Node& n, VariantFilterSettings& vf)
{
    const std::string prefix = "variant_filter.";
    read_double(n, "min_quality", prefix, vf.min_quality);
    read_double(n, "max_population_freq", prefix, vf.max_population_freq);
    if (auto types = n["consequence_types"])
    {
        if (!types.IsSequence())
        {
            wrong_type(prefix + "consequence_types", "a list of strings");
        }
        vf.consequence_types.clear();
        for (const auto& item : types)
        {
            vf.consequence_types.push_back(
                read_as<std::string>(item, prefix + "consequence_types", "a list of strings"));
        }
    }
}

void read_genos(const YAML::Node& n, EmbeddingSettings& emb)
{
    const std::string prefix = "genos.";
    read_string(n, "server_url", prefix, emb.server_url);
    read_string(n, "model_name", prefix, emb.model_name);
    read_string(n, "pooling", prefix, emb.pooling);
    read_int(n, "timeout", prefix, emb.timeout_seconds);
    read_bool(n, "mock_mode", prefix, emb.mock_mode);
}

void read_execution(const YAML::Node& n, AppConfig& cfg)
{
    const std::string prefix = "execution.";
    if (auto threads = n["threads"])
    {
        auto count = read_as<std::int64_t>(threads, prefix + "threads", "a non-negative integer");
        if (count < 0)
        {
            wrong_type(prefix + "threads", "a non-negative integer");
        }
        cfg.threads = static_cast<size_t>(count);
    }
    read_bool(n, "halt_on_error", prefix, cfg.halt_on_error);
    read_int(n, "timeout_seconds", prefix, cfg.timeout_seconds);
    if (cfg.timeout_seconds < 0)
    {
        wrong_type(prefix + "timeout_seconds", "a non-negative integer");
    }
}

void read_logging(const YAML::Node& n, AppConfig& cfg)
{
    if (auto level = n["level"])
    {
        auto text = read_as<std::string>(level, "logging.level", "a log level name");
        auto parsed = parse_log_level(text);
        if (!parsed)
        {
            throw PlanError(PlanErrorCode::InvalidConfiguration,
                            "Configuration key 'logging.level' has unknown level '" + text + "'");
        }
        cfg.log_level = *parsed;
    }
}

void read_critic(const YAML::Node& n, CriticSettings& critic)
{
    const std::string prefix = "critic.";
    read_bool(n, "check_score_evidence", prefix, critic.check_score_evidence);
    read_double(n, "high_score_threshold", prefix, critic.high_score);
    read_double(n, "low_score_threshold", prefix, critic.low_score);
    if (critic.low_score < 0.0 || critic.high_score > 1.0 || critic.low_score > critic.high_score)
    {
        throw PlanError(PlanErrorCode::InvalidConfiguration,
                        "Configuration keys 'critic.low_score_threshold' and "
                        "'critic.high_score_threshold' must satisfy 0 <= low <= high <= 1");
    }
}

} // namespace

ExecutorConfig AppConfig::executor_config() const
{
    ExecutorConfig config;
    config.thread_count = threads;
    config.halt_on_error = halt_on_error;
    if (timeout_seconds > 0)
    {
        config.run_timeout = std::chrono::seconds(timeout_seconds);
    }
    return config;
}

AppConfig parse_run_config(const std::string& yaml_text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw PersistenceError(std::string("Invalid run configuration: ") + e.what());
    }

    AppConfig cfg;
    if (root.IsNull())
    {
        return cfg;
    }
    if (!root.IsMap())
    {
        throw PersistenceError("Invalid run configuration: top level must be a mapping");
    }

    RunParameters& params = cfg.run_parameters;
    read_string(root, "analysis_type", "", params.analysis_type);
    read_string(root, "sample_name", "", params.sample_name);
    read_string(root, "phenotype", "", params.phenotype);
    read_string(root, "input_vcf", "", params.input_vcf);
    read_string(root, "output_dir", "", params.output_dir);

    if (auto n = section(root, "variant_filter"))
    {
        read_variant_filter(n, params.variant_filter);
    }
    if (auto n = section(root, "sequence_context"))
    {
        read_int(n, "window_size", "sequence_context.", params.sequence_context.window_size);
    }
    if (auto n = section(root, "genos"))
    {
        read_genos(n, params.embedding);
    }
    if (auto n = section(root, "performance"))
    {
        read_int(n, "batch_size", "performance.", params.embedding.batch_size);
    }
    if (auto n = section(root, "execution"))
    {
        read_execution(n, cfg);
    }
    if (auto n = section(root, "logging"))
    {
        read_logging(n, cfg);
    }
    if (auto n = section(root, "critic"))
    {
        read_critic(n, cfg.critic);
    }

    return cfg;
}

AppConfig load_run_config(const std::string& path)
{
    return parse_run_config(read_text_file(path));
}

} // namespace genoflow
