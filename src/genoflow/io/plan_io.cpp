#include "genoflow/io/plan_io.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/common/value.inline.hpp"
#include "genoflow/plan/references.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>

namespace genoflow
{

namespace
{

constexpr const char* k_artifact_tag = "artifact";
constexpr const char* k_artifact_tag_loaded = "!artifact";

// ============================================================================
// Scalar formatting and inference
// ============================================================================

std::string format_double(double value)
{
    if (std::isnan(value))
    {
        return ".nan";
    }
    if (std::isinf(value))
    {
        return value > 0 ? ".inf" : "-.inf";
    }

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(15) << value;
    std::string text = oss.str();
    if (std::strtod(text.c_str(), nullptr) != value)
    {
        oss.str("");
        oss << std::setprecision(17) << value;
        text = oss.str();
    }
    if (text.find_first_of(".eE") == std::string::npos)
    {
        text += ".0";
    }
    return text;
}

bool is_null_text(const std::string& text)
{
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

std::optional<bool> parse_bool_text(const std::string& text)
{
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;
    return std::nullopt;
}

std::optional<std::int64_t> parse_int_text(const std::string& text)
{
    if (text.empty() || text.find_first_not_of("+-0123456789") != std::string::npos)
    {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size())
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(parsed);
}

std::optional<double> parse_double_text(const std::string& text)
{
    if (text == ".inf" || text == ".Inf" || text == ".INF" || text == "+.inf")
    {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-.inf" || text == "-.Inf" || text == "-.INF")
    {
        return -std::numeric_limits<double>::infinity();
    }
    if (text == ".nan" || text == ".NaN" || text == ".NAN")
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (text.empty() || text.find_first_not_of("+-.0123456789eE") != std::string::npos)
    {
        return std::nullopt;
    }
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size())
    {
        return std::nullopt;
    }
    return parsed;
}

Value infer_plain_scalar(const std::string& text)
{
    if (is_null_text(text))
    {
        return Value{};
    }
    if (auto b = parse_bool_text(text))
    {
        return Value{*b};
    }
    if (auto i = parse_int_text(text))
    {
        return Value{*i};
    }
    if (auto d = parse_double_text(text))
    {
        return Value{*d};
    }
    return Value{text};
}

// ============================================================================
// Node helpers
// ============================================================================

[[noreturn]] void malformed(const std::string& context, const std::string& what)
{
    throw PersistenceError("Malformed document at " + context + ": " + what);
}

YAML::Node require(const YAML::Node& map, const char* key, const std::string& context)
{
    YAML::Node node = map[key];
    if (!node.IsDefined())
    {
        malformed(context, std::string{"missing key '"} + key + "'");
    }
    return node;
}

std::string scalar_string(const YAML::Node& node, const std::string& context)
{
    if (!node.IsScalar())
    {
        malformed(context, "expected a scalar");
    }
    return node.Scalar();
}

std::string optional_string(const YAML::Node& map, const char* key, const std::string& context)
{
    YAML::Node node = map[key];
    if (!node.IsDefined() || node.IsNull())
    {
        return {};
    }
    return scalar_string(node, context + "." + key);
}

std::int64_t scalar_int(const YAML::Node& node, const std::string& context)
{
    auto parsed = parse_int_text(scalar_string(node, context));
    if (!parsed)
    {
        malformed(context, "expected an integer, got '" + node.Scalar() + "'");
    }
    return *parsed;
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& context)
{
    std::vector<std::string> result;
    if (!node.IsDefined() || node.IsNull())
    {
        return result;
    }
    if (!node.IsSequence())
    {
        malformed(context, "expected a sequence");
    }
    for (size_t i = 0; i < node.size(); ++i)
    {
        result.push_back(scalar_string(node[i], context + "[" + std::to_string(i) + "]"));
    }
    return result;
}

Value::Map load_map(const YAML::Node& node, const std::string& context)
{
    if (!node.IsDefined() || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        malformed(context, "expected a mapping");
    }
    return load_value(node, context).as<Value::Map>();
}

YAML::Node parse_document(const std::string& yaml_text, const char* what)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw PersistenceError(std::string{"Cannot parse "} + what + " document: " + e.what());
    }
    if (!root.IsMap())
    {
        throw PersistenceError(std::string{"Malformed "} + what + " document: root is not a mapping");
    }
    return root;
}

void check_format_version(const YAML::Node& root, int supported, const char* what)
{
    std::int64_t version = scalar_int(require(root, "format_version", what), "format_version");
    if (version != supported)
    {
        throw PersistenceError(std::string{"Unsupported "} + what + " format_version " +
                               std::to_string(version) + " (supported: " +
                               std::to_string(supported) + ")");
    }
}

void emit_string_list(YAML::Emitter& out, const std::vector<std::string>& items)
{
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& item : items)
    {
        out << YAML::DoubleQuoted << item;
    }
    out << YAML::EndSeq;
}

void emit_map(YAML::Emitter& out, const Value::Map& map)
{
    out << YAML::BeginMap;
    for (const auto& [key, item] : map)
    {
        out << YAML::Key << key << YAML::Value;
        emit_value(out, item);
    }
    out << YAML::EndMap;
}

std::string finish(const YAML::Emitter& out, const char* what)
{
    if (!out.good())
    {
        throw PersistenceError(std::string{"Cannot write "} + what + " document: " +
                               out.GetLastError());
    }
    return std::string{out.c_str()} + "\n";
}

} // namespace

// ============================================================================
// Values
// ============================================================================

void emit_value(YAML::Emitter& out, const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::Null:
        out << YAML::Null;
        break;
    case ValueKind::Bool:
        out << value.as<bool>();
        break;
    case ValueKind::Int:
        out << std::to_string(value.as<std::int64_t>());
        break;
    case ValueKind::Double:
        out << format_double(value.as<double>());
        break;
    case ValueKind::String:
        out << YAML::DoubleQuoted << value.as<std::string>();
        break;
    case ValueKind::Artifact:
        out << YAML::LocalTag(k_artifact_tag) << YAML::DoubleQuoted
            << value.as<ArtifactLocator>().uri;
        break;
    case ValueKind::Reference:
        out << YAML::DoubleQuoted << value.as<OutputReference>().to_string();
        break;
    case ValueKind::List:
        out << YAML::BeginSeq;
        for (const auto& item : value.as<Value::List>())
        {
            emit_value(out, item);
        }
        out << YAML::EndSeq;
        break;
    case ValueKind::Map:
        emit_map(out, value.as<Value::Map>());
        break;
    }
}

Value load_value(const YAML::Node& node, const std::string& context)
{
    switch (node.Type())
    {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value{};

    case YAML::NodeType::Scalar:
    {
        const std::string& tag = node.Tag();
        const std::string& text = node.Scalar();
        if (tag == k_artifact_tag_loaded)
        {
            return Value{ArtifactLocator{text}};
        }
        if (tag == "!" || tag == "tag:yaml.org,2002:str")
        {
            return Value{text};
        }
        if (tag == "?" || tag.empty() ||
            tag == "tag:yaml.org,2002:int" ||
            tag == "tag:yaml.org,2002:float" ||
            tag == "tag:yaml.org,2002:bool" ||
            tag == "tag:yaml.org,2002:null")
        {
            return infer_plain_scalar(text);
        }
        malformed(context, "unsupported tag '" + tag + "'");
    }

    case YAML::NodeType::Sequence:
    {
        Value::List items;
        items.reserve(node.size());
        for (size_t i = 0; i < node.size(); ++i)
        {
            items.push_back(load_value(node[i], context + "[" + std::to_string(i) + "]"));
        }
        return Value{std::move(items)};
    }

    case YAML::NodeType::Map:
    {
        Value::Map map;
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = scalar_string(it->first, context + " key");
            if (map.count(key) != 0)
            {
                malformed(context, "duplicate key '" + key + "'");
            }
            Value item = load_value(it->second, context + "." + key);
            map.emplace(std::move(key), std::move(item));
        }
        return Value{std::move(map)};
    }
    }
    malformed(context, "unsupported node type");
}

// ============================================================================
// Plan
// ============================================================================

std::string store_plan(const Plan& plan)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "format_version" << YAML::Value << plan.format_version;
    out << YAML::Key << "created_at" << YAML::Value << YAML::DoubleQuoted << plan.created_at;
    out << YAML::Key << "run_parameters" << YAML::Value;
    emit_map(out, plan.run_parameters);

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto& task : plan.tasks)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << YAML::DoubleQuoted << task.id;
        out << YAML::Key << "type" << YAML::Value << YAML::DoubleQuoted << task.type;
        out << YAML::Key << "description" << YAML::Value << YAML::DoubleQuoted << task.description;
        out << YAML::Key << "depends_on" << YAML::Value;
        emit_string_list(out, task.depends_on);
        out << YAML::Key << "config" << YAML::Value;
        emit_map(out, task.config);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return finish(out, "plan");
}

Plan load_plan(const std::string& yaml_text)
{
    YAML::Node root = parse_document(yaml_text, "plan");

    try
    {
        check_format_version(root, k_plan_format_version, "plan");

        Plan plan;
        plan.format_version = k_plan_format_version;
        plan.created_at = optional_string(root, "created_at", "plan");
        plan.run_parameters = load_map(root["run_parameters"], "run_parameters");

        YAML::Node tasks = require(root, "tasks", "plan");
        if (!tasks.IsSequence())
        {
            malformed("tasks", "expected a sequence");
        }
        for (size_t i = 0; i < tasks.size(); ++i)
        {
            const std::string context = "tasks[" + std::to_string(i) + "]";
            YAML::Node node = tasks[i];
            if (!node.IsMap())
            {
                malformed(context, "expected a mapping");
            }

            TaskSpec task;
            task.id = scalar_string(require(node, "id", context), context + ".id");
            task.type = scalar_string(require(node, "type", context), context + ".type");
            task.description = optional_string(node, "description", context);
            task.depends_on = string_list(node["depends_on"], context + ".depends_on");
            task.config = parse_references(load_map(node["config"], context + ".config"),
                                           "task '" + task.id + "' config");
            plan.tasks.push_back(std::move(task));
        }
        return plan;
    }
    catch (const YAML::Exception& e)
    {
        throw PersistenceError(std::string{"Malformed plan document: "} + e.what());
    }
}

// ============================================================================
// Results
// ============================================================================

std::string store_results(const std::vector<TaskResult>& results)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "format_version" << YAML::Value << k_results_format_version;
    out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : results)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "task_id" << YAML::Value << YAML::DoubleQuoted << r.task_id;
        out << YAML::Key << "status" << YAML::Value << to_string(r.status);
        out << YAML::Key << "attempt" << YAML::Value << r.attempt;
        if (r.started_at)
        {
            out << YAML::Key << "started_at" << YAML::Value
                << std::to_string(r.started_at->time_since_epoch().count());
        }
        if (r.finished_at)
        {
            out << YAML::Key << "finished_at" << YAML::Value
                << std::to_string(r.finished_at->time_since_epoch().count());
        }
        out << YAML::Key << "outputs" << YAML::Value;
        emit_map(out, r.outputs);
        if (r.error)
        {
            out << YAML::Key << "error" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "kind" << YAML::Value << YAML::DoubleQuoted << r.error->kind;
            out << YAML::Key << "message" << YAML::Value << YAML::DoubleQuoted << r.error->message;
            out << YAML::EndMap;
        }
        if (!r.skip_reason.empty())
        {
            out << YAML::Key << "skip_reason" << YAML::Value << YAML::DoubleQuoted << r.skip_reason;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return finish(out, "results");
}

std::vector<TaskResult> load_results(const std::string& yaml_text)
{
    YAML::Node root = parse_document(yaml_text, "results");

    try
    {
        check_format_version(root, k_results_format_version, "results");

        YAML::Node items = require(root, "results", "results");
        if (!items.IsSequence())
        {
            malformed("results", "expected a sequence");
        }

        std::vector<TaskResult> results;
        for (size_t i = 0; i < items.size(); ++i)
        {
            const std::string context = "results[" + std::to_string(i) + "]";
            YAML::Node node = items[i];
            if (!node.IsMap())
            {
                malformed(context, "expected a mapping");
            }

            TaskResult r;
            r.task_id = scalar_string(require(node, "task_id", context), context + ".task_id");

            std::string status = scalar_string(require(node, "status", context), context + ".status");
            auto parsed = parse_task_status(status);
            if (!parsed)
            {
                malformed(context, "unknown status '" + status + "'");
            }
            r.status = *parsed;

            if (node["attempt"].IsDefined())
            {
                r.attempt = static_cast<int>(scalar_int(node["attempt"], context + ".attempt"));
            }
            if (node["started_at"].IsDefined())
            {
                r.started_at = Timestamp{std::chrono::milliseconds{
                    scalar_int(node["started_at"], context + ".started_at")}};
            }
            if (node["finished_at"].IsDefined())
            {
                r.finished_at = Timestamp{std::chrono::milliseconds{
                    scalar_int(node["finished_at"], context + ".finished_at")}};
            }
            r.outputs = load_map(node["outputs"], context + ".outputs");

            YAML::Node error = node["error"];
            if (error.IsDefined() && !error.IsNull())
            {
                r.error = TaskFailure{optional_string(error, "kind", context + ".error"),
                                      optional_string(error, "message", context + ".error")};
            }
            r.skip_reason = optional_string(node, "skip_reason", context);
            results.push_back(std::move(r));
        }
        return results;
    }
    catch (const YAML::Exception& e)
    {
        throw PersistenceError(std::string{"Malformed results document: "} + e.what());
    }
}

// ============================================================================
// Findings
// ============================================================================

std::string store_findings(const FindingsReport& report)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total" << YAML::Value << report.size();
    out << YAML::Key << "errors" << YAML::Value << report.count(Severity::Error);
    out << YAML::Key << "warnings" << YAML::Value << report.count(Severity::Warning);
    out << YAML::Key << "info" << YAML::Value << report.count(Severity::Info);
    out << YAML::EndMap;

    out << YAML::Key << "findings" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : report.findings())
    {
        out << YAML::BeginMap;
        out << YAML::Key << "severity" << YAML::Value << to_string(f.severity);
        out << YAML::Key << "category" << YAML::Value << to_string(f.category);
        out << YAML::Key << "tasks" << YAML::Value;
        emit_string_list(out, f.tasks);
        out << YAML::Key << "output_keys" << YAML::Value;
        emit_string_list(out, f.output_keys);
        out << YAML::Key << "message" << YAML::Value << YAML::DoubleQuoted << f.message;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return finish(out, "findings");
}

FindingsReport load_findings(const std::string& yaml_text)
{
    YAML::Node root = parse_document(yaml_text, "findings");

    try
    {
        YAML::Node items = require(root, "findings", "findings");
        if (!items.IsSequence())
        {
            malformed("findings", "expected a sequence");
        }

        FindingsReport report;
        for (size_t i = 0; i < items.size(); ++i)
        {
            const std::string context = "findings[" + std::to_string(i) + "]";
            YAML::Node node = items[i];
            if (!node.IsMap())
            {
                malformed(context, "expected a mapping");
            }

            Finding f;
            std::string severity = scalar_string(require(node, "severity", context), context);
            auto parsed_severity = parse_severity(severity);
            if (!parsed_severity)
            {
                malformed(context, "unknown severity '" + severity + "'");
            }
            f.severity = *parsed_severity;

            std::string category = scalar_string(require(node, "category", context), context);
            auto parsed_category = parse_finding_category(category);
            if (!parsed_category)
            {
                malformed(context, "unknown category '" + category + "'");
            }
            f.category = *parsed_category;

            f.tasks = string_list(node["tasks"], context + ".tasks");
            f.output_keys = string_list(node["output_keys"], context + ".output_keys");
            f.message = optional_string(node, "message", context);
            report.add(std::move(f));
        }
        return report;
    }
    catch (const YAML::Exception& e)
    {
        throw PersistenceError(std::string{"Malformed findings document: "} + e.what());
    }
}

// ============================================================================
// Files
// ============================================================================

void write_text_file(const std::string& path, const std::string& text)
{
    namespace fs = std::filesystem;
    try
    {
        fs::path target{path};
        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path());
        }

        fs::path temp = target;
        temp += ".tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file)
            {
                throw PersistenceError("Cannot open '" + temp.string() + "' for writing");
            }
            file << text;
            file.flush();
            if (!file)
            {
                throw PersistenceError("Cannot write '" + temp.string() + "'");
            }
        }
        fs::rename(temp, target);
    }
    catch (const fs::filesystem_error& e)
    {
        throw PersistenceError("Cannot write '" + path + "': " + e.what());
    }
}

std::string read_text_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw PersistenceError("Cannot open '" + path + "' for reading");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad())
    {
        throw PersistenceError("Cannot read '" + path + "'");
    }
    return oss.str();
}

} // namespace genoflow
