#include "genoflow/common/value.hpp"
#include "genoflow/common/value.inline.hpp"
#include <sstream>

namespace genoflow
{

namespace
{

constexpr std::string_view k_reference_prefix = "${output.";
constexpr std::string_view k_reference_suffix = "}";

} // namespace

const char* to_string(ValueKind kind) noexcept
{
    switch (kind)
    {
    case ValueKind::Null:
        return "Null";
    case ValueKind::Bool:
        return "Bool";
    case ValueKind::Int:
        return "Int";
    case ValueKind::Double:
        return "Double";
    case ValueKind::String:
        return "String";
    case ValueKind::Artifact:
        return "Artifact";
    case ValueKind::Reference:
        return "Reference";
    case ValueKind::List:
        return "List";
    case ValueKind::Map:
        return "Map";
    }
    return "Unknown";
}

// ============================================================================
// OutputReference
// ============================================================================

std::string OutputReference::to_string() const
{
    std::string result{k_reference_prefix};
    result += task_id;
    result += '.';
    result += output_key;
    result += k_reference_suffix;
    return result;
}

std::optional<OutputReference> OutputReference::parse(std::string_view text)
{
    if (text.size() <= k_reference_prefix.size() + k_reference_suffix.size() ||
        text.substr(0, k_reference_prefix.size()) != k_reference_prefix ||
        text.substr(text.size() - k_reference_suffix.size()) != k_reference_suffix)
    {
        return std::nullopt;
    }

    std::string_view inner = text.substr(
        k_reference_prefix.size(),
        text.size() - k_reference_prefix.size() - k_reference_suffix.size());

    size_t dot = inner.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= inner.size())
    {
        return std::nullopt;
    }

    std::string_view task_id = inner.substr(0, dot);
    std::string_view output_key = inner.substr(dot + 1);

    // A second reference or stray braces means this is not exactly one reference
    if (task_id.find_first_of("${}") != std::string_view::npos ||
        output_key.find_first_of("${}") != std::string_view::npos)
    {
        return std::nullopt;
    }

    return OutputReference{std::string{task_id}, std::string{output_key}};
}

bool OutputReference::mentions_reference(std::string_view text) noexcept
{
    return text.find(k_reference_prefix) != std::string_view::npos;
}

// ============================================================================
// Value
// ============================================================================

double Value::to_double() const
{
    if (const auto* i = try_as<std::int64_t>())
    {
        return static_cast<double>(*i);
    }
    if (const auto* d = try_as<double>())
    {
        return *d;
    }
    throw ValueTypeError{
        std::string{"Value type mismatch: expected a number, got "} + genoflow::to_string(kind())};
}

bool Value::contains_references() const
{
    switch (kind())
    {
    case ValueKind::Reference:
        return true;
    case ValueKind::List:
        for (const auto& item : as<List>())
        {
            if (item.contains_references())
            {
                return true;
            }
        }
        return false;
    case ValueKind::Map:
        for (const auto& [key, item] : as<Map>())
        {
            if (item.contains_references())
            {
                return true;
            }
        }
        return false;
    default:
        return false;
    }
}

std::string Value::describe() const
{
    std::ostringstream oss;
    switch (kind())
    {
    case ValueKind::Null:
        oss << "null";
        break;
    case ValueKind::Bool:
        oss << (as<bool>() ? "true" : "false");
        break;
    case ValueKind::Int:
        oss << as<std::int64_t>();
        break;
    case ValueKind::Double:
        oss << as<double>();
        break;
    case ValueKind::String:
        oss << '"' << as<std::string>() << '"';
        break;
    case ValueKind::Artifact:
        oss << "artifact(" << as<ArtifactLocator>().uri << ")";
        break;
    case ValueKind::Reference:
        oss << as<OutputReference>().to_string();
        break;
    case ValueKind::List:
    {
        oss << '[';
        bool first = true;
        for (const auto& item : as<List>())
        {
            if (!first) oss << ", ";
            oss << item.describe();
            first = false;
        }
        oss << ']';
        break;
    }
    case ValueKind::Map:
    {
        oss << '{';
        bool first = true;
        for (const auto& [key, item] : as<Map>())
        {
            if (!first) oss << ", ";
            oss << key << ": " << item.describe();
            first = false;
        }
        oss << '}';
        break;
    }
    }
    return oss.str();
}

} // namespace genoflow
