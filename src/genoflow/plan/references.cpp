#include "genoflow/plan/references.hpp"
#include "genoflow/common/errors.hpp"
#include "genoflow/common/value.inline.hpp"

namespace genoflow
{

Value parse_references(const Value& value, const std::string& context)
{
    switch (value.kind())
    {
    case ValueKind::String:
    {
        const auto& text = value.as<std::string>();
        if (!OutputReference::mentions_reference(text))
        {
            return value;
        }
        auto ref = OutputReference::parse(text);
        if (!ref)
        {
            throw PlanError(
                PlanErrorCode::InvalidConfiguration,
                "Malformed output reference \"" + text + "\" in " + context +
                    "; expected exactly ${output.<task>.<key>}");
        }
        return Value{std::move(*ref)};
    }
    case ValueKind::List:
    {
        Value::List result;
        const auto& items = value.as<Value::List>();
        result.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i)
        {
            result.push_back(parse_references(items[i], context + "[" + std::to_string(i) + "]"));
        }
        return Value{std::move(result)};
    }
    case ValueKind::Map:
        return Value{parse_references(value.as<Value::Map>(), context)};
    default:
        return value;
    }
}

Value::Map parse_references(const Value::Map& config, const std::string& context)
{
    Value::Map result;
    for (const auto& [key, item] : config)
    {
        result.emplace(key, parse_references(item, context + "." + key));
    }
    return result;
}

void collect_references(const Value& value, std::vector<OutputReference>& out)
{
    switch (value.kind())
    {
    case ValueKind::Reference:
        out.push_back(value.as<OutputReference>());
        break;
    case ValueKind::List:
        for (const auto& item : value.as<Value::List>())
        {
            collect_references(item, out);
        }
        break;
    case ValueKind::Map:
        for (const auto& [key, item] : value.as<Value::Map>())
        {
            collect_references(item, out);
        }
        break;
    default:
        break;
    }
}

std::vector<OutputReference> collect_references(const Value::Map& config)
{
    std::vector<OutputReference> result;
    for (const auto& [key, item] : config)
    {
        collect_references(item, result);
    }
    return result;
}

} // namespace genoflow
