/**
 * @file value.inline.hpp
 * @brief Implementations for type-parameterized member methods in the Value class.
 */
#pragma once
#include "genoflow/common/value.hpp"

namespace genoflow
{

namespace detail
{

/**
 * @brief Type trait listing the alternatives Value can hold.
 */
template <typename T>
struct is_value_alternative
{
    static constexpr bool value =
        std::is_same_v<T, bool> ||
        std::is_same_v<T, std::int64_t> ||
        std::is_same_v<T, double> ||
        std::is_same_v<T, std::string> ||
        std::is_same_v<T, ArtifactLocator> ||
        std::is_same_v<T, OutputReference> ||
        std::is_same_v<T, Value::List> ||
        std::is_same_v<T, Value::Map>;
};

template <typename T>
inline constexpr bool is_value_alternative_v = is_value_alternative<T>::value;

template <typename T>
const char* alternative_name() noexcept
{
    if constexpr (std::is_same_v<T, bool>) return "Bool";
    else if constexpr (std::is_same_v<T, std::int64_t>) return "Int";
    else if constexpr (std::is_same_v<T, double>) return "Double";
    else if constexpr (std::is_same_v<T, std::string>) return "String";
    else if constexpr (std::is_same_v<T, ArtifactLocator>) return "Artifact";
    else if constexpr (std::is_same_v<T, OutputReference>) return "Reference";
    else if constexpr (std::is_same_v<T, Value::List>) return "List";
    else return "Map";
}

} // namespace detail

template <typename T>
bool Value::has_type() const noexcept
{
    static_assert(detail::is_value_alternative_v<T>, "Value: T is not a Value alternative");
    return std::holds_alternative<T>(m_data);
}

template <typename T>
const T& Value::as() const
{
    static_assert(detail::is_value_alternative_v<T>, "Value: T is not a Value alternative");
    if (const T* p = std::get_if<T>(&m_data))
    {
        return *p;
    }
    throw ValueTypeError{
        std::string{"Value type mismatch: expected "} + detail::alternative_name<T>() +
        ", got " + to_string(kind())
    };
}

template <typename T>
T& Value::as()
{
    static_assert(detail::is_value_alternative_v<T>, "Value: T is not a Value alternative");
    if (T* p = std::get_if<T>(&m_data))
    {
        return *p;
    }
    throw ValueTypeError{
        std::string{"Value type mismatch: expected "} + detail::alternative_name<T>() +
        ", got " + to_string(kind())
    };
}

template <typename T>
const T* Value::try_as() const noexcept
{
    static_assert(detail::is_value_alternative_v<T>, "Value: T is not a Value alternative");
    return std::get_if<T>(&m_data);
}

} // namespace genoflow
