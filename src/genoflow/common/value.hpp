/**
 * @file value.hpp
 * @brief Definition of Value, the structured type of task configuration and outputs.
 * @see value.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "genoflow/common/common.hpp"

namespace genoflow
{

/**
 * @brief Exception thrown when Value type access fails.
 */
class ValueTypeError : public std::runtime_error
{
public:
    explicit ValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Opaque pointer to data held in an external artifact store.
 *
 * @details
 * Task bodies write large outputs (sequence windows, embeddings, evidence
 * tables) elsewhere and publish only the locator. genoflow never
 * dereferences it.
 */
struct ArtifactLocator
{
    std::string uri;
};

inline bool operator==(const ArtifactLocator& a, const ArtifactLocator& b)
{
    return a.uri == b.uri;
}

inline bool operator!=(const ArtifactLocator& a, const ArtifactLocator& b)
{
    return !(a == b);
}

/**
 * @brief Typed pointer from a task's config to output `output_key` of task `task_id`.
 *
 * @details
 * The textual form is `${output.<task_id>.<output_key>}`. The task id may not
 * contain '.', the output key may not contain '}'. Parsing happens once, when
 * a TaskSpec is built or loaded; afterwards the reference only exists in this
 * typed form.
 */
struct OutputReference
{
    std::string task_id;
    std::string output_key;

    /**
     * @brief Render in the `${output.T.K}` syntax.
     */
    std::string to_string() const;

    /**
     * @brief Parse text that is exactly one reference.
     * @return The reference, or std::nullopt if @p text is not exactly one
     *         well-formed reference.
     */
    static std::optional<OutputReference> parse(std::string_view text);

    /**
     * @brief Check whether text contains the reference marker anywhere.
     */
    static bool mentions_reference(std::string_view text) noexcept;
};

inline bool operator==(const OutputReference& a, const OutputReference& b)
{
    return a.task_id == b.task_id && a.output_key == b.output_key;
}

inline bool operator!=(const OutputReference& a, const OutputReference& b)
{
    return !(a == b);
}

inline bool operator<(const OutputReference& a, const OutputReference& b)
{
    return std::tie(a.task_id, a.output_key) < std::tie(b.task_id, b.output_key);
}

/**
 * @brief Discriminator for the alternatives a Value can hold.
 * @note Order matches the alternative order of Value's storage.
 */
enum class ValueKind
{
    Null,
    Bool,
    Int,
    Double,
    String,
    Artifact,
    Reference,
    List,
    Map
};

const char* to_string(ValueKind kind) noexcept;

/**
 * @brief A structured value: scalar, artifact locator, reference, list or map.
 *
 * @details
 * Value is the representation of both TaskSpec configuration and TaskResult
 * outputs. Maps are ordered by key so that equality and serialization are
 * deterministic.
 *
 * @par Invariants
 * - A default-constructed Value is null.
 * - Equality is structural; Int and Double never compare equal to each other.
 *
 * @par Thread Safety
 * - Plain value semantics; no internal synchronization.
 * - Concurrent reads of the same instance are safe.
 */
class Value
{
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool value) : m_data{value} {}
    Value(int value) : m_data{static_cast<std::int64_t>(value)} {}
    Value(std::int64_t value) : m_data{value} {}
    Value(double value) : m_data{value} {}
    Value(const char* value) : m_data{std::string{value}} {}
    Value(std::string value) : m_data{std::move(value)} {}
    Value(ArtifactLocator value) : m_data{std::move(value)} {}
    Value(OutputReference value) : m_data{std::move(value)} {}
    Value(List value) : m_data{std::move(value)} {}
    Value(Map value) : m_data{std::move(value)} {}

    [[nodiscard]] ValueKind kind() const noexcept
    {
        return static_cast<ValueKind>(m_data.index());
    }

    [[nodiscard]] bool is_null() const noexcept
    {
        return kind() == ValueKind::Null;
    }

    /**
     * @brief True for Int and Double.
     */
    [[nodiscard]] bool is_numeric() const noexcept
    {
        return kind() == ValueKind::Int || kind() == ValueKind::Double;
    }

    /**
     * @brief Check if the stored alternative is T.
     * @tparam T One of bool, std::int64_t, double, std::string, ArtifactLocator,
     *           OutputReference, List, Map.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Access the stored alternative.
     * @throws ValueTypeError if the stored alternative is not T.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Mutable access to the stored alternative.
     * @throws ValueTypeError if the stored alternative is not T.
     */
    template <typename T>
    [[nodiscard]] T& as();

    /**
     * @brief Try to access the stored alternative.
     * @return Pointer to the value, or nullptr on type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Numeric value as double.
     * @throws ValueTypeError if the value is not Int or Double.
     */
    [[nodiscard]] double to_double() const;

    /**
     * @brief True if this value or any nested value is an OutputReference.
     */
    [[nodiscard]] bool contains_references() const;

    /**
     * @brief Compact single-line rendering for messages and logs.
     */
    [[nodiscard]] std::string describe() const;

    friend bool operator==(const Value& a, const Value& b)
    {
        return a.m_data == b.m_data;
    }

    friend bool operator!=(const Value& a, const Value& b)
    {
        return !(a == b);
    }

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 ArtifactLocator,
                 OutputReference,
                 List,
                 Map>
        m_data{};
};

/**
 * @brief Look up a key in a map value.
 * @return Pointer to the value, or nullptr if absent.
 */
inline const Value* find_key(const Value::Map& map, const std::string& key)
{
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

} // namespace genoflow
