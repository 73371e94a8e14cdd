/// @file value.hpp
/// @brief Immutable, structurally shared state-tree values for keystone_state

#pragma once

#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace keystone_state {

// =============================================================================
// ValueKind
// =============================================================================

/// @brief Kind of a state-tree value (order matches Value's storage variant)
enum class ValueKind : std::uint8_t {
    Undefined,      ///< Absent value (missing key, out-of-range index)
    Null,
    Bool,
    Number,
    String,
    Sequence,
    Mapping
};

/// @brief Get value kind name
[[nodiscard]] const char* value_kind_name(ValueKind kind);

/// @brief Marker for the absent value
struct Undefined {
    bool operator==(const Undefined&) const = default;
};

inline constexpr Undefined undefined{};

/// @brief Thrown by typed accessors used on the wrong kind
class ValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Value
// =============================================================================

/// @brief A node of the game-state tree
///
/// Primitives are stored inline. Sequences and mappings are held through
/// shared pointers to const containers, so copying a Value never copies a
/// subtree and no subtree reachable from a Value can be modified. New trees
/// are built by copying the ancestor chain of the node being replaced.
class Value {
public:
    using SequencePtr = std::shared_ptr<const Sequence>;
    using MappingPtr = std::shared_ptr<const Mapping>;

    Value() = default;
    Value(Undefined) {}
    Value(std::nullptr_t) : m_data(std::in_place_type<std::nullptr_t>, nullptr) {}
    Value(bool b) : m_data(std::in_place_type<bool>, b) {}

    template<typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T number) : m_data(std::in_place_type<double>, static_cast<double>(number)) {}

    Value(const char* s) : m_data(std::in_place_type<std::string>, s) {}
    Value(std::string s) : m_data(std::in_place_type<std::string>, std::move(s)) {}
    Value(std::string_view s) : m_data(std::in_place_type<std::string>, s) {}

    Value(Sequence sequence);
    Value(Mapping mapping);
    Value(SequencePtr sequence);
    Value(MappingPtr mapping);

    /// @brief Build a sequence value
    [[nodiscard]] static Value array(std::initializer_list<Value> items);

    /// @brief Build a mapping value (later duplicates replace earlier ones)
    [[nodiscard]] static Value object(std::initializer_list<std::pair<std::string, Value>> entries);

    // JSON conversion
    [[nodiscard]] static Value from_json(const nlohmann::json& j);
    [[nodiscard]] static Value from_json(const nlohmann::ordered_json& j);
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    /// @brief "undefined" for undefined values, compact JSON otherwise
    [[nodiscard]] std::string to_string() const;

    // Kind queries
    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(m_data.index()); }
    [[nodiscard]] bool is_undefined() const noexcept { return kind() == ValueKind::Undefined; }
    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == ValueKind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool is_sequence() const noexcept { return kind() == ValueKind::Sequence; }
    [[nodiscard]] bool is_mapping() const noexcept { return kind() == ValueKind::Mapping; }
    [[nodiscard]] bool is_container() const noexcept { return is_sequence() || is_mapping(); }

    // Typed access (throws ValueError on kind mismatch)
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] std::int64_t as_int() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Sequence& as_sequence() const;
    [[nodiscard]] const Mapping& as_mapping() const;

    [[nodiscard]] const SequencePtr& sequence_ptr() const;
    [[nodiscard]] const MappingPtr& mapping_ptr() const;

    /// @brief Child of a mapping by key (undefined if absent or not a mapping)
    [[nodiscard]] Value field(std::string_view key) const;

    /// @brief Child of a sequence by index (undefined if absent or not a sequence)
    [[nodiscard]] Value item(std::size_t index) const;

    /// @brief Element count for containers, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept;

    /// @brief Identity comparison: containers by pointer, primitives by value
    [[nodiscard]] bool same(const Value& other) const noexcept;

    /// @brief Deep structural equality (mapping key order is ignored)
    bool operator==(const Value& other) const;

private:
    [[noreturn]] void kind_mismatch(ValueKind expected) const;

    std::variant<Undefined, std::nullptr_t, bool, double, std::string, SequencePtr, MappingPtr> m_data;
};

// =============================================================================
// Mapping
// =============================================================================

/// @brief String-keyed container preserving insertion order
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Mapping() = default;
    Mapping(std::initializer_list<Entry> entries);

    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries.end(); }

    /// @brief Insert or replace; a replaced key keeps its position
    void set(std::string key, Value value);

    /// @brief Remove a key entirely
    bool erase(std::string_view key);

    bool operator==(const Mapping& other) const;

private:
    std::vector<Entry> m_entries;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief Parse JSON text into a value tree (object key order is preserved)
/// @throws nlohmann::json::parse_error on malformed input
[[nodiscard]] Value parse_value(std::string_view json_text);

} // namespace keystone_state
