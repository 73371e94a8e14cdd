/// @file query.hpp
/// @brief Path resolution, queries and filter combinators for keystone_state

#pragma once

#include "fwd.hpp"
#include "path.hpp"
#include "value.hpp"

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace keystone_state {

// =============================================================================
// Predicate
// =============================================================================

/// @brief Boolean test over a state value
///
/// Any callable taking `const Value&` and returning something convertible to
/// bool converts implicitly. A default-constructed Predicate is empty.
class Predicate {
public:
    using Function = std::function<bool(const Value&)>;

    Predicate() = default;

    template<typename F>
        requires (!std::is_same_v<std::decay_t<F>, Predicate> &&
                  std::is_invocable_r_v<bool, F&, const Value&>)
    Predicate(F&& fn) : m_fn(std::forward<F>(fn)) {}

    bool operator()(const Value& value) const { return m_fn(value); }

    explicit operator bool() const noexcept { return static_cast<bool>(m_fn); }

private:
    Function m_fn;
};

// =============================================================================
// Filters
// =============================================================================

/// @brief Per-field condition of an object filter: a literal or a predicate
class FieldMatcher {
public:
    template<typename F>
        requires std::is_invocable_r_v<bool, F&, const Value&>
    FieldMatcher(F&& fn) : m_predicate(std::forward<F>(fn)) {}

    template<typename T>
        requires (!std::is_invocable_r_v<bool, T&, const Value&> &&
                  std::is_constructible_v<Value, T>)
    FieldMatcher(T&& literal) : m_literal(std::forward<T>(literal)) {}

    /// @brief Literals compare with deep equality
    [[nodiscard]] bool matches(const Value& field_value) const;

private:
    Predicate m_predicate;
    Value m_literal;
};

/// @brief Query filter: a whole-item predicate or field conditions (all must hold)
///
/// @code
/// query(state, "party", {{"hp", lt(10)}, {"alive", true}});
/// query(state, "party", [](const Value& member) { return member.size() > 2; });
/// @endcode
class Filter {
public:
    using Field = std::pair<std::string, FieldMatcher>;

    /// @brief Matches everything
    Filter() = default;

    template<typename F>
        requires (!std::is_same_v<std::decay_t<F>, Filter> &&
                  std::is_invocable_r_v<bool, F&, const Value&>)
    Filter(F&& fn) : m_predicate(std::forward<F>(fn)) {}

    Filter(std::initializer_list<Field> fields) : m_fields(fields) {}

    /// @brief Field filters only match mappings
    [[nodiscard]] bool matches(const Value& item) const;

    [[nodiscard]] bool empty() const noexcept { return !m_predicate && m_fields.empty(); }

private:
    Predicate m_predicate;
    std::vector<Field> m_fields;
};

// =============================================================================
// Resolution
// =============================================================================

/// @brief Resolve a path; undefined when any step is missing, never throws
///
/// "length" on a sequence yields its size. A "*" segment maps the rest of the
/// path over every element of the sequence at that position and returns a
/// sequence; results that are sequences are flattened one level. A "*" that
/// meets a mapping or a primitive yields undefined.
[[nodiscard]] Value get(const Value& tree, std::string_view path);
[[nodiscard]] Value get(const Value& tree, const Path& path);

/// @brief True when the path resolves and the optional predicate holds
[[nodiscard]] bool has(const Value& tree, std::string_view path, const Predicate& predicate = {});

/// @brief Filter the sequence at path (a single value is treated as one item)
[[nodiscard]] std::vector<Value> query(const Value& tree, std::string_view path, const Filter& filter = {});

// =============================================================================
// Filter Combinators
// =============================================================================

/// @brief 2-D point used by within()
struct Vec2 {
    double x{0};
    double y{0};
};

// Numeric comparisons are false for non-numbers
[[nodiscard]] Predicate lt(double bound);
[[nodiscard]] Predicate gt(double bound);
[[nodiscard]] Predicate lte(double bound);
[[nodiscard]] Predicate gte(double bound);

[[nodiscard]] Predicate eq(Value expected);
[[nodiscard]] Predicate neq(Value expected);

/// @brief Value equals one of the options, e.g. one_of({"orc", "troll"})
[[nodiscard]] Predicate one_of(std::vector<Value> options);

/// @brief Mapping with numeric x/y no farther than radius from center
[[nodiscard]] Predicate within(Vec2 center, double radius);

/// @brief True when every predicate holds (true for none)
[[nodiscard]] Predicate all_of(std::vector<Predicate> predicates);

/// @brief True when any predicate holds (false for none)
[[nodiscard]] Predicate any_of(std::vector<Predicate> predicates);

[[nodiscard]] Predicate not_(Predicate predicate);

template<typename... Ps>
    requires (std::is_constructible_v<Predicate, Ps> && ...)
[[nodiscard]] Predicate all_of(Ps&&... predicates) {
    return all_of(std::vector<Predicate>{Predicate(std::forward<Ps>(predicates))...});
}

template<typename... Ps>
    requires (std::is_constructible_v<Predicate, Ps> && ...)
[[nodiscard]] Predicate any_of(Ps&&... predicates) {
    return any_of(std::vector<Predicate>{Predicate(std::forward<Ps>(predicates))...});
}

} // namespace keystone_state
