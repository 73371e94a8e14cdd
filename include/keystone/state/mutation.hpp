/// @file mutation.hpp
/// @brief Mutation primitives for keystone_state

#pragma once

#include "fwd.hpp"
#include "path.hpp"
#include "query.hpp"
#include "value.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace keystone_state {

// =============================================================================
// MutationType
// =============================================================================

/// @brief Kind of mutation (remove_where and remove_key both report Remove)
enum class MutationType : std::uint8_t {
    Set,
    Update,
    Push,
    Remove
};

/// @brief Get mutation type name ("set", "update", "push", "remove")
[[nodiscard]] const char* mutation_type_name(MutationType type);

/// @brief Transform used by update(); receives undefined for missing paths
using UpdateFn = std::function<Value(const Value&)>;

// =============================================================================
// Mutation
// =============================================================================

/// @brief A named, path-addressed, pure state transformation
///
/// Only the builder functions below can create mutations. apply() never
/// modifies its argument: it returns a new root sharing every subtree that
/// is not on the path to the touched node, or throws PathError / ValueError
/// (or whatever an update function throws).
class Mutation {
public:
    using ApplyFn = std::function<Value(const Value&)>;

    [[nodiscard]] MutationType type() const noexcept { return m_type; }
    [[nodiscard]] const std::string& path() const noexcept { return m_path; }
    [[nodiscard]] const std::string& description() const noexcept { return m_description; }

    [[nodiscard]] Value apply(const Value& state) const { return m_apply(state); }

private:
    Mutation(MutationType type, std::string path, std::string description, ApplyFn apply);

    friend Mutation set(std::string_view path, Value value);
    friend Mutation update(std::string_view path, UpdateFn fn);
    friend Mutation push(std::string_view path, Value item);
    friend Mutation remove_where(std::string_view path, Predicate predicate);
    friend Mutation remove_key(std::string_view path);

    MutationType m_type;
    std::string m_path;
    std::string m_description;
    ApplyFn m_apply;
};

// =============================================================================
// Builders
// =============================================================================

/// @brief Replace the value at path; intermediate segments must be containers
[[nodiscard]] Mutation set(std::string_view path, Value value);

/// @brief Write fn(current) back to path
[[nodiscard]] Mutation update(std::string_view path, UpdateFn fn);

/// @brief Append to the sequence at path
[[nodiscard]] Mutation push(std::string_view path, Value item);

/// @brief Drop every item of the sequence at path for which predicate holds
[[nodiscard]] Mutation remove_where(std::string_view path, Predicate predicate);

/// @brief Remove the last segment's key from its parent mapping (root for one segment)
[[nodiscard]] Mutation remove_key(std::string_view path);

// =============================================================================
// Copy-on-write helpers
// =============================================================================

/// @brief Return a tree equal to root except that path holds value
///
/// Copies only the containers from root down to the parent of the target.
/// Sequences grow (padded with undefined) when the index is past the end, by
/// at most 1024 undefined items.
/// @throws PathError when a step hits a non-container, a non-index segment
///         on a sequence, or a wildcard
[[nodiscard]] Value set_at_path(const Value& root, const Path& path, Value value);

} // namespace keystone_state
