/// @file diff.hpp
/// @brief Structural diff between two state trees

#pragma once

#include "fwd.hpp"
#include "value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace keystone_state {

/// @brief One changed leaf or subtree
///
/// A missing side is undefined. Sequence length changes are reported as
/// "<path>.length" ("length" at the root) with numeric values.
struct DiffEntry {
    std::string path;
    Value from;
    Value to;

    bool operator==(const DiffEntry& other) const {
        return path == other.path && from == other.from && to == other.to;
    }
};

/// @brief Ordered list of changes produced by compute_diff()
struct Diff {
    std::vector<DiffEntry> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }

    /// @brief First entry for an exact path, or nullptr
    [[nodiscard]] const DiffEntry* find(std::string_view path) const;

    [[nodiscard]] auto begin() const noexcept { return entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries.end(); }
};

/// @brief Compute the minimal set of changed paths between two trees
///
/// Shared subtrees are skipped by identity. A replaced scalar root is
/// reported under the path "root".
[[nodiscard]] Diff compute_diff(const Value& before, const Value& after);

} // namespace keystone_state
