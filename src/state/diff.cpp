/// @file diff.cpp
/// @brief Implementation of the structural diff

#include "keystone/state/diff.hpp"
#include "keystone/state/path.hpp"

#include <algorithm>

namespace keystone_state {

const DiffEntry* Diff::find(std::string_view path) const {
    auto it = std::find_if(entries.begin(), entries.end(),
        [path](const DiffEntry& entry) { return entry.path == path; });
    return it != entries.end() ? &*it : nullptr;
}

namespace {

void diff_into(const Value& before, const Value& after, const std::string& path,
               std::vector<DiffEntry>& out);

void record(std::vector<DiffEntry>& out, const std::string& path, const Value& from, const Value& to) {
    out.push_back(DiffEntry{path.empty() ? std::string("root") : path, from, to});
}

void diff_sequences(const Sequence& before, const Sequence& after, const std::string& path,
                    std::vector<DiffEntry>& out) {
    const std::size_t count = std::max(before.size(), after.size());
    for (std::size_t i = 0; i < count; ++i) {
        std::string child = join_path(path, std::to_string(i));
        if (i >= before.size()) {
            out.push_back(DiffEntry{std::move(child), Value(), after[i]});
        } else if (i >= after.size()) {
            out.push_back(DiffEntry{std::move(child), before[i], Value()});
        } else {
            diff_into(before[i], after[i], child, out);
        }
    }

    if (before.size() != after.size()) {
        out.push_back(DiffEntry{join_path(path, "length"), Value(before.size()), Value(after.size())});
    }
}

void diff_mappings(const Mapping& before, const Mapping& after, const std::string& path,
                   std::vector<DiffEntry>& out) {
    for (const auto& [key, value] : before) {
        std::string child = join_path(path, key);
        if (const Value* other = after.find(key)) {
            diff_into(value, *other, child, out);
        } else {
            out.push_back(DiffEntry{std::move(child), value, Value()});
        }
    }

    for (const auto& [key, value] : after) {
        if (!before.contains(key)) {
            out.push_back(DiffEntry{join_path(path, key), Value(), value});
        }
    }
}

void diff_into(const Value& before, const Value& after, const std::string& path,
               std::vector<DiffEntry>& out) {
    if (before.same(after)) {
        return;
    }

    if (before.is_sequence() && after.is_sequence()) {
        diff_sequences(before.as_sequence(), after.as_sequence(), path, out);
    } else if (before.is_mapping() && after.is_mapping()) {
        diff_mappings(before.as_mapping(), after.as_mapping(), path, out);
    } else {
        record(out, path, before, after);
    }
}

} // anonymous namespace

Diff compute_diff(const Value& before, const Value& after) {
    Diff diff;
    diff_into(before, after, std::string(), diff.entries);
    return diff;
}

} // namespace keystone_state
