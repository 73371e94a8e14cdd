/// @file mutation.cpp
/// @brief Implementation of copy-on-write mutation primitives

#include "keystone/state/mutation.hpp"

#include <string>

namespace keystone_state {

const char* mutation_type_name(MutationType type) {
    switch (type) {
        case MutationType::Set: return "set";
        case MutationType::Update: return "update";
        case MutationType::Push: return "push";
        case MutationType::Remove: return "remove";
        default: return "unknown";
    }
}

// =============================================================================
// Copy-on-write
// =============================================================================

namespace {

/// Most undefined items a single write past the end of a sequence may add
constexpr std::size_t k_max_sequence_gap = 1024;

std::string prefix_of(const Path& path, std::size_t depth) {
    if (depth == 0) {
        return "root";
    }
    std::string prefix;
    for (std::size_t i = 0; i < depth; ++i) {
        prefix = join_path(prefix, path[i].text);
    }
    return prefix;
}

void reject_wildcards(const Path& path) {
    if (path.has_wildcard()) {
        throw PathError("Wildcard segments are not allowed in mutation path \"" + path.str() + "\"");
    }
}

Value set_in(const Value& node, const Path& path, std::size_t depth, Value value) {
    const auto& segment = path[depth];
    const bool last = depth + 1 == path.size();

    if (node.is_mapping()) {
        Mapping copy = node.as_mapping();
        Value child = last ? std::move(value)
                           : set_in(node.field(segment.text), path, depth + 1, std::move(value));
        copy.set(segment.text, std::move(child));
        return Value(std::move(copy));
    }

    if (node.is_sequence()) {
        if (!segment.is_index()) {
            throw PathError("Cannot set \"" + path.str() + "\": segment \"" + segment.text +
                            "\" is not an index into the sequence at \"" + prefix_of(path, depth) + "\"");
        }
        if (segment.index > node.size() + k_max_sequence_gap) {
            throw PathError("Cannot set \"" + path.str() + "\": index " + segment.text +
                            " is too far past the end of the sequence at \"" + prefix_of(path, depth) +
                            "\" (size " + std::to_string(node.size()) + ")");
        }
        Sequence copy = node.as_sequence();
        if (segment.index >= copy.size()) {
            copy.resize(segment.index + 1);
        }
        copy[segment.index] = last ? std::move(value)
                                   : set_in(copy[segment.index], path, depth + 1, std::move(value));
        return Value(std::move(copy));
    }

    throw PathError("Cannot set \"" + path.str() + "\": " + value_kind_name(node.kind()) +
                    " at \"" + prefix_of(path, depth) + "\" is not a container");
}

Value expect_sequence(const Value& state, const Path& path) {
    Value current = get(state, path);
    if (!current.is_sequence()) {
        throw PathError("Expected sequence at path \"" + path.str() + "\", got " +
                        value_kind_name(current.kind()));
    }
    return current;
}

} // anonymous namespace

Value set_at_path(const Value& root, const Path& path, Value value) {
    reject_wildcards(path);
    return set_in(root, path, 0, std::move(value));
}

// =============================================================================
// Mutation
// =============================================================================

Mutation::Mutation(MutationType type, std::string path, std::string description, ApplyFn apply)
    : m_type(type)
    , m_path(std::move(path))
    , m_description(std::move(description))
    , m_apply(std::move(apply)) {}

// =============================================================================
// Builders
// =============================================================================

Mutation set(std::string_view path, Value value) {
    Path parsed = Path::parse(path);
    std::string description = "Set " + parsed.str() + " to " + value.to_string();

    return Mutation(MutationType::Set, parsed.str(), std::move(description),
        [parsed, value = std::move(value)](const Value& state) {
            return set_at_path(state, parsed, value);
        });
}

Mutation update(std::string_view path, UpdateFn fn) {
    Path parsed = Path::parse(path);
    std::string description = "Update " + parsed.str();

    return Mutation(MutationType::Update, parsed.str(), std::move(description),
        [parsed, fn = std::move(fn)](const Value& state) {
            reject_wildcards(parsed);
            return set_at_path(state, parsed, fn(get(state, parsed)));
        });
}

Mutation push(std::string_view path, Value item) {
    Path parsed = Path::parse(path);
    std::string description = "Push item onto " + parsed.str();

    return Mutation(MutationType::Push, parsed.str(), std::move(description),
        [parsed, item = std::move(item)](const Value& state) {
            reject_wildcards(parsed);
            Sequence items = expect_sequence(state, parsed).as_sequence();
            items.push_back(item);
            return set_at_path(state, parsed, Value(std::move(items)));
        });
}

Mutation remove_where(std::string_view path, Predicate predicate) {
    Path parsed = Path::parse(path);
    std::string description = "Remove matching items from " + parsed.str();

    return Mutation(MutationType::Remove, parsed.str(), std::move(description),
        [parsed, predicate = std::move(predicate)](const Value& state) {
            reject_wildcards(parsed);
            Value current = expect_sequence(state, parsed);

            Sequence kept;
            kept.reserve(current.size());
            for (const auto& item : current.as_sequence()) {
                if (!predicate(item)) {
                    kept.push_back(item);
                }
            }
            if (kept.size() == current.size()) {
                return state;
            }
            return set_at_path(state, parsed, Value(std::move(kept)));
        });
}

Mutation remove_key(std::string_view path) {
    Path parsed = Path::parse(path);
    Path parent = parsed.parent();
    std::string description = "Remove key \"" + parsed.back().text + "\" from " +
                              (parent.empty() ? std::string("root") : parent.str());

    return Mutation(MutationType::Remove, parsed.str(), std::move(description),
        [parsed, parent](const Value& state) {
            reject_wildcards(parsed);
            Value container = parent.empty() ? state : get(state, parent);
            if (!container.is_mapping()) {
                throw PathError("Cannot remove key \"" + parsed.back().text + "\": parent of \"" +
                                parsed.str() + "\" is " + value_kind_name(container.kind()) +
                                ", expected mapping");
            }

            const auto& key = parsed.back().text;
            if (!container.as_mapping().contains(key)) {
                return state;
            }

            Mapping copy = container.as_mapping();
            copy.erase(key);
            if (parent.empty()) {
                return Value(std::move(copy));
            }
            return set_at_path(state, parent, Value(std::move(copy)));
        });
}

} // namespace keystone_state
