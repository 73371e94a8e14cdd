/// @file query.cpp
/// @brief Implementation of path resolution and filter combinators

#include "keystone/state/query.hpp"

#include <algorithm>
#include <iterator>

namespace keystone_state {

// =============================================================================
// Traversal
// =============================================================================

namespace {

/// Step into one container by a literal segment
Value child_of(const Value& node, const PathSegment& segment) {
    switch (node.kind()) {
        case ValueKind::Mapping:
            return node.field(segment.text);
        case ValueKind::Sequence:
            if (segment.is_index()) {
                return node.item(segment.index);
            }
            if (segment.text == "length") {
                return Value(node.size());
            }
            return Value();
        default:
            return Value();
    }
}

Value resolve(const Value& node, const std::vector<PathSegment>& segments, std::size_t depth) {
    if (depth == segments.size()) {
        return node;
    }

    const auto& segment = segments[depth];
    if (!segment.is_wildcard()) {
        return resolve(child_of(node, segment), segments, depth + 1);
    }

    // Wildcards expand sequences only
    if (!node.is_sequence()) {
        return Value();
    }
    if (depth + 1 == segments.size()) {
        return node;
    }

    const Sequence& children = node.as_sequence();
    Sequence results;
    results.reserve(children.size());
    for (const auto& child : children) {
        Value result = resolve(child, segments, depth + 1);
        if (result.is_sequence()) {
            const auto& items = result.as_sequence();
            results.insert(results.end(), items.begin(), items.end());
        } else {
            results.push_back(std::move(result));
        }
    }
    return Value(std::move(results));
}

} // anonymous namespace

Value get(const Value& tree, const Path& path) {
    return resolve(tree, path.segments(), 0);
}

Value get(const Value& tree, std::string_view path) {
    return get(tree, Path::parse(path));
}

bool has(const Value& tree, std::string_view path, const Predicate& predicate) {
    Value value = get(tree, path);
    if (value.is_undefined()) return false;
    if (predicate) return predicate(value);
    return true;
}

std::vector<Value> query(const Value& tree, std::string_view path, const Filter& filter) {
    Value value = get(tree, path);
    if (value.is_undefined()) {
        return {};
    }

    std::vector<Value> items;
    if (value.is_sequence()) {
        items = value.as_sequence();
    } else {
        items.push_back(std::move(value));
    }

    if (filter.empty()) {
        return items;
    }

    std::vector<Value> matched;
    std::copy_if(items.begin(), items.end(), std::back_inserter(matched),
        [&filter](const Value& item) { return filter.matches(item); });
    return matched;
}

// =============================================================================
// Filters
// =============================================================================

bool FieldMatcher::matches(const Value& field_value) const {
    if (m_predicate) {
        return m_predicate(field_value);
    }
    return field_value == m_literal;
}

bool Filter::matches(const Value& item) const {
    if (m_predicate) {
        return m_predicate(item);
    }
    if (!item.is_mapping()) {
        return m_fields.empty();
    }
    return std::all_of(m_fields.begin(), m_fields.end(),
        [&item](const Field& field) { return field.second.matches(item.field(field.first)); });
}

// =============================================================================
// Combinators
// =============================================================================

Predicate lt(double bound) {
    return [bound](const Value& v) { return v.is_number() && v.as_number() < bound; };
}

Predicate gt(double bound) {
    return [bound](const Value& v) { return v.is_number() && v.as_number() > bound; };
}

Predicate lte(double bound) {
    return [bound](const Value& v) { return v.is_number() && v.as_number() <= bound; };
}

Predicate gte(double bound) {
    return [bound](const Value& v) { return v.is_number() && v.as_number() >= bound; };
}

Predicate eq(Value expected) {
    return [expected = std::move(expected)](const Value& v) { return v == expected; };
}

Predicate neq(Value expected) {
    return [expected = std::move(expected)](const Value& v) { return !(v == expected); };
}

Predicate one_of(std::vector<Value> options) {
    return [options = std::move(options)](const Value& v) {
        return std::find(options.begin(), options.end(), v) != options.end();
    };
}

Predicate within(Vec2 center, double radius) {
    return [center, radius](const Value& v) {
        Value x = v.field("x");
        Value y = v.field("y");
        if (!x.is_number() || !y.is_number()) return false;
        double dx = x.as_number() - center.x;
        double dy = y.as_number() - center.y;
        return dx * dx + dy * dy <= radius * radius;
    };
}

Predicate all_of(std::vector<Predicate> predicates) {
    return [predicates = std::move(predicates)](const Value& v) {
        return std::all_of(predicates.begin(), predicates.end(),
            [&v](const Predicate& p) { return p(v); });
    };
}

Predicate any_of(std::vector<Predicate> predicates) {
    return [predicates = std::move(predicates)](const Value& v) {
        return std::any_of(predicates.begin(), predicates.end(),
            [&v](const Predicate& p) { return p(v); });
    };
}

Predicate not_(Predicate predicate) {
    return [predicate = std::move(predicate)](const Value& v) { return !predicate(v); };
}

} // namespace keystone_state
