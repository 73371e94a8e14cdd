/// @file path.cpp
/// @brief Implementation of path parsing and pattern matching

#include "keystone/state/path.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace keystone_state {

std::optional<std::size_t> parse_index(std::string_view segment) {
    if (segment.empty()) return std::nullopt;
    if (segment.size() > 1 && segment.front() == '0') return std::nullopt;
    if (!std::all_of(segment.begin(), segment.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return value;
}

std::string join_path(std::string_view parent, std::string_view child) {
    if (parent.empty()) {
        return std::string(child);
    }
    std::string result;
    result.reserve(parent.size() + 1 + child.size());
    result.append(parent);
    result.push_back('.');
    result.append(child);
    return result;
}

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

// =============================================================================
// Path
// =============================================================================

Path Path::parse(std::string_view text) {
    Path path;
    path.m_text = std::string(text);

    for (auto part : split_path(text)) {
        PathSegment segment;
        segment.text = std::string(part);
        if (part == "*") {
            segment.kind = PathSegment::Kind::Wildcard;
        } else if (auto index = parse_index(part)) {
            segment.kind = PathSegment::Kind::Index;
            segment.index = *index;
        }
        path.m_segments.push_back(std::move(segment));
    }

    return path;
}

bool Path::has_wildcard() const noexcept {
    return std::any_of(m_segments.begin(), m_segments.end(),
        [](const PathSegment& s) { return s.is_wildcard(); });
}

Path Path::parent() const {
    Path result;
    if (m_segments.size() <= 1) {
        return result;
    }
    result.m_segments.assign(m_segments.begin(), m_segments.end() - 1);
    for (std::size_t i = 0; i < result.m_segments.size(); ++i) {
        if (i > 0) result.m_text.push_back('.');
        result.m_text += result.m_segments[i].text;
    }
    return result;
}

// =============================================================================
// PathPattern
// =============================================================================

PathPattern::PathPattern(std::string_view pattern)
    : m_path(Path::parse(pattern)) {}

bool PathPattern::matches(std::string_view concrete_path) const {
    if (is_exact()) {
        return concrete_path == m_path.str();
    }
    return matches(split_path(concrete_path));
}

bool PathPattern::matches(const std::vector<std::string_view>& concrete_segments) const {
    const auto& segments = m_path.segments();
    if (segments.size() != concrete_segments.size()) {
        return false;
    }

    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].is_wildcard()) continue;
        if (segments[i].text != concrete_segments[i]) return false;
    }

    return true;
}

} // namespace keystone_state
