/// @file path.hpp
/// @brief Dot-separated paths and wildcard path patterns for keystone_state

#pragma once

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace keystone_state {

/// @brief Thrown when a path cannot be applied to the shape of a tree
class PathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// PathSegment
// =============================================================================

/// @brief One token of a parsed path
struct PathSegment {
    enum class Kind : std::uint8_t {
        Key,        ///< Mapping key (non-numeric text)
        Index,      ///< Canonical non-negative integer; a key when applied to a mapping
        Wildcard    ///< "*", matches any single key or index
    };

    Kind kind{Kind::Key};
    std::string text;
    std::size_t index{0};

    [[nodiscard]] bool is_wildcard() const noexcept { return kind == Kind::Wildcard; }
    [[nodiscard]] bool is_index() const noexcept { return kind == Kind::Index; }
};

/// @brief Parse a canonical sequence index ("0", "12"; not "", "-1" or "07")
[[nodiscard]] std::optional<std::size_t> parse_index(std::string_view segment);

/// @brief Join a parent path and a child segment ("" parent yields the child)
[[nodiscard]] std::string join_path(std::string_view parent, std::string_view child);

/// @brief Split on '.' without interpreting the segments
[[nodiscard]] std::vector<std::string_view> split_path(std::string_view path);

// =============================================================================
// Path
// =============================================================================

/// @brief A parsed dot-separated path
///
/// Splitting is purely textual: "a..b" has an empty middle segment and the
/// empty string is a single empty key.
class Path {
public:
    Path() = default;

    [[nodiscard]] static Path parse(std::string_view text);

    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return m_segments; }
    [[nodiscard]] std::size_t size() const noexcept { return m_segments.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_segments.empty(); }
    [[nodiscard]] const PathSegment& operator[](std::size_t i) const { return m_segments[i]; }
    [[nodiscard]] const PathSegment& back() const { return m_segments.back(); }

    [[nodiscard]] bool has_wildcard() const noexcept;

    /// @brief All but the last segment
    [[nodiscard]] Path parent() const;

    [[nodiscard]] const std::string& str() const noexcept { return m_text; }

private:
    std::string m_text;
    std::vector<PathSegment> m_segments;
};

// =============================================================================
// PathPattern
// =============================================================================

/// @brief Observer pattern: an exact path or one with "*" segments
///
/// Matching is positional over segments: a concrete path matches when it has
/// the same number of segments and every non-wildcard segment is equal.
class PathPattern {
public:
    PathPattern() = default;
    explicit PathPattern(std::string_view pattern);

    [[nodiscard]] bool matches(std::string_view concrete_path) const;
    [[nodiscard]] bool matches(const std::vector<std::string_view>& concrete_segments) const;

    [[nodiscard]] bool is_exact() const noexcept { return !m_path.has_wildcard(); }
    [[nodiscard]] const std::string& str() const noexcept { return m_path.str(); }

private:
    Path m_path;
};

} // namespace keystone_state
