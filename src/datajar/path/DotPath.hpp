#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace DJ {

/**
 * Forward iterator over the '.'-separated segments of a dotted path such as
 * "config.theme" or "users.0.name".
 *
 * Every '.' ends a segment, so "a..b" yields an empty middle segment; callers
 * reject such paths through validateDotPath. An empty path has no segments.
 */
class DotPathIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    static constexpr char Separator = '.';

    explicit DotPathIterator(char const* const path) noexcept;
    explicit DotPathIterator(std::string_view path) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> value_type;
    [[nodiscard]] auto operator->() const noexcept -> pointer;
    auto               operator++() noexcept -> DotPathIterator&;
    auto               operator++(int) noexcept -> DotPathIterator;
    [[nodiscard]] auto operator==(const DotPathIterator& other) const noexcept -> bool;

    [[nodiscard]] auto isAtStart() const noexcept -> bool;
    [[nodiscard]] auto isAtFinalComponent() const noexcept -> bool;
    [[nodiscard]] auto isAtEnd() const noexcept -> bool;
    [[nodiscard]] auto toStringView() const noexcept -> std::string_view;
    [[nodiscard]] auto currentComponent() const noexcept -> std::string_view;
    [[nodiscard]] auto next() const noexcept -> DotPathIterator;

private:
    auto findSegmentEnd() noexcept -> void;

    std::string_view path;            // The complete path we're iterating over
    std::string_view current_segment; // View of the current path component
    std::size_t      current     = 0; // Offset of the current component
    std::size_t      segment_end = 0; // Offset one past the current component
    bool             at_end      = false;
};

// Segment characters allowed in a dotted path: [A-Za-z0-9_].
[[nodiscard]] constexpr auto isPathSegmentChar(char c) noexcept -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

[[nodiscard]] auto validateDotPath(std::string_view path) -> std::optional<Error>;

// A segment read as a zero-based position. Only a full run of decimal digits qualifies.
[[nodiscard]] auto parseIndex(std::string_view segment) noexcept -> std::optional<std::size_t>;

} // namespace DJ
