#pragma once

#include <compare>
#include <cstddef>
#include <string>

namespace commentmap {

// A (line, column) position. Lines are 1-based, columns 0-based.
struct SourcePosition {
    size_t line{1};
    size_t column{};

    auto operator<=>(const SourcePosition& other) const = default;
};

// Location of a comment or a syntax node in the original source
struct SpanInfo {
    size_t start_line{1};
    size_t start_column{};
    size_t end_line{1};
    size_t end_column{};
    size_t start_offset{};  // Byte offsets are zero when the position source has none
    size_t end_offset{};

    auto operator==(const SpanInfo& other) const -> bool = default;

    auto start() const -> SourcePosition { return {.line = start_line, .column = start_column}; }
    auto end() const -> SourcePosition { return {.line = end_line, .column = end_column}; }
};

// Span used when no location information is available: the point (1,0)-(1,0)
auto fallback_span() -> SpanInfo;

auto make_span(SourcePosition start, SourcePosition end) -> SpanInfo;

auto is_well_formed(const SpanInfo& span) -> bool;
auto is_point(const SpanInfo& span) -> bool;

// True when position lies in [start, end) of the span
auto contains_position(const SpanInfo& span, SourcePosition position) -> bool;

// True when inner lies entirely inside outer (boundaries included)
auto contains_span(const SpanInfo& outer, const SpanInfo& inner) -> bool;

// Size measures used to pick the smallest of several candidate spans
auto line_extent(const SpanInfo& span) -> size_t;
auto column_extent(const SpanInfo& span) -> size_t;

// Orders by start position, then by end position
auto span_less(const SpanInfo& a, const SpanInfo& b) -> bool;

// "3:9-3:18"
auto format_span(const SpanInfo& span) -> std::string;

} // namespace commentmap
