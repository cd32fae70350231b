#include "commentmap/core/span_info.hpp"
#include <sstream>

namespace commentmap {

auto fallback_span() -> SpanInfo {
    return SpanInfo{.start_line = 1,
                    .start_column = 0,
                    .end_line = 1,
                    .end_column = 0,
                    .start_offset = 0,
                    .end_offset = 0};
}

auto make_span(SourcePosition start, SourcePosition end) -> SpanInfo {
    return SpanInfo{.start_line = start.line,
                    .start_column = start.column,
                    .end_line = end.line,
                    .end_column = end.column,
                    .start_offset = 0,
                    .end_offset = 0};
}

auto is_well_formed(const SpanInfo& span) -> bool {
    return span.start_line >= 1 && span.end_line >= 1 && span.end() >= span.start();
}

auto is_point(const SpanInfo& span) -> bool {
    return span.start() == span.end();
}

auto contains_position(const SpanInfo& span, SourcePosition position) -> bool {
    return position >= span.start() && position < span.end();
}

auto contains_span(const SpanInfo& outer, const SpanInfo& inner) -> bool {
    return inner.start() >= outer.start() && inner.end() <= outer.end();
}

auto line_extent(const SpanInfo& span) -> size_t {
    return span.end_line >= span.start_line ? span.end_line - span.start_line : 0;
}

auto column_extent(const SpanInfo& span) -> size_t {
    return span.end_column >= span.start_column ? span.end_column - span.start_column : 0;
}

auto span_less(const SpanInfo& a, const SpanInfo& b) -> bool {
    if (a.start() != b.start()) {
        return a.start() < b.start();
    }
    return a.end() < b.end();
}

auto format_span(const SpanInfo& span) -> std::string {
    std::ostringstream oss;
    oss << span.start_line << ":" << span.start_column << "-" << span.end_line << ":"
        << span.end_column;
    return oss.str();
}

} // namespace commentmap
