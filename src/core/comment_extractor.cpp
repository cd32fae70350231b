#include "commentmap/core/comment_extractor.hpp"
#include "commentmap/string_utils.hpp"
#include <optional>

namespace commentmap {

namespace {

constexpr std::string_view line_marker = "//";
constexpr std::string_view block_open = "/*";
constexpr std::string_view block_close = "*/";

auto make_line_span(const SourceLine& line, size_t start_column, size_t end_column) -> SpanInfo {
    return SpanInfo{.start_line = line.number,
                    .start_column = start_column,
                    .end_line = line.number,
                    .end_column = end_column,
                    .start_offset = line.offset + start_column,
                    .end_offset = line.offset + end_column};
}

auto scan_line(const SourceLine& line, Comments& comments) -> void {
    const auto text = line.text;
    bool line_comment_allowed = true;
    size_t position = 0;

    while (position < text.size()) {
        auto line_start = line_comment_allowed ? text.find(line_marker, position)
                                               : std::string_view::npos;
        auto block_start = text.find(block_open, position);

        if (line_start == std::string_view::npos && block_start == std::string_view::npos) {
            break;
        }

        if (line_start < block_start) {
            if (is_inside_string_literal(text, line_start)) {
                // Only the first marker is considered; the rest of the line may
                // still hold block comments
                line_comment_allowed = false;
                position = line_start + 1;
                continue;
            }

            auto body = text.substr(line_start + line_marker.size());
            comments.push_back(Comment{.text = StringUtils::trim(body),
                                       .span = make_line_span(line, line_start, text.size()),
                                       .kind = CommentKind::LINE});
            break;
        }

        if (is_inside_string_literal(text, block_start)) {
            position = block_start + 1;
            continue;
        }

        auto block_end = text.find(block_close, block_start + block_open.size());
        if (block_end == std::string_view::npos) {
            break; // Continues on a later line: not supported
        }

        auto body_start = block_start + block_open.size();
        auto body = text.substr(body_start, block_end - body_start);
        auto end_column = block_end + block_close.size();
        comments.push_back(Comment{.text = StringUtils::trim(body),
                                   .span = make_line_span(line, block_start, end_column),
                                   .kind = CommentKind::BLOCK});
        position = end_column;
    }
}

} // namespace

auto extract_comments(std::string_view source) -> Comments {
    Comments comments;

    for (const auto& line : StringUtils::split_lines(source)) {
        scan_line(line, comments);
    }

    return comments;
}

auto is_inside_string_literal(std::string_view line, size_t position) -> bool {
    std::optional<char> open_quote;
    bool escaped = false;

    for (size_t i = 0; i < line.size() && i < position; ++i) {
        char c = line[i];

        if ((c == '"' || c == '\'') && !escaped) {
            if (!open_quote) {
                open_quote = c;
            } else if (c == *open_quote) {
                open_quote.reset();
            }
        } else if (c == '\\' && open_quote) {
            escaped = !escaped;
            continue;
        }

        escaped = false;
    }

    return open_quote.has_value();
}

} // namespace commentmap
