#pragma once

#include "commentmap/core/span_info.hpp"
#include <optional>
#include <string>
#include <vector>

namespace commentmap {

enum class CommentKind {
    LINE,   // // text
    BLOCK   // /* text */
};

struct Comment {
    std::string text;  // Delimiters stripped, trimmed
    SpanInfo span;
    CommentKind kind{CommentKind::LINE};

    auto operator==(const Comment& other) const -> bool = default;
};

using Comments = std::vector<Comment>;

auto comment_kind_name(CommentKind kind) -> std::string;
auto parse_comment_kind(const std::string& name) -> std::optional<CommentKind>;

// Comment re-rendered with its delimiters: "// text" or "/* text */"
auto render_comment(const Comment& comment) -> std::string;

} // namespace commentmap
