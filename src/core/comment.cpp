#include "commentmap/core/comment.hpp"

namespace commentmap {

auto comment_kind_name(CommentKind kind) -> std::string {
    switch (kind) {
    case CommentKind::LINE:
        return "line";
    case CommentKind::BLOCK:
        return "block";
    }
    return "line";
}

auto parse_comment_kind(const std::string& name) -> std::optional<CommentKind> {
    if (name == "line") return CommentKind::LINE;
    if (name == "block") return CommentKind::BLOCK;
    return std::nullopt;
}

auto render_comment(const Comment& comment) -> std::string {
    if (comment.kind == CommentKind::BLOCK) {
        return "/* " + comment.text + " */";
    }
    return "// " + comment.text;
}

} // namespace commentmap
