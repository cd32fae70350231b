#pragma once

#include "commentmap/core/comment.hpp"
#include <string_view>

namespace commentmap {

// Lexical comment scan, one physical line at a time. Output is ordered by
// (line, column). Block comments must open and close on the same line; an
// unterminated one ends scanning of that line.
auto extract_comments(std::string_view source) -> Comments;

// Single-line quote tracker: true when position falls inside a "..." or '...'
// literal that opened earlier on the same line. Backslash escapes are honoured.
auto is_inside_string_literal(std::string_view line, size_t position) -> bool;

} // namespace commentmap
