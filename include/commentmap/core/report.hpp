#pragma once

#include "commentmap/core/syntax_tree.hpp"
#include <string>
#include <vector>

namespace commentmap {

// Render an annotated tree as report lines:
//   item_0 fn main
//       // trailing note @1:10
//   item_0_block
//       // inside @2:4
//   root
//       // file header @1:0
// Block and root sections appear only when they hold comments.
auto render_report(const SourceFile& file) -> std::vector<std::string>;

// "// text @line:column"
auto describe_comment(const Comment& comment) -> std::string;

} // namespace commentmap
