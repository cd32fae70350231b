#pragma once

#include "commentmap/core/syntax_tree.hpp"
#include <optional>
#include <string>

namespace commentmap {

// Line-oriented text form of an annotated tree:
//   item|<index>|<kind>|<name>|<span or ->
//   block|<index>|<span or ->
//   comment|<owner>|<line or block>|<span>|<text>
// Spans are written as start_line:start_column:end_line:end_column:start_offset:end_offset.
auto serialize_document(const SourceFile& file) -> std::string;

// Malformed lines are skipped; nullopt when non-empty input yields no record
auto deserialize_document(const std::string& text) -> std::optional<SourceFile>;

auto save_document(const SourceFile& file, const std::string& file_path) -> bool;
auto load_document(const std::string& file_path) -> std::optional<SourceFile>;

} // namespace commentmap
