#pragma once

#include "commentmap/core/span_info.hpp"
#include "commentmap/core/syntax_tree.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace commentmap {

// A span-bearing construct, addressed by its positional identifier
struct NodeSpan {
    std::string identifier;  // "item_3" or "item_3_block"
    SpanInfo span;

    auto operator==(const NodeSpan& other) const -> bool = default;
};

using NodeSpans = std::vector<NodeSpan>;

inline constexpr std::string_view block_suffix = "_block";

auto item_identifier(size_t index) -> std::string;
auto block_identifier(std::string_view item_id) -> std::string;
auto is_block_identifier(std::string_view identifier) -> bool;

// Document order; a declaration entry precedes its block entry. Items whose kind
// records no span, or whose parser left the span empty, are skipped.
auto collect_node_spans(const SourceFile& file) -> NodeSpans;

} // namespace commentmap
