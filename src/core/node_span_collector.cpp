#include "commentmap/core/node_span_collector.hpp"

namespace commentmap {

auto item_identifier(size_t index) -> std::string {
    return "item_" + std::to_string(index);
}

auto block_identifier(std::string_view item_id) -> std::string {
    return std::string(item_id) + std::string(block_suffix);
}

auto is_block_identifier(std::string_view identifier) -> bool {
    return identifier.ends_with(block_suffix);
}

auto collect_node_spans(const SourceFile& file) -> NodeSpans {
    NodeSpans spans;

    for (size_t i = 0; i < file.items.size(); ++i) {
        const auto& item = file.items[i];
        auto item_id = item_identifier(i);

        if (auto span = item_span(item)) {
            spans.push_back(NodeSpan{.identifier = item_id, .span = *span});
        }

        const auto* block = item_block(item);
        if (block != nullptr && block->span) {
            spans.push_back(NodeSpan{.identifier = block_identifier(item_id), .span = *block->span});
        }
    }

    return spans;
}

} // namespace commentmap
