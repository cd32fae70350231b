#include "commentmap/core/annotation_applier.hpp"
#include "commentmap/core/node_span_collector.hpp"

namespace commentmap {

namespace {

// Removes and returns the entry for identifier, or an empty list
auto take_entry(AssociationMap& by_node, const std::string& identifier) -> Comments {
    auto node = by_node.extract(identifier);
    if (node.empty()) {
        return {};
    }
    return std::move(node.mapped());
}

} // namespace

auto apply_associations(SourceFile& file, Associations associations) -> ApplyStats {
    ApplyStats stats;
    auto& by_node = associations.by_node;

    for (size_t i = 0; i < file.items.size() && !by_node.empty(); ++i) {
        auto& item = file.items[i];
        auto item_id = item_identifier(i);

        auto comments = take_entry(by_node, item_id);
        if (!comments.empty()) {
            auto count = comments.size();
            if (set_item_comments(item, std::move(comments))) {
                stats.attached += count;
            } else {
                stats.dropped += count;
            }
        }

        auto block_comments = take_entry(by_node, block_identifier(item_id));
        if (!block_comments.empty()) {
            if (auto* block = item_block(item)) {
                stats.attached += block_comments.size();
                block->comments = std::move(block_comments);
            } else {
                stats.dropped += block_comments.size();
            }
        }
    }

    // Identifiers that name no construct of this file
    for (const auto& [identifier, comments] : by_node) {
        stats.dropped += comments.size();
    }

    stats.unassociated = associations.unassociated.size();
    for (auto& comment : associations.unassociated) {
        file.comments.push_back(std::move(comment));
    }

    return stats;
}

} // namespace commentmap
