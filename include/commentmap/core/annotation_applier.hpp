#pragma once

#include "commentmap/core/comment_associator.hpp"
#include "commentmap/core/syntax_tree.hpp"

namespace commentmap {

struct ApplyStats {
    size_t attached{};    // Now held by an item or a block
    size_t dropped{};     // Matched a construct that cannot hold comments
    size_t unassociated{};  // Appended to the root list

    auto operator==(const ApplyStats& other) const -> bool = default;
};

// Moves each node's comments onto the matching item or block and appends the
// residual comments to file.comments
auto apply_associations(SourceFile& file, Associations associations) -> ApplyStats;

} // namespace commentmap
