#pragma once

#include "commentmap/core/annotation_applier.hpp"
#include "commentmap/core/comment_associator.hpp"
#include "commentmap/core/syntax_tree.hpp"
#include <string_view>

namespace commentmap {

struct AnnotateOptions {
    AssociationPolicy policy = AssociationPolicy::CONSERVATIVE;
};

// Extract, collect, associate and apply, in that order, for one source unit.
// file must have been parsed from source.
auto annotate_with_comments(SourceFile& file, std::string_view source,
                            const AnnotateOptions& options = {}) -> ApplyStats;

} // namespace commentmap
