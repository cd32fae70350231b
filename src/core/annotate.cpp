#include "commentmap/core/annotate.hpp"
#include "commentmap/core/comment_extractor.hpp"
#include "commentmap/core/node_span_collector.hpp"

namespace commentmap {

auto annotate_with_comments(SourceFile& file, std::string_view source,
                            const AnnotateOptions& options) -> ApplyStats {
    auto comments = extract_comments(source);
    auto node_spans = collect_node_spans(file);
    auto associations = associate_comments(std::move(comments), node_spans, options.policy);
    return apply_associations(file, std::move(associations));
}

} // namespace commentmap
