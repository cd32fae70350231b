#include "commentmap/core/comment_associator.hpp"
#include <numeric>

namespace commentmap {

namespace {

// Inside the braces: strictly between the boundary lines, or on a boundary line on
// the inner side of the brace. A single-line block needs both column conditions.
auto is_strictly_inside_block(const Comment& comment, const SpanInfo& block) -> bool {
    auto line = comment.span.start_line;
    auto column = comment.span.start_column;

    if (block.start_line == block.end_line) {
        return line == block.start_line && column > block.start_column
               && column < block.end_column;
    }
    if (line > block.start_line && line < block.end_line) {
        return true;
    }
    if (line == block.start_line && column > block.start_column) {
        return true;
    }
    if (line == block.end_line && column < block.end_column) {
        return true;
    }
    return false;
}

auto find_span(std::span<const NodeSpan> node_spans, std::string_view identifier)
    -> const NodeSpan* {
    for (const auto& node : node_spans) {
        if (node.identifier == identifier) {
            return &node;
        }
    }
    return nullptr;
}

// Trailing comment of a declaration: on the declaration's line at or past its end, or
// on a line between the declaration and the opening brace of its own block
auto is_declaration_comment(const Comment& comment, const NodeSpan& declaration,
                            std::span<const NodeSpan> node_spans) -> bool {
    auto line = comment.span.start_line;
    const auto& span = declaration.span;

    if (line == span.start_line) {
        return comment.span.start() >= span.end();
    }

    const auto* block = find_span(node_spans, block_identifier(declaration.identifier));
    if (block != nullptr) {
        return line > span.start_line && line < block->span.start_line;
    }

    return false;
}

auto find_conservative_owner(const Comment& comment, std::span<const NodeSpan> node_spans)
    -> const NodeSpan* {
    for (const auto& node : node_spans) {
        if (is_block_identifier(node.identifier) && is_strictly_inside_block(comment, node.span)) {
            return &node;
        }
    }

    for (const auto& node : node_spans) {
        if (!is_block_identifier(node.identifier)
            && is_declaration_comment(comment, node, node_spans)) {
            return &node;
        }
    }

    return nullptr;
}

auto is_smaller(const SpanInfo& a, const SpanInfo& b) -> bool {
    if (line_extent(a) != line_extent(b)) {
        return line_extent(a) < line_extent(b);
    }
    return column_extent(a) < column_extent(b);
}

// Keeps the first of equally sized candidates, so ties go to collection order
auto pick_smaller(const NodeSpan* current, const NodeSpan& candidate) -> const NodeSpan* {
    if (current == nullptr || is_smaller(candidate.span, current->span)) {
        return &candidate;
    }
    return current;
}

auto find_nearest_owner(const Comment& comment, std::span<const NodeSpan> node_spans)
    -> const NodeSpan* {
    auto line = comment.span.start_line;
    const NodeSpan* best = nullptr;

    for (const auto& node : node_spans) {
        bool on_boundary_line = line == node.span.start_line || line == node.span.end_line;
        if (on_boundary_line && contains_position(node.span, comment.span.start())) {
            best = pick_smaller(best, node);
        }
    }
    if (best != nullptr) {
        return best;
    }

    for (const auto& node : node_spans) {
        if (node.span.start_line == comment.span.end_line + 1) {
            return &node;
        }
    }

    for (const auto& node : node_spans) {
        if (contains_span(node.span, comment.span)) {
            best = pick_smaller(best, node);
        }
    }

    return best;
}

} // namespace

auto policy_name(AssociationPolicy policy) -> std::string {
    switch (policy) {
    case AssociationPolicy::CONSERVATIVE:
        return "conservative";
    case AssociationPolicy::NEAREST:
        return "nearest";
    }
    return "conservative";
}

auto parse_policy(const std::string& name) -> std::optional<AssociationPolicy> {
    if (name == "conservative") return AssociationPolicy::CONSERVATIVE;
    if (name == "nearest") return AssociationPolicy::NEAREST;
    return std::nullopt;
}

auto Associations::associated_count() const -> size_t {
    return std::accumulate(by_node.begin(), by_node.end(), size_t{0},
                           [](size_t total, const auto& entry) {
                               return total + entry.second.size();
                           });
}

auto find_owner(const Comment& comment, std::span<const NodeSpan> node_spans,
                AssociationPolicy policy) -> std::optional<std::string> {
    const NodeSpan* owner = nullptr;

    switch (policy) {
    case AssociationPolicy::CONSERVATIVE:
        owner = find_conservative_owner(comment, node_spans);
        break;
    case AssociationPolicy::NEAREST:
        owner = find_nearest_owner(comment, node_spans);
        break;
    }

    if (owner == nullptr) {
        return std::nullopt;
    }
    return owner->identifier;
}

auto associate_comments(Comments comments, std::span<const NodeSpan> node_spans,
                        AssociationPolicy policy) -> Associations {
    Associations associations;

    for (auto& comment : comments) {
        if (auto owner = find_owner(comment, node_spans, policy)) {
            associations.by_node[*owner].push_back(std::move(comment));
        } else {
            associations.unassociated.push_back(std::move(comment));
        }
    }

    return associations;
}

} // namespace commentmap
