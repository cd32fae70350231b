#pragma once

#include "commentmap/core/comment.hpp"
#include "commentmap/core/node_span_collector.hpp"
#include <map>
#include <optional>
#include <span>
#include <string>

namespace commentmap {

// How comments are matched to constructs
enum class AssociationPolicy {
    CONSERVATIVE,  // Block containment, then trailing comments on the declaration line
    NEAREST        // Same line, then leading comment on the line above, then smallest enclosing node
};

auto policy_name(AssociationPolicy policy) -> std::string;
auto parse_policy(const std::string& name) -> std::optional<AssociationPolicy>;

// Identifier -> comments in source order
using AssociationMap = std::map<std::string, Comments>;

struct Associations {
    AssociationMap by_node;
    Comments unassociated;  // Residual, in source order

    auto associated_count() const -> size_t;
};

// Every comment ends up in exactly one place: one node's list or the residual list
auto associate_comments(Comments comments, std::span<const NodeSpan> node_spans,
                        AssociationPolicy policy = AssociationPolicy::CONSERVATIVE)
    -> Associations;

// Identifier of the node that claims the comment, if any
auto find_owner(const Comment& comment, std::span<const NodeSpan> node_spans,
                AssociationPolicy policy) -> std::optional<std::string>;

} // namespace commentmap
