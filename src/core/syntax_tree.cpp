#include "commentmap/core/syntax_tree.hpp"
#include <utility>

namespace commentmap {

namespace {

template<size_t... Index>
auto emplace_alternative(Item& item, size_t index, std::index_sequence<Index...>) -> void {
    ((index == Index ? (item.emplace<Index>(), true) : false) || ...);
}

} // namespace

auto item_kind(const Item& item) -> ItemKind {
    return static_cast<ItemKind>(item.index());
}

auto item_kind_name(ItemKind kind) -> std::string {
    return capabilities_of(kind).name;
}

auto parse_item_kind(const std::string& name) -> std::optional<ItemKind> {
    for (const auto& caps : capability_table) {
        if (name == caps.name) {
            return caps.kind;
        }
    }
    return std::nullopt;
}

auto make_item(ItemKind kind, std::string name, std::optional<SpanInfo> span) -> Item {
    Item item;
    emplace_alternative(item, static_cast<size_t>(kind),
                        std::make_index_sequence<item_kind_count>{});

    std::visit(
        [&](auto& node) {
            using Node = std::decay_t<decltype(node)>;
            node.name = std::move(name);
            if constexpr (capabilities_of(Node::kind).has_span) {
                node.span = span;
            }
        },
        item);

    return item;
}

auto item_name(const Item& item) -> const std::string& {
    return std::visit([](const auto& node) -> const std::string& { return node.name; }, item);
}

auto item_span(const Item& item) -> std::optional<SpanInfo> {
    return std::visit(
        [](const auto& node) -> std::optional<SpanInfo> {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (capabilities_of(Node::kind).has_span) {
                return node.span;
            } else {
                return std::nullopt;
            }
        },
        item);
}

auto item_comments(const Item& item) -> const Comments* {
    return std::visit(
        [](const auto& node) -> const Comments* {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (capabilities_of(Node::kind).has_comments) {
                return &node.comments;
            } else {
                return nullptr;
            }
        },
        item);
}

auto item_block(const Item& item) -> const Block* {
    return std::visit(
        [](const auto& node) -> const Block* {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (capabilities_of(Node::kind).has_block) {
                return &node.block;
            } else {
                return nullptr;
            }
        },
        item);
}

auto item_block(Item& item) -> Block* {
    return std::visit(
        [](auto& node) -> Block* {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (capabilities_of(Node::kind).has_block) {
                return &node.block;
            } else {
                return nullptr;
            }
        },
        item);
}

auto set_item_comments(Item& item, Comments comments) -> bool {
    return std::visit(
        [&comments](auto& node) -> bool {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (capabilities_of(Node::kind).has_comments) {
                node.comments = std::move(comments);
                return true;
            } else {
                return false;
            }
        },
        item);
}

auto count_comments(const SourceFile& file) -> size_t {
    size_t total = file.comments.size();

    for (const auto& item : file.items) {
        if (const auto* comments = item_comments(item)) {
            total += comments->size();
        }
        if (const auto* block = item_block(item)) {
            total += block->comments.size();
        }
    }

    return total;
}

} // namespace commentmap
