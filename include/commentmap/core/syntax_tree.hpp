#pragma once

#include "commentmap/core/comment.hpp"
#include "commentmap/core/span_info.hpp"
#include <array>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace commentmap {

// Top-level construct kinds. Order matches the alternatives of Item.
enum class ItemKind {
    CONST,
    ENUM,
    EXTERN_CRATE,
    FN,
    FOREIGN_MOD,
    IMPL,
    MACRO,
    MOD,
    STATIC,
    STRUCT,
    TRAIT,
    TRAIT_ALIAS,
    TYPE,
    UNION,
    USE,
    VERBATIM
};

inline constexpr size_t item_kind_count = 16;

// What a construct kind can carry
struct ItemCapabilities {
    ItemKind kind;
    const char* name;
    bool has_span;      // Parser records a declaration span
    bool has_comments;  // Construct holds a comment list
    bool has_block;     // Construct owns a delimited body block
};

// The capability table. Only kinds with has_span can be matched by the associator;
// only kinds with has_comments keep what was matched.
inline constexpr std::array<ItemCapabilities, item_kind_count> capability_table{{
    {ItemKind::CONST, "const", true, true, false},
    {ItemKind::ENUM, "enum", true, true, false},
    {ItemKind::EXTERN_CRATE, "extern crate", false, false, false},
    {ItemKind::FN, "fn", true, true, true},
    {ItemKind::FOREIGN_MOD, "foreign mod", false, true, false},
    {ItemKind::IMPL, "impl", true, true, false},
    {ItemKind::MACRO, "macro", false, false, false},
    {ItemKind::MOD, "mod", false, false, false},
    {ItemKind::STATIC, "static", true, true, false},
    {ItemKind::STRUCT, "struct", false, false, false},
    {ItemKind::TRAIT, "trait", true, true, false},
    {ItemKind::TRAIT_ALIAS, "trait alias", false, false, false},
    {ItemKind::TYPE, "type", true, true, false},
    {ItemKind::UNION, "union", false, true, false},
    {ItemKind::USE, "use", true, true, false},
    {ItemKind::VERBATIM, "verbatim", false, false, false},
}};

constexpr auto capabilities_of(ItemKind kind) -> const ItemCapabilities& {
    return capability_table[static_cast<size_t>(kind)];
}

constexpr auto capability_table_is_ordered() -> bool {
    for (size_t i = 0; i < capability_table.size(); ++i) {
        if (static_cast<size_t>(capability_table[i].kind) != i) {
            return false;
        }
    }
    return true;
}

static_assert(capability_table_is_ordered(), "capability table rows must follow ItemKind order");

// Body of a construct, delimited by braces
struct Block {
    std::optional<SpanInfo> span;  // '{' through '}' inclusive
    Comments comments;

    auto operator==(const Block& other) const -> bool = default;
};

// Item shapes. A kind's shape must agree with its capability table row.
template<ItemKind Kind>
struct SpannedItem {
    static constexpr ItemKind kind = Kind;
    std::string name;
    std::optional<SpanInfo> span;
    Comments comments;

    auto operator==(const SpannedItem& other) const -> bool = default;
};

template<ItemKind Kind>
struct CommentedItem {
    static constexpr ItemKind kind = Kind;
    std::string name;
    Comments comments;

    auto operator==(const CommentedItem& other) const -> bool = default;
};

template<ItemKind Kind>
struct PlainItem {
    static constexpr ItemKind kind = Kind;
    std::string name;

    auto operator==(const PlainItem& other) const -> bool = default;
};

struct ItemFn {
    static constexpr ItemKind kind = ItemKind::FN;
    std::string name;
    std::optional<SpanInfo> span;
    Block block;
    Comments comments;

    auto operator==(const ItemFn& other) const -> bool = default;
};

using ItemConst = SpannedItem<ItemKind::CONST>;
using ItemEnum = SpannedItem<ItemKind::ENUM>;
using ItemExternCrate = PlainItem<ItemKind::EXTERN_CRATE>;
using ItemForeignMod = CommentedItem<ItemKind::FOREIGN_MOD>;
using ItemImpl = SpannedItem<ItemKind::IMPL>;
using ItemMacro = PlainItem<ItemKind::MACRO>;
using ItemMod = PlainItem<ItemKind::MOD>;
using ItemStatic = SpannedItem<ItemKind::STATIC>;
using ItemStruct = PlainItem<ItemKind::STRUCT>;
using ItemTrait = SpannedItem<ItemKind::TRAIT>;
using ItemTraitAlias = PlainItem<ItemKind::TRAIT_ALIAS>;
using ItemType = SpannedItem<ItemKind::TYPE>;
using ItemUnion = CommentedItem<ItemKind::UNION>;
using ItemUse = SpannedItem<ItemKind::USE>;
using ItemVerbatim = PlainItem<ItemKind::VERBATIM>;

using Item = std::variant<ItemConst,
                          ItemEnum,
                          ItemExternCrate,
                          ItemFn,
                          ItemForeignMod,
                          ItemImpl,
                          ItemMacro,
                          ItemMod,
                          ItemStatic,
                          ItemStruct,
                          ItemTrait,
                          ItemTraitAlias,
                          ItemType,
                          ItemUnion,
                          ItemUse,
                          ItemVerbatim>;

// Parsed source unit: top-level items plus the comments no construct claimed
struct SourceFile {
    std::vector<Item> items;
    Comments comments;

    auto operator==(const SourceFile& other) const -> bool = default;
};

template<typename T>
concept HasSpanField = requires(T& item) { item.span; };

template<typename T>
concept HasCommentsField = requires(T& item) { item.comments; };

template<typename T>
concept HasBlockField = requires(T& item) { item.block; };

template<typename T>
constexpr auto shape_matches_capabilities() -> bool {
    constexpr auto caps = capabilities_of(T::kind);
    return caps.has_span == HasSpanField<T> && caps.has_comments == HasCommentsField<T>
           && caps.has_block == HasBlockField<T>;
}

template<typename Variant>
struct CapabilityTableCheck;

template<typename... Ts>
struct CapabilityTableCheck<std::variant<Ts...>> {
    static constexpr bool shapes_agree = (shape_matches_capabilities<Ts>() && ...);
    static constexpr bool order_agrees
        = ((std::is_same_v<Ts, std::variant_alternative_t<static_cast<size_t>(Ts::kind),
                                                          std::variant<Ts...>>>) && ...);
};

static_assert(std::variant_size_v<Item> == item_kind_count);
static_assert(CapabilityTableCheck<Item>::shapes_agree,
              "item shapes disagree with the capability table");
static_assert(CapabilityTableCheck<Item>::order_agrees,
              "Item alternatives must follow ItemKind order");

auto item_kind(const Item& item) -> ItemKind;
auto item_kind_name(ItemKind kind) -> std::string;
auto parse_item_kind(const std::string& name) -> std::optional<ItemKind>;

auto make_item(ItemKind kind, std::string name, std::optional<SpanInfo> span = std::nullopt)
    -> Item;

auto item_name(const Item& item) -> const std::string&;

// Declaration span; nullopt when the kind has none or the parser recorded none
auto item_span(const Item& item) -> std::optional<SpanInfo>;

// nullptr when the kind has no comment list / no body block
auto item_comments(const Item& item) -> const Comments*;
auto item_block(const Item& item) -> const Block*;
auto item_block(Item& item) -> Block*;

// Replace the item's comment list. Returns false (and leaves the item alone) when
// the kind cannot hold comments.
auto set_item_comments(Item& item, Comments comments) -> bool;

// Every comment in the tree: item lists, block lists, then the root list
auto count_comments(const SourceFile& file) -> size_t;

} // namespace commentmap
