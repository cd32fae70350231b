#pragma once

#include "commentmap/core/span_info.hpp"
#include "commentmap/core/syntax_tree.hpp"
#include "commentmap/interfaces.hpp"
#include "commentmap/parsers/parse_error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace commentmap {

enum class TokenKind {
    IDENT,
    LIFETIME,
    LITERAL,
    PUNCT,
    OPEN,   // ( [ {
    CLOSE   // ) ] }
};

struct Token {
    TokenKind kind{TokenKind::PUNCT};
    std::string text;
    SpanInfo span;
    size_t partner{};  // Index of the matching delimiter for OPEN/CLOSE
};

// Tokens of a Rust-like source with comments and whitespace removed. Delimiters are
// checked for balance. Throws ParseError.
auto tokenize(std::string_view source) -> std::vector<Token>;

// Item-level parser for Rust-like sources. Records what a grammar parser would
// hand to the comment engine: item kinds, names, declaration spans (the name
// token, or the leading keyword of nameless items) and fn body spans.
class OutlineParser : public ISourceParser {
public:
    auto parse(const std::string& source) -> SourceFile override;

private:
    auto parse_item() -> Item;
    auto parse_fn() -> Item;
    auto parse_named(ItemKind kind) -> Item;
    auto parse_trait() -> Item;
    auto parse_impl() -> Item;
    auto parse_use() -> Item;
    auto parse_value(ItemKind kind) -> Item;
    auto parse_extern_crate() -> Item;
    auto parse_foreign_mod() -> Item;
    auto parse_macro() -> Item;
    auto parse_verbatim() -> Item;

    auto skip_attributes() -> void;
    auto skip_visibility() -> void;
    auto skip_qualifiers() -> void;
    auto skip_to_item_end() -> void;
    auto skip_to_semicolon() -> void;
    auto skip_generic_params() -> void;
    auto follows_dash(size_t index) const -> bool;
    auto find_at_depth_zero(char open_delimiter, char punct) const -> size_t;
    auto is_macro_invocation() const -> bool;

    auto at_end() const -> bool;
    auto peek(size_t ahead = 0) const -> const Token*;
    auto is_ident(size_t ahead, std::string_view text) const -> bool;
    auto is_punct(size_t ahead, char c) const -> bool;
    auto is_open(size_t ahead, char c) const -> bool;
    auto advance() -> const Token&;
    auto expect_name(std::string_view after) -> const Token&;
    auto join_until(size_t end) const -> std::string;
    auto error(const std::string& message) const -> ParseError;

    std::vector<Token> tokens_;
    size_t pos_{};
};

} // namespace commentmap
