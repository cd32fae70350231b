#include "commentmap/parsers/outline_parser.hpp"
#include <cctype>
#include <string>
#include <utility>

namespace commentmap {

namespace {

struct Mark {
    size_t line{1};
    size_t column{};
    size_t offset{};
};

auto span_between(Mark start, Mark end) -> SpanInfo {
    return SpanInfo{.start_line = start.line,
                    .start_column = start.column,
                    .end_line = end.line,
                    .end_column = end.column,
                    .start_offset = start.offset,
                    .end_offset = end.offset};
}

auto join_spans(const SpanInfo& first, const SpanInfo& last) -> SpanInfo {
    return SpanInfo{.start_line = first.start_line,
                    .start_column = first.start_column,
                    .end_line = last.end_line,
                    .end_column = last.end_column,
                    .start_offset = first.start_offset,
                    .end_offset = last.end_offset};
}

auto is_ident_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

auto is_ident_continue(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

auto utf8_length(char c) -> size_t {
    auto u = static_cast<unsigned char>(c);
    if ((u >> 5) == 0x6) return 2;
    if ((u >> 4) == 0xE) return 3;
    if ((u >> 3) == 0x1E) return 4;
    return 1;
}

auto closing_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

auto is_word_like(const Token& token) -> bool {
    return token.kind == TokenKind::IDENT || token.kind == TokenKind::LITERAL
           || token.kind == TokenKind::LIFETIME;
}

class Lexer {
public:
    explicit Lexer(std::string_view source) : source_(source) {}

    auto run() -> std::vector<Token> {
        while (!at_end()) {
            char c = current();

            if (std::isspace(static_cast<unsigned char>(c))) {
                bump();
            } else if (c == '/' && current(1) == '/') {
                skip_line_comment();
            } else if (c == '/' && current(1) == '*') {
                skip_block_comment();
            } else {
                lex_token();
            }
        }

        if (!open_stack_.empty()) {
            const auto& open = tokens_[open_stack_.back()];
            throw ParseError("unclosed '" + open.text + "'", open.span.start_line,
                             open.span.start_column);
        }

        return std::move(tokens_);
    }

private:
    auto at_end() const -> bool { return offset_ >= source_.size(); }

    auto current(size_t ahead = 0) const -> char {
        return offset_ + ahead < source_.size() ? source_[offset_ + ahead] : '\0';
    }

    auto mark() const -> Mark { return {.line = line_, .column = column_, .offset = offset_}; }

    auto bump(size_t count = 1) -> void {
        for (; count > 0 && !at_end(); --count) {
            if (source_[offset_] == '\n') {
                ++line_;
                column_ = 0;
            } else {
                ++column_;
            }
            ++offset_;
        }
    }

    auto skip_line_comment() -> void {
        while (!at_end() && current() != '\n') {
            bump();
        }
    }

    // Block comments nest
    auto skip_block_comment() -> void {
        auto start = mark();
        size_t depth = 0;

        do {
            if (at_end()) {
                throw ParseError("unterminated block comment", start.line, start.column);
            }
            if (current() == '/' && current(1) == '*') {
                ++depth;
                bump(2);
            } else if (current() == '*' && current(1) == '/') {
                --depth;
                bump(2);
            } else {
                bump();
            }
        } while (depth > 0);
    }

    auto lex_token() -> void {
        auto start = mark();
        char c = current();
        auto kind = TokenKind::PUNCT;

        if (auto prefix = raw_string_prefix(); prefix > 0) {
            bump(prefix);
            lex_raw_string(start);
            kind = TokenKind::LITERAL;
        } else if ((c == 'b' || c == 'c') && current(1) == '"') {
            bump();
            lex_string(start);
            kind = TokenKind::LITERAL;
        } else if (c == 'b' && current(1) == '\'') {
            bump();
            kind = lex_quote(start);
        } else if (c == 'r' && current(1) == '#' && is_ident_start(current(2))) {
            bump(2);
            lex_word();
            kind = TokenKind::IDENT;
        } else if (is_ident_start(c)) {
            lex_word();
            kind = TokenKind::IDENT;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            lex_number();
            kind = TokenKind::LITERAL;
        } else if (c == '"') {
            lex_string(start);
            kind = TokenKind::LITERAL;
        } else if (c == '\'') {
            kind = lex_quote(start);
        } else if (c == '(' || c == '[' || c == '{') {
            bump();
            kind = TokenKind::OPEN;
        } else if (c == ')' || c == ']' || c == '}') {
            bump();
            kind = TokenKind::CLOSE;
        } else {
            bump();
        }

        Token token{.kind = kind,
                    .text = std::string(source_.substr(start.offset, offset_ - start.offset)),
                    .span = span_between(start, mark()),
                    .partner = 0};
        push(std::move(token));
    }

    auto push(Token token) -> void {
        size_t index = tokens_.size();

        if (token.kind == TokenKind::OPEN) {
            open_stack_.push_back(index);
        } else if (token.kind == TokenKind::CLOSE) {
            if (open_stack_.empty()) {
                throw ParseError("unexpected '" + token.text + "'", token.span.start_line,
                                 token.span.start_column);
            }
            auto& open = tokens_[open_stack_.back()];
            if (closing_for(open.text.front()) != token.text.front()) {
                throw ParseError("mismatched '" + token.text + "' for '" + open.text + "'",
                                 token.span.start_line, token.span.start_column);
            }
            open.partner = index;
            token.partner = open_stack_.back();
            open_stack_.pop_back();
        }

        tokens_.push_back(std::move(token));
    }

    // Length of "r", "br" or "cr" when a raw string starts here, else 0
    auto raw_string_prefix() const -> size_t {
        size_t prefix = (current() == 'b' || current() == 'c') ? 1 : 0;
        if (current(prefix) != 'r') {
            return 0;
        }
        size_t quote = prefix + 1;
        while (current(quote) == '#') {
            ++quote;
        }
        return current(quote) == '"' ? prefix + 1 : 0;
    }

    auto lex_raw_string(Mark start) -> void {
        size_t hashes = 0;
        while (current() == '#') {
            ++hashes;
            bump();
        }
        bump(); // opening quote

        while (!at_end()) {
            if (current() == '"') {
                size_t closing = 0;
                while (closing < hashes && current(1 + closing) == '#') {
                    ++closing;
                }
                if (closing == hashes) {
                    bump(1 + hashes);
                    return;
                }
            }
            bump();
        }

        throw ParseError("unterminated raw string literal", start.line, start.column);
    }

    auto lex_string(Mark start) -> void {
        bump(); // opening quote
        while (!at_end()) {
            if (current() == '\\') {
                bump(2);
            } else if (current() == '"') {
                bump();
                return;
            } else {
                bump();
            }
        }
        throw ParseError("unterminated string literal", start.line, start.column);
    }

    // Character literal or lifetime
    auto lex_quote(Mark start) -> TokenKind {
        if (current(1) == '\\') {
            bump(3); // quote, backslash, escaped character
            while (!at_end() && current() != '\'' && current() != '\n') {
                bump();
            }
            if (current() != '\'') {
                throw ParseError("unterminated character literal", start.line, start.column);
            }
            bump();
            return TokenKind::LITERAL;
        }

        auto length = utf8_length(current(1));
        if (current(1 + length) == '\'') {
            bump(2 + length);
            return TokenKind::LITERAL;
        }

        if (is_ident_start(current(1))) {
            bump();
            lex_word();
            return TokenKind::LIFETIME;
        }

        throw ParseError("unterminated character literal", start.line, start.column);
    }

    auto lex_word() -> void {
        while (!at_end() && is_ident_continue(current())) {
            bump();
        }
    }

    auto lex_number() -> void {
        while (!at_end()) {
            char c = current();
            if (is_ident_continue(c)
                || (c == '.' && std::isdigit(static_cast<unsigned char>(current(1))))) {
                bump();
            } else {
                break;
            }
        }
    }

    std::string_view source_;
    size_t offset_{};
    size_t line_{1};
    size_t column_{};
    std::vector<Token> tokens_;
    std::vector<size_t> open_stack_;
};

} // namespace

auto tokenize(std::string_view source) -> std::vector<Token> {
    return Lexer(source).run();
}

auto OutlineParser::parse(const std::string& source) -> SourceFile {
    tokens_ = tokenize(source);
    pos_ = 0;

    SourceFile file;
    while (true) {
        skip_attributes();
        if (at_end()) {
            break;
        }
        file.items.push_back(parse_item());
    }

    return file;
}

auto OutlineParser::parse_item() -> Item {
    skip_visibility();
    skip_qualifiers();

    if (at_end()) {
        throw error("expected an item");
    }

    if (is_ident(0, "fn")) return parse_fn();
    if (is_ident(0, "struct")) return parse_named(ItemKind::STRUCT);
    if (is_ident(0, "enum")) return parse_named(ItemKind::ENUM);
    if (is_ident(0, "mod")) return parse_named(ItemKind::MOD);
    if (is_ident(0, "union") && peek(1) != nullptr && peek(1)->kind == TokenKind::IDENT) {
        return parse_named(ItemKind::UNION);
    }
    if (is_ident(0, "trait")) return parse_trait();
    if (is_ident(0, "impl")) return parse_impl();
    if (is_ident(0, "use")) return parse_use();
    if (is_ident(0, "const")) return parse_value(ItemKind::CONST);
    if (is_ident(0, "static")) return parse_value(ItemKind::STATIC);
    if (is_ident(0, "type")) return parse_value(ItemKind::TYPE);
    if (is_ident(0, "extern")) {
        return is_ident(1, "crate") ? parse_extern_crate() : parse_foreign_mod();
    }
    if (is_macro_invocation()) return parse_macro();

    return parse_verbatim();
}

auto OutlineParser::parse_fn() -> Item {
    advance(); // fn
    const auto& name = expect_name("fn");
    ItemFn item{.name = name.text, .span = name.span, .block = {}, .comments = {}};

    while (!at_end()) {
        const auto& token = *peek();
        if (token.kind == TokenKind::OPEN && token.text == "{") {
            item.block.span = join_spans(token.span, tokens_[token.partner].span);
            pos_ = token.partner + 1;
            return item;
        }
        if (token.kind == TokenKind::OPEN) {
            pos_ = token.partner + 1;
            continue;
        }
        if (token.kind == TokenKind::PUNCT && token.text == ";") {
            advance();
            return item;
        }
        advance();
    }

    throw error("expected a body for fn '" + item.name + "'");
}

auto OutlineParser::parse_named(ItemKind kind) -> Item {
    auto keyword = advance().text;
    const auto& name = expect_name(keyword);
    skip_to_item_end();
    return make_item(kind, name.text, name.span);
}

auto OutlineParser::parse_trait() -> Item {
    advance(); // trait
    const auto& name = expect_name("trait");

    // trait Alias<T> = Bound;
    skip_generic_params();
    if (is_punct(0, '=')) {
        skip_to_semicolon();
        return make_item(ItemKind::TRAIT_ALIAS, name.text, name.span);
    }

    skip_to_item_end();
    return make_item(ItemKind::TRAIT, name.text, name.span);
}

auto OutlineParser::parse_impl() -> Item {
    const auto& keyword = advance();
    auto body = find_at_depth_zero('{', ';');
    auto name = join_until(body);
    skip_to_item_end();
    return make_item(ItemKind::IMPL, name, keyword.span);
}

auto OutlineParser::parse_use() -> Item {
    const auto& keyword = advance();
    auto name = join_until(find_at_depth_zero('\0', ';'));
    skip_to_semicolon();
    return make_item(ItemKind::USE, name, keyword.span);
}

auto OutlineParser::parse_value(ItemKind kind) -> Item {
    auto keyword = advance().text;
    if (kind == ItemKind::STATIC && is_ident(0, "mut")) {
        advance();
    }
    const auto& name = expect_name(keyword);
    skip_to_semicolon();
    return make_item(kind, name.text, name.span);
}

auto OutlineParser::parse_extern_crate() -> Item {
    advance(); // extern
    advance(); // crate
    const auto& name = expect_name("extern crate");
    skip_to_semicolon();
    return make_item(ItemKind::EXTERN_CRATE, name.text);
}

auto OutlineParser::parse_foreign_mod() -> Item {
    const auto& keyword = advance();
    std::string abi;

    if (!at_end() && peek()->kind == TokenKind::LITERAL) {
        const auto& literal = advance().text;
        auto first = literal.find('"');
        auto last = literal.rfind('"');
        if (first != std::string::npos && last > first) {
            abi = literal.substr(first + 1, last - first - 1);
        }
    }

    if (!is_open(0, '{')) {
        throw error("expected '{' after extern");
    }
    skip_to_item_end();
    return make_item(ItemKind::FOREIGN_MOD, abi, keyword.span);
}

auto OutlineParser::parse_macro() -> Item {
    auto bang = pos_;
    while (!is_punct(bang - pos_, '!')) {
        ++bang;
    }

    auto name = join_until(bang);
    pos_ = bang + 1;

    // macro_rules! name { ... }
    if (!at_end() && peek()->kind == TokenKind::IDENT) {
        name = advance().text;
    }

    if (at_end() || peek()->kind != TokenKind::OPEN) {
        throw error("expected a macro body after '" + name + "!'");
    }

    const auto& body = advance();
    pos_ = body.partner + 1;
    if (body.text != "{" && is_punct(0, ';')) {
        advance();
    }

    return make_item(ItemKind::MACRO, name);
}

auto OutlineParser::parse_verbatim() -> Item {
    while (!at_end()) {
        const auto& token = *peek();
        if (token.kind == TokenKind::OPEN) {
            pos_ = token.partner + 1;
            if (token.text == "{") {
                break;
            }
            continue;
        }
        advance();
        if (token.kind == TokenKind::PUNCT && token.text == ";") {
            break;
        }
    }

    return make_item(ItemKind::VERBATIM, "");
}

auto OutlineParser::skip_attributes() -> void {
    while (is_punct(0, '#')) {
        size_t bracket = is_punct(1, '!') ? 2 : 1;
        if (!is_open(bracket, '[')) {
            return;
        }
        pos_ = peek(bracket)->partner + 1;
    }
}

// pub, pub(crate), pub(in path)
auto OutlineParser::skip_visibility() -> void {
    if (!is_ident(0, "pub")) {
        return;
    }
    advance();
    if (is_open(0, '(')) {
        pos_ = peek()->partner + 1;
    }
}

auto OutlineParser::skip_qualifiers() -> void {
    while (!at_end()) {
        bool next_is_ident = peek(1) != nullptr && peek(1)->kind == TokenKind::IDENT;
        bool next_is_literal = peek(1) != nullptr && peek(1)->kind == TokenKind::LITERAL;

        if (is_ident(0, "const")
            && (is_ident(1, "fn") || is_ident(1, "unsafe") || is_ident(1, "async")
                || is_ident(1, "extern"))) {
            advance();
        } else if ((is_ident(0, "async") || is_ident(0, "unsafe") || is_ident(0, "default")
                    || is_ident(0, "auto"))
                   && next_is_ident) {
            advance();
        } else if (is_ident(0, "extern") && is_ident(1, "fn")) {
            advance();
        } else if (is_ident(0, "extern") && next_is_literal
                   && (is_ident(2, "fn") || is_ident(2, "unsafe"))) {
            advance();
            advance();
        } else {
            return;
        }
    }
}

// Ends after a '{...}' group or a ';' at depth zero
auto OutlineParser::skip_to_item_end() -> void {
    while (!at_end()) {
        const auto& token = *peek();
        if (token.kind == TokenKind::OPEN) {
            pos_ = token.partner + 1;
            if (token.text == "{") {
                return;
            }
            continue;
        }
        advance();
        if (token.kind == TokenKind::PUNCT && token.text == ";") {
            return;
        }
    }
    throw error("unexpected end of input inside an item");
}

// Ends after a ';' at depth zero; brace groups are part of the item
auto OutlineParser::skip_to_semicolon() -> void {
    while (!at_end()) {
        const auto& token = *peek();
        if (token.kind == TokenKind::OPEN) {
            pos_ = token.partner + 1;
            continue;
        }
        advance();
        if (token.kind == TokenKind::PUNCT && token.text == ";") {
            return;
        }
    }
    throw error("expected ';'");
}

// Skips a '<...>' list at the cursor; the '>' of '->' does not close it
auto OutlineParser::skip_generic_params() -> void {
    if (!is_punct(0, '<')) {
        return;
    }

    size_t depth = 0;
    while (!at_end()) {
        const auto& token = *peek();
        if (token.kind == TokenKind::OPEN) {
            pos_ = token.partner + 1;
            continue;
        }
        if (token.kind == TokenKind::PUNCT && token.text == "<") {
            ++depth;
        } else if (token.kind == TokenKind::PUNCT && token.text == ">" && !follows_dash(pos_)) {
            --depth;
        }
        advance();
        if (depth == 0) {
            return;
        }
    }
    throw error("unclosed generic parameter list");
}

auto OutlineParser::follows_dash(size_t index) const -> bool {
    if (index == 0) {
        return false;
    }
    const auto& previous = tokens_[index - 1];
    return previous.kind == TokenKind::PUNCT && previous.text == "-"
           && previous.span.end_offset == tokens_[index].span.start_offset;
}

// Index of the first open_delimiter group or punct at depth zero from the cursor,
// tokens_.size() when neither occurs
auto OutlineParser::find_at_depth_zero(char open_delimiter, char punct) const -> size_t {
    size_t index = pos_;
    while (index < tokens_.size()) {
        const auto& token = tokens_[index];
        if (token.kind == TokenKind::OPEN) {
            if (token.text.front() == open_delimiter) {
                return index;
            }
            index = token.partner + 1;
            continue;
        }
        if (token.kind == TokenKind::PUNCT && token.text.front() == punct) {
            return index;
        }
        ++index;
    }
    return tokens_.size();
}

// path!(...) or path::to::name! { ... }
auto OutlineParser::is_macro_invocation() const -> bool {
    if (at_end() || peek()->kind != TokenKind::IDENT) {
        return false;
    }

    size_t ahead = 1;
    while (is_punct(ahead, ':') && is_punct(ahead + 1, ':') && peek(ahead + 2) != nullptr
           && peek(ahead + 2)->kind == TokenKind::IDENT) {
        ahead += 3;
    }
    return is_punct(ahead, '!');
}

auto OutlineParser::at_end() const -> bool {
    return pos_ >= tokens_.size();
}

auto OutlineParser::peek(size_t ahead) const -> const Token* {
    return pos_ + ahead < tokens_.size() ? &tokens_[pos_ + ahead] : nullptr;
}

auto OutlineParser::is_ident(size_t ahead, std::string_view text) const -> bool {
    const auto* token = peek(ahead);
    return token != nullptr && token->kind == TokenKind::IDENT && token->text == text;
}

auto OutlineParser::is_punct(size_t ahead, char c) const -> bool {
    const auto* token = peek(ahead);
    return token != nullptr && token->kind == TokenKind::PUNCT && token->text.front() == c;
}

auto OutlineParser::is_open(size_t ahead, char c) const -> bool {
    const auto* token = peek(ahead);
    return token != nullptr && token->kind == TokenKind::OPEN && token->text.front() == c;
}

auto OutlineParser::advance() -> const Token& {
    if (at_end()) {
        throw error("unexpected end of input");
    }
    return tokens_[pos_++];
}

auto OutlineParser::expect_name(std::string_view after) -> const Token& {
    if (at_end() || peek()->kind != TokenKind::IDENT) {
        throw error("expected a name after '" + std::string(after) + "'");
    }
    return advance();
}

// Token texts from the cursor up to end, spaced only between adjacent words
auto OutlineParser::join_until(size_t end) const -> std::string {
    std::string text;
    const Token* previous = nullptr;

    for (size_t index = pos_; index < end && index < tokens_.size(); ++index) {
        const auto& token = tokens_[index];
        if (previous != nullptr && is_word_like(*previous) && is_word_like(token)) {
            text += ' ';
        }
        text += token.text;
        previous = &token;
    }

    return text;
}

auto OutlineParser::error(const std::string& message) const -> ParseError {
    if (const auto* token = peek()) {
        return ParseError(message, token->span.start_line, token->span.start_column);
    }
    if (!tokens_.empty()) {
        const auto& last = tokens_.back().span;
        return ParseError(message, last.end_line, last.end_column);
    }
    return ParseError(message, 1, 0);
}

} // namespace commentmap
