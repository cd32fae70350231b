#include "commentmap/parsers/outline_parser.hpp"
#include "commentmap/core/annotate.hpp"
#include <gtest/gtest.h>

namespace commentmap {

class OutlineParserTest : public ::testing::Test {
protected:
    OutlineParser parser_;

    static auto kinds_of(const SourceFile& file) -> std::vector<ItemKind> {
        std::vector<ItemKind> kinds;
        for (const auto& item : file.items) {
            kinds.push_back(item_kind(item));
        }
        return kinds;
    }

    static auto token_texts(const std::vector<Token>& tokens) -> std::vector<std::string> {
        std::vector<std::string> texts;
        for (const auto& token : tokens) {
            texts.push_back(token.text);
        }
        return texts;
    }
};

// Tokenizer

TEST_F(OutlineParserTest, TokenizeSkipsCommentsAndWhitespace)
{
    auto tokens = tokenize("/* a /* nested */ b */ fn f() {} // tail");

    std::vector<std::string> expected{"fn", "f", "(", ")", "{", "}"};
    EXPECT_EQ(token_texts(tokens), expected);
    EXPECT_EQ(tokens[0].kind, TokenKind::IDENT);
    EXPECT_EQ(tokens[0].span.start_column, 23);
}

TEST_F(OutlineParserTest, TokenizePairsDelimiters)
{
    auto tokens = tokenize("f(a[0], { b })");

    ASSERT_EQ(tokens.size(), 11);
    EXPECT_EQ(tokens[1].kind, TokenKind::OPEN);
    EXPECT_EQ(tokens[1].partner, 10);
    EXPECT_EQ(tokens[10].partner, 1);
    EXPECT_EQ(tokens[3].partner, 5);
    EXPECT_EQ(tokens[7].text, "{");
    EXPECT_EQ(tokens[7].partner, 9);
}

TEST_F(OutlineParserTest, TokenizeLiterals)
{
    auto tokens = tokenize(R"src(let s = r#"say "hi" // here"#; let b = b"x{"; let c = b'}';)src");

    std::vector<std::string> expected{"let", "s", "=", R"(r#"say "hi" // here"#)", ";",
                                      "let", "b", "=", R"(b"x{")",                 ";",
                                      "let", "c", "=", "b'}'",                     ";"};
    EXPECT_EQ(token_texts(tokens), expected);
    EXPECT_EQ(tokens[3].kind, TokenKind::LITERAL);
    EXPECT_EQ(tokens[13].kind, TokenKind::LITERAL);
}

TEST_F(OutlineParserTest, TokenizeCharactersAndLifetimes)
{
    auto tokens = tokenize(R"(fn f<'a>(x: &'a str) -> char { '\n'; 'é'; '{' })");

    std::vector<TokenKind> quote_kinds;
    for (const auto& token : tokens) {
        if (token.text.front() == '\'') {
            quote_kinds.push_back(token.kind);
        }
    }

    std::vector<TokenKind> expected{TokenKind::LIFETIME, TokenKind::LIFETIME, TokenKind::LITERAL,
                                    TokenKind::LITERAL, TokenKind::LITERAL};
    EXPECT_EQ(quote_kinds, expected);
}

TEST_F(OutlineParserTest, TokenizeRawIdentifierAndNumbers)
{
    auto tokens = tokenize("let r#type = 1.5e3 + 0x1F;");

    std::vector<std::string> expected{"let", "r#type", "=", "1.5e3", "+", "0x1F", ";"};
    EXPECT_EQ(token_texts(tokens), expected);
    EXPECT_EQ(tokens[1].kind, TokenKind::IDENT);
}

TEST_F(OutlineParserTest, TokenizeReportsMalformedInput)
{
    EXPECT_THROW(tokenize("fn f() {"), ParseError);
    EXPECT_THROW(tokenize("fn f() }"), ParseError);
    EXPECT_THROW(tokenize("fn f(] {}"), ParseError);
    EXPECT_THROW(tokenize("let s = \"open"), ParseError);
    EXPECT_THROW(tokenize("fn f() {}\n/* open"), ParseError);
}

TEST_F(OutlineParserTest, ParseErrorCarriesPosition)
{
    try {
        tokenize("fn f() {}\n/* open");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.column(), 0);
        EXPECT_NE(std::string(e.what()).find("unterminated block comment"), std::string::npos);
    }
}

// Items

TEST_F(OutlineParserTest, EmptySource)
{
    auto file = parser_.parse("  // only a comment\n");

    EXPECT_TRUE(file.items.empty());
    EXPECT_TRUE(file.comments.empty());
}

TEST_F(OutlineParserTest, FunctionSpans)
{
    auto file = parser_.parse("fn main() {\n    println!(\"hi\");\n}\n");

    ASSERT_EQ(file.items.size(), 1);
    const auto& fn = std::get<ItemFn>(file.items[0]);
    EXPECT_EQ(fn.name, "main");

    ASSERT_TRUE(fn.span.has_value());
    EXPECT_EQ(*fn.span, (SpanInfo{.start_line = 1,
                                  .start_column = 3,
                                  .end_line = 1,
                                  .end_column = 7,
                                  .start_offset = 3,
                                  .end_offset = 7}));

    ASSERT_TRUE(fn.block.span.has_value());
    EXPECT_EQ(*fn.block.span, (SpanInfo{.start_line = 1,
                                        .start_column = 10,
                                        .end_line = 3,
                                        .end_column = 1,
                                        .start_offset = 10,
                                        .end_offset = 33}));
}

TEST_F(OutlineParserTest, FunctionWithoutBody)
{
    auto file = parser_.parse("extern \"C\" fn abs(x: i32) -> i32;");

    ASSERT_EQ(file.items.size(), 1);
    const auto& fn = std::get<ItemFn>(file.items[0]);
    EXPECT_EQ(fn.name, "abs");
    EXPECT_FALSE(fn.block.span.has_value());
}

TEST_F(OutlineParserTest, RecognisesEveryItemKind)
{
    std::string source = "use std::collections::HashMap;\n"
                         "extern crate alloc;\n"
                         "mod tests;\n"
                         "pub(crate) struct Point { x: i32 }\n"
                         "enum Color { Red, Green }\n"
                         "union Bits { i: u32, f: f32 }\n"
                         "const LIMIT: usize = 10;\n"
                         "static mut COUNTER: u32 = 0;\n"
                         "type Id = u64;\n"
                         "trait Shape { fn area(&self) -> f64; }\n"
                         "trait Alias = Shape + Send;\n"
                         "impl Shape for Point { fn area(&self) -> f64 { 0.0 } }\n"
                         "extern \"C\" { fn abs(x: i32) -> i32; }\n"
                         "macro_rules! square { ($x:expr) => { $x * $x }; }\n"
                         "println!(\"top\");\n"
                         "let x = 5;\n"
                         "async fn run() {}\n";

    auto file = parser_.parse(source);

    std::vector<ItemKind> expected{
        ItemKind::USE,    ItemKind::EXTERN_CRATE, ItemKind::MOD,       ItemKind::STRUCT,
        ItemKind::ENUM,   ItemKind::UNION,        ItemKind::CONST,     ItemKind::STATIC,
        ItemKind::TYPE,   ItemKind::TRAIT,        ItemKind::TRAIT_ALIAS, ItemKind::IMPL,
        ItemKind::FOREIGN_MOD, ItemKind::MACRO,   ItemKind::MACRO,     ItemKind::VERBATIM,
        ItemKind::FN};
    ASSERT_EQ(kinds_of(file), expected);

    std::vector<std::string> names;
    for (const auto& item : file.items) {
        names.push_back(item_name(item));
    }
    std::vector<std::string> expected_names{
        "std::collections::HashMap", "alloc", "tests", "Point", "Color", "Bits", "LIMIT",
        "COUNTER", "Id", "Shape", "Alias", "Shape for Point", "C", "square", "println", "", "run"};
    EXPECT_EQ(names, expected_names);
}

TEST_F(OutlineParserTest, NamelessItemsUseTheirKeywordSpan)
{
    auto file = parser_.parse("use a::b;\nimpl X {}\n");

    ASSERT_EQ(file.items.size(), 2);
    auto use_span = item_span(file.items[0]);
    ASSERT_TRUE(use_span.has_value());
    EXPECT_EQ(use_span->start_line, 1);
    EXPECT_EQ(use_span->start_column, 0);
    EXPECT_EQ(use_span->end_column, 3);

    auto impl_span = item_span(file.items[1]);
    ASSERT_TRUE(impl_span.has_value());
    EXPECT_EQ(impl_span->start_line, 2);
    EXPECT_EQ(impl_span->start_column, 0);
    EXPECT_EQ(impl_span->end_column, 4);
}

TEST_F(OutlineParserTest, NamedItemsUseTheirNameSpan)
{
    auto file = parser_.parse("const LIMIT: usize = 10;\npub static mut COUNTER: u32 = 0;");

    ASSERT_EQ(file.items.size(), 2);
    auto const_span = item_span(file.items[0]);
    ASSERT_TRUE(const_span.has_value());
    EXPECT_EQ(format_span(*const_span), "1:6-1:11");

    auto static_span = item_span(file.items[1]);
    ASSERT_TRUE(static_span.has_value());
    EXPECT_EQ(format_span(*static_span), "2:15-2:22");
}

TEST_F(OutlineParserTest, SkipsAttributesVisibilityAndQualifiers)
{
    std::string source = "#![allow(dead_code)]\n"
                         "#[derive(Debug)]\n"
                         "pub struct A;\n"
                         "#[test]\n"
                         "pub(in crate::x) const unsafe fn b() {}\n"
                         "pub unsafe impl Send for A {}\n"
                         "pub extern \"C\" fn c() {}\n"
                         "default fn d() {}\n";

    auto file = parser_.parse(source);

    std::vector<ItemKind> expected{ItemKind::STRUCT, ItemKind::FN, ItemKind::IMPL, ItemKind::FN,
                                   ItemKind::FN};
    ASSERT_EQ(kinds_of(file), expected);
    EXPECT_EQ(item_name(file.items[1]), "b");
    EXPECT_EQ(item_name(file.items[2]), "Send for A");
    EXPECT_EQ(item_name(file.items[3]), "c");
    EXPECT_EQ(item_name(file.items[4]), "d");
}

TEST_F(OutlineParserTest, BracesInsideLiteralsDoNotEndBody)
{
    auto file = parser_.parse("fn f() {\n    let s = \"}\";\n    let c = '{';\n}\nfn g() {}\n");

    ASSERT_EQ(file.items.size(), 2);
    const auto& f = std::get<ItemFn>(file.items[0]);
    ASSERT_TRUE(f.block.span.has_value());
    EXPECT_EQ(f.block.span->end_line, 4);
    EXPECT_EQ(item_name(file.items[1]), "g");
}

TEST_F(OutlineParserTest, MacroInvocationForms)
{
    auto file = parser_.parse("std::println!(\"a\");\nthread_local! { static X: u8 = 0; }\nvec![1];\n");

    ASSERT_EQ(kinds_of(file),
              (std::vector<ItemKind>{ItemKind::MACRO, ItemKind::MACRO, ItemKind::MACRO}));
    EXPECT_EQ(item_name(file.items[0]), "std::println");
    EXPECT_EQ(item_name(file.items[1]), "thread_local");
    EXPECT_EQ(item_name(file.items[2]), "vec");
}

TEST_F(OutlineParserTest, UnionAsIdentifierIsVerbatim)
{
    auto file = parser_.parse("union = 3;");

    ASSERT_EQ(file.items.size(), 1);
    EXPECT_EQ(item_kind(file.items[0]), ItemKind::VERBATIM);
}

TEST_F(OutlineParserTest, ParserReportsMalformedItems)
{
    EXPECT_THROW(parser_.parse("fn () {}"), ParseError);
    EXPECT_THROW(parser_.parse("struct"), ParseError);
    EXPECT_THROW(parser_.parse("struct A"), ParseError);
    EXPECT_THROW(parser_.parse("const X: u8 = 1"), ParseError);
    EXPECT_THROW(parser_.parse("fn f()"), ParseError);
    EXPECT_THROW(parser_.parse("extern \"C\" fn"), ParseError);
    EXPECT_THROW(parser_.parse("m!"), ParseError);
}

TEST_F(OutlineParserTest, ParsedFileHasNoCommentsYet)
{
    auto file = parser_.parse("// lead\nfn f() { /* body */ }\n");

    EXPECT_EQ(count_comments(file), 0);
}

TEST_F(OutlineParserTest, TraitHeadersWithBindingsAreNotAliases)
{
    auto file = parser_.parse("trait Source: Iterator<Item = u8> { fn next_byte(&mut self); }\n"
                              "trait Conv<T = u8> { fn conv(&self) -> T; }\n"
                              "trait Mapper<F: Fn(u8) -> u8> where Self: Sized {}\n"
                              "trait Bytes<T> = Iterator<Item = T>;\n"
                              "fn h() { /* in h */ }\n");

    std::vector<ItemKind> expected{ItemKind::TRAIT, ItemKind::TRAIT, ItemKind::TRAIT,
                                   ItemKind::TRAIT_ALIAS, ItemKind::FN};
    ASSERT_EQ(kinds_of(file), expected);
    EXPECT_EQ(item_name(file.items[1]), "Conv");
    EXPECT_EQ(item_name(file.items[3]), "Bytes");
    EXPECT_EQ(item_name(file.items[4]), "h");
}

TEST_F(OutlineParserTest, ItemsAfterBoundTraitKeepTheirComments)
{
    std::string source = "trait Source: Iterator<Item = u8> { // t\n"
                         "    fn next_byte(&mut self);\n"
                         "}\n"
                         "\n"
                         "fn g() {\n"
                         "    // in g\n"
                         "}\n"
                         "const X: u8 = 1;\n";

    auto file = parser_.parse(source);
    std::vector<ItemKind> expected{ItemKind::TRAIT, ItemKind::FN, ItemKind::CONST};
    ASSERT_EQ(kinds_of(file), expected);
    EXPECT_EQ(item_name(file.items[1]), "g");
    EXPECT_EQ(item_name(file.items[2]), "X");

    auto stats = annotate_with_comments(file, source);

    EXPECT_EQ(stats.attached, 2);
    EXPECT_TRUE(file.comments.empty());
    ASSERT_EQ(item_comments(file.items[0])->size(), 1);
    EXPECT_EQ(item_comments(file.items[0])->front().text, "t");
    ASSERT_EQ(item_block(file.items[1])->comments.size(), 1);
    EXPECT_EQ(item_block(file.items[1])->comments.front().text, "in g");
}

} // namespace commentmap
