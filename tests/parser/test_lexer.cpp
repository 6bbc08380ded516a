/**
 * @file test_lexer.cpp
 * @brief Tokenizer tests
 */

#include "tsgen/syntax.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace tsgen::syntax;

namespace {

std::vector<Token> lex(std::string_view text)
{
    auto tokens = tokenize(text, "src/lib.rs");
    EXPECT_TRUE(tokens) << (tokens ? std::string{} : tokens.error().reason);
    return tokens ? *tokens : std::vector<Token>{};
}

std::vector<std::string> texts(const std::vector<Token>& tokens)
{
    std::vector<std::string> out;
    for (const auto& token : tokens) {
        if (token.kind != TokenKind::kEof) {
            out.push_back(token.text);
        }
    }
    return out;
}

}  // namespace

TEST(Lexer, IdentifiersAndPunctuation)
{
    auto tokens = lex("pub fn get_user(id: u32) -> Result<User, String> {}");
    EXPECT_EQ(texts(tokens),
              (std::vector<std::string>{"pub", "fn", "get_user", "(", "id", ":", "u32", ")", "->",
                                        "Result", "<", "User", ",", "String", ">", "{", "}"}));
    ASSERT_FALSE(tokens.empty());
    EXPECT_EQ(tokens.back().kind, TokenKind::kEof);
}

TEST(Lexer, PathSeparator)
{
    auto tokens = lex("tauri::Window");
    ASSERT_EQ(tokens.size(), 4U);
    EXPECT_TRUE(tokens[1].is_punct("::"));
}

TEST(Lexer, LineAndColumn)
{
    auto tokens = lex("fn a() {}\n  struct B;");
    ASSERT_GE(tokens.size(), 7U);
    EXPECT_EQ(tokens[0].line, 1);
    EXPECT_EQ(tokens[0].column, 1);
    EXPECT_TRUE(tokens[5].is_ident("struct"));
    EXPECT_EQ(tokens[5].line, 2);
    EXPECT_EQ(tokens[5].column, 3);
}

TEST(Lexer, CommentsDropped)
{
    auto tokens = lex("// plain\n/* block /* nested */ */ fn\n//! inner doc\n");
    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"fn"}));
}

TEST(Lexer, DocComments)
{
    auto tokens = lex("/// Fetch a user\n/** Block doc */\nfn f() {}");
    ASSERT_GE(tokens.size(), 2U);
    EXPECT_EQ(tokens[0].kind, TokenKind::kDocComment);
    EXPECT_EQ(tokens[0].text, " Fetch a user");
    EXPECT_EQ(tokens[1].kind, TokenKind::kDocComment);
    EXPECT_EQ(tokens[1].text, " Block doc ");
}

TEST(Lexer, StringLiterals)
{
    auto tokens = lex(R"(emit("main\"event", r#"raw "text""#, b"bytes"))");
    std::vector<std::string> strings;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::kString) {
            strings.push_back(token.text);
        }
    }
    EXPECT_EQ(strings, (std::vector<std::string>{"main\"event", "raw \"text\"", "bytes"}));
}

TEST(Lexer, LifetimesAndChars)
{
    auto tokens = lex("State<'_, Db> 'x' '\\n' &'static str");
    ASSERT_GE(tokens.size(), 11U);
    EXPECT_EQ(tokens[2].kind, TokenKind::kLifetime);
    EXPECT_EQ(tokens[2].text, "_");
    EXPECT_EQ(tokens[6].kind, TokenKind::kChar);
    EXPECT_EQ(tokens[6].text, "x");
    EXPECT_EQ(tokens[7].kind, TokenKind::kChar);
    EXPECT_EQ(tokens[7].text, "\n");
    EXPECT_EQ(tokens[9].kind, TokenKind::kLifetime);
    EXPECT_EQ(tokens[9].text, "static");
}

TEST(Lexer, Numbers)
{
    auto tokens = lex("let x = 42u8; let y = 3.5; let z = 0x1F;");
    std::vector<std::string> numbers;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::kNumber) {
            numbers.push_back(token.text);
        }
    }
    EXPECT_EQ(numbers, (std::vector<std::string>{"42u8", "3.5", "0x1F"}));
}

TEST(Lexer, UnterminatedString)
{
    auto tokens = tokenize("let s = \"open;\n", "src/lib.rs");
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().reason, "unterminated string literal");
    EXPECT_EQ(tokens.error().file, "src/lib.rs");
    EXPECT_EQ(tokens.error().line, 1);
    EXPECT_EQ(tokens.error().column, 9);
}

TEST(Lexer, UnbalancedDelimiter)
{
    auto tokens = tokenize("fn f() { (1, 2] }", "src/lib.rs");
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().reason, "unbalanced delimiter ']'");
}

TEST(Lexer, UnclosedDelimiter)
{
    auto tokens = tokenize("fn f() {\n    let x = 1;\n", "src/lib.rs");
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().reason, "unclosed delimiter '{'");
    EXPECT_EQ(tokens.error().line, 1);
    EXPECT_EQ(tokens.error().column, 8);
}

TEST(Lexer, UnterminatedBlockComment)
{
    auto tokens = tokenize("fn f() {} /* never closed", "src/lib.rs");
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().reason, "unterminated block comment");
}
