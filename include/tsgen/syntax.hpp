#pragma once

/**
 * @file syntax.hpp
 * @brief Declaration-level syntax of a backend source file
 *
 * The parser understands only the shapes tsgen needs: `use` trees,
 * function signatures (with body token ranges), structs and enums, doc
 * comments and attributes. Every other item is skipped as a balanced token
 * run.
 */

#include "tsgen/diagnostics.hpp"

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsgen::syntax {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind {
    kIdent,
    kLifetime,
    kString,  ///< text holds the decoded literal contents
    kChar,
    kNumber,
    kPunct,  ///< one character, or one of "::", "->", "=>"
    kDocComment,
    kEof,
};

struct Token
{
    TokenKind kind = TokenKind::kEof;
    std::string text;
    int line = 0;
    int column = 0;

    [[nodiscard]] bool is(TokenKind k, std::string_view t) const { return kind == k && text == t; }
    [[nodiscard]] bool is_punct(std::string_view t) const { return is(TokenKind::kPunct, t); }
    [[nodiscard]] bool is_ident(std::string_view t) const { return is(TokenKind::kIdent, t); }
};

struct ParseError
{
    std::string file;
    int line = 0;
    int column = 0;
    std::string reason;
};

/**
 * Tokenize a whole file. Comments other than doc comments are dropped;
 * delimiters are checked for balance.
 */
[[nodiscard]] std::expected<std::vector<Token>, ParseError> tokenize(std::string_view text,
                                                                     const std::string& file);

// ============================================================================
// Type expressions
// ============================================================================

struct TypeExpr
{
    enum class Kind {
        kPath,       ///< segments + generic args, e.g. tauri::State<'_, Db>
        kReference,  ///< args[0] is the referent
        kTuple,      ///< args are the elements; () is the empty tuple
        kSlice,      ///< args[0] is the element type
        kArray,      ///< args[0] is the element type
        kOther,      ///< raw pointer, fn pointer, impl/dyn trait, never, qualified path
    };

    Kind kind = Kind::kOther;
    std::vector<std::string> segments;
    std::vector<TypeExpr> args;
    bool mutable_ref = false;
    std::string text;  ///< source spelling
};

// ============================================================================
// Declarations
// ============================================================================

/// alias -> canonical path ("Window" -> "tauri::Window", "MyWin" -> "tauri::WebviewWindow")
using AliasTable = std::map<std::string, std::string>;

struct Attribute
{
    std::string path;           ///< "tauri::command", "derive", "serde"
    std::vector<Token> tokens;  ///< contents of the argument group, without delimiters
};

struct FnParam
{
    std::string name;  ///< binding identifier, or the pattern spelling for destructuring
    TypeExpr type;
    SourceLocation location;
};

struct FunctionDecl
{
    std::string name;
    std::string doc;
    std::vector<Attribute> attributes;
    bool is_command = false;
    std::string rename_all;  ///< marker argument, empty when absent
    bool is_async = false;
    bool in_impl = false;
    bool has_self = false;
    std::vector<FnParam> params;
    std::optional<TypeExpr> return_type;
    std::size_t body_begin = 0;  ///< token index of the first token inside the body braces
    std::size_t body_end = 0;    ///< token index of the closing brace
    SourceLocation location;
};

struct FieldDecl
{
    std::string name;  ///< "0", "1", ... for tuple fields
    std::string doc;
    TypeExpr type;
    SourceLocation location;
};

enum class VariantShape {
    kUnit,
    kTuple,
    kStruct,
};

struct VariantDecl
{
    std::string name;
    std::string doc;
    VariantShape shape = VariantShape::kUnit;
    std::vector<FieldDecl> fields;
    SourceLocation location;
};

enum class TypeDeclKind {
    kStruct,
    kEnum,
};

enum class StructShape {
    kNamed,
    kTuple,
    kUnit,
};

struct TypeDecl
{
    TypeDeclKind kind = TypeDeclKind::kStruct;
    std::string name;
    std::string doc;
    StructShape shape = StructShape::kNamed;
    std::vector<FieldDecl> fields;
    std::vector<VariantDecl> variants;
    bool derives_serialize = false;
    bool derives_deserialize = false;
    SourceLocation location;
};

struct ParsedFile
{
    std::string path;
    AliasTable aliases;
    std::vector<FunctionDecl> functions;  ///< file order
    std::vector<TypeDecl> types;          ///< file order
    std::vector<Token> tokens;            ///< backing store for function bodies
};

/**
 * Parse one file.
 * @param path Normalized relative path (used in locations)
 * @param text File contents
 * @return Declarations or the first syntax error
 */
[[nodiscard]] std::expected<ParsedFile, ParseError> parse_source(const std::string& path,
                                                                 std::string_view text);

/**
 * Parse a standalone type expression ("Option<&tauri::Window>").
 */
[[nodiscard]] std::expected<TypeExpr, ParseError> parse_type_text(std::string_view text);

/**
 * Parse a token range as a type expression, consuming as much as forms one type.
 * @param tokens Token buffer
 * @param pos In: start index. Out: index after the type.
 */
[[nodiscard]] std::expected<TypeExpr, ParseError>
parse_type_tokens(const std::vector<Token>& tokens, std::size_t& pos, const std::string& file);

}  // namespace tsgen::syntax
