/**
 * @file type_parser.cpp
 * @brief Type expression grammar
 *
 * Covers paths with generic arguments, references, tuples, slices and
 * arrays. Raw pointers, fn pointers, impl/dyn bounds, the never type and
 * qualified paths are consumed and reported as TypeExpr::Kind::kOther.
 */

#include "tsgen/syntax.hpp"

#include <format>

namespace tsgen::syntax {

namespace {

[[nodiscard]] bool is_word(const Token& token)
{
    return token.kind == TokenKind::kIdent || token.kind == TokenKind::kNumber
           || token.kind == TokenKind::kLifetime;
}

[[nodiscard]] std::string token_spelling(const Token& token)
{
    switch (token.kind) {
        case TokenKind::kLifetime:
            return "'" + token.text;
        case TokenKind::kString:
            return "\"" + token.text + "\"";
        case TokenKind::kChar:
            return "'" + token.text + "'";
        default:
            return token.text;
    }
}

class TypeParser
{
public:
    TypeParser(const std::vector<Token>& tokens, std::size_t& pos, const std::string& file)
        : m_tokens(tokens)
        , m_pos(pos)
        , m_file(file)
    {}

    [[nodiscard]] std::expected<TypeExpr, ParseError> parse() { return parse_type(); }

private:
    using TypeResult = std::expected<TypeExpr, ParseError>;
    using Step = std::expected<void, ParseError>;

    [[nodiscard]] const Token& cur() const { return token_at(m_pos); }
    [[nodiscard]] const Token& peek(std::size_t ahead) const { return token_at(m_pos + ahead); }

    [[nodiscard]] const Token& token_at(std::size_t index) const
    {
        return index < m_tokens.size() ? m_tokens[index] : m_tokens.back();
    }

    void bump()
    {
        if (m_pos + 1 < m_tokens.size()) {
            ++m_pos;
        }
    }

    [[nodiscard]] ParseError error_here(std::string reason) const
    {
        const auto& t = cur();
        return ParseError{.file = m_file, .line = t.line, .column = t.column, .reason = std::move(reason)};
    }

    [[nodiscard]] std::string spelling(std::size_t begin, std::size_t end) const
    {
        std::string out;
        for (std::size_t i = begin; i < end && i < m_tokens.size(); ++i) {
            const auto& t = m_tokens[i];
            if (i > begin) {
                const auto& prev = m_tokens[i - 1];
                if ((is_word(prev) && is_word(t)) || prev.is_punct(",") || t.is_punct("->")
                    || prev.is_punct("->") || t.is_punct("+") || prev.is_punct("+")) {
                    out += ' ';
                }
            }
            out += token_spelling(t);
        }
        return out;
    }

    /// Skip a (), [] or {} group starting at the current opening token.
    void skip_group()
    {
        int depth = 0;
        do {
            const auto& t = cur();
            if (t.kind == TokenKind::kEof) {
                return;
            }
            if (t.is_punct("(") || t.is_punct("[") || t.is_punct("{")) {
                ++depth;
            } else if (t.is_punct(")") || t.is_punct("]") || t.is_punct("}")) {
                --depth;
            }
            bump();
        } while (depth > 0);
    }

    Step skip_angle_group()
    {
        int depth = 0;
        do {
            const auto& t = cur();
            if (t.kind == TokenKind::kEof) {
                return std::unexpected(error_here("unterminated generic argument list"));
            }
            if (t.is_punct("(") || t.is_punct("[") || t.is_punct("{")) {
                skip_group();
                continue;
            }
            if (t.is_punct("<")) {
                ++depth;
            } else if (t.is_punct(">")) {
                --depth;
            }
            bump();
        } while (depth > 0);
        return {};
    }

    [[nodiscard]] static TypeExpr make(TypeExpr::Kind kind)
    {
        TypeExpr expr;
        expr.kind = kind;
        return expr;
    }

    [[nodiscard]] static TypeExpr other() { return make(TypeExpr::Kind::kOther); }

    TypeResult parse_type()
    {
        const std::size_t start = m_pos;
        auto type = parse_type_inner();
        if (type) {
            type->text = spelling(start, m_pos);
        }
        return type;
    }

    TypeResult parse_type_inner()
    {
        const auto& t = cur();
        if (t.is_punct("&")) {
            return parse_reference();
        }
        if (t.is_punct("(")) {
            return parse_tuple();
        }
        if (t.is_punct("[")) {
            return parse_slice_or_array();
        }
        if (t.is_punct("*")) {
            bump();
            if (!cur().is_ident("const") && !cur().is_ident("mut")) {
                return std::unexpected(error_here("expected 'const' or 'mut' after '*'"));
            }
            bump();
            if (auto inner = parse_type(); !inner) {
                return inner;
            }
            return other();
        }
        if (t.is_punct("!")) {
            bump();
            return other();
        }
        if (t.is_punct("<")) {
            if (auto skipped = skip_angle_group(); !skipped) {
                return std::unexpected(skipped.error());
            }
            while (cur().is_punct("::") && peek(1).kind == TokenKind::kIdent) {
                bump();
                bump();
            }
            return other();
        }
        if (t.is_ident("_")) {
            bump();
            return other();
        }
        if (t.is_ident("fn") || t.is_ident("unsafe") || t.is_ident("extern")) {
            return parse_fn_pointer();
        }
        if (t.is_ident("impl") || t.is_ident("dyn")) {
            bump();
            if (auto bounds = parse_bounds(); !bounds) {
                return std::unexpected(bounds.error());
            }
            return other();
        }
        if (t.is_ident("for")) {
            bump();
            if (cur().is_punct("<")) {
                if (auto skipped = skip_angle_group(); !skipped) {
                    return std::unexpected(skipped.error());
                }
            }
            if (auto inner = parse_type(); !inner) {
                return inner;
            }
            return other();
        }
        if (t.is_punct("::") || t.kind == TokenKind::kIdent) {
            return parse_path();
        }
        return std::unexpected(error_here(std::format("expected type, found '{}'", token_spelling(t))));
    }

    TypeResult parse_reference()
    {
        bump();  // &
        if (cur().kind == TokenKind::kLifetime) {
            bump();
        }
        bool is_mut = false;
        if (cur().is_ident("mut")) {
            is_mut = true;
            bump();
        }
        auto inner = parse_type();
        if (!inner) {
            return inner;
        }
        TypeExpr ref = make(TypeExpr::Kind::kReference);
        ref.mutable_ref = is_mut;
        ref.args.push_back(std::move(*inner));
        return ref;
    }

    TypeResult parse_tuple()
    {
        bump();  // (
        TypeExpr tuple = make(TypeExpr::Kind::kTuple);
        bool trailing_comma = false;
        while (!cur().is_punct(")")) {
            auto element = parse_type();
            if (!element) {
                return element;
            }
            tuple.args.push_back(std::move(*element));
            trailing_comma = false;
            if (cur().is_punct(",")) {
                trailing_comma = true;
                bump();
                continue;
            }
            if (!cur().is_punct(")")) {
                return std::unexpected(error_here("expected ',' or ')' in tuple type"));
            }
        }
        bump();  // )
        if (tuple.args.size() == 1 && !trailing_comma) {
            return std::move(tuple.args.front());
        }
        return tuple;
    }

    TypeResult parse_slice_or_array()
    {
        bump();  // [
        auto element = parse_type();
        if (!element) {
            return element;
        }
        TypeExpr seq = make(TypeExpr::Kind::kSlice);
        if (cur().is_punct(";")) {
            seq.kind = TypeExpr::Kind::kArray;
            while (!cur().is_punct("]")) {
                if (cur().kind == TokenKind::kEof) {
                    return std::unexpected(error_here("unterminated array type"));
                }
                if (cur().is_punct("(") || cur().is_punct("[") || cur().is_punct("{")) {
                    skip_group();
                    continue;
                }
                bump();
            }
        }
        if (!cur().is_punct("]")) {
            return std::unexpected(error_here("expected ']' in slice type"));
        }
        bump();
        seq.args.push_back(std::move(*element));
        return seq;
    }

    TypeResult parse_fn_pointer()
    {
        while (cur().is_ident("unsafe") || cur().is_ident("extern")) {
            bump();
            if (cur().kind == TokenKind::kString) {
                bump();
            }
        }
        if (!cur().is_ident("fn")) {
            return std::unexpected(error_here("expected 'fn' in function pointer type"));
        }
        bump();
        if (!cur().is_punct("(")) {
            return std::unexpected(error_here("expected '(' in function pointer type"));
        }
        skip_group();
        if (cur().is_punct("->")) {
            bump();
            if (auto ret = parse_type(); !ret) {
                return ret;
            }
        }
        return other();
    }

    Step parse_bounds()
    {
        while (true) {
            if (cur().is_punct("?")) {
                bump();
            }
            if (cur().kind == TokenKind::kLifetime) {
                bump();
            } else if (cur().is_punct("(")) {
                skip_group();
            } else {
                auto bound = parse_type();
                if (!bound) {
                    return std::unexpected(bound.error());
                }
            }
            if (!cur().is_punct("+")) {
                return {};
            }
            bump();
        }
    }

    TypeResult parse_path()
    {
        TypeExpr path = make(TypeExpr::Kind::kPath);
        if (cur().is_punct("::")) {
            bump();
        }
        while (true) {
            if (cur().kind != TokenKind::kIdent) {
                return std::unexpected(error_here("expected identifier in type path"));
            }
            path.segments.push_back(cur().text);
            bump();

            if (cur().is_punct("::") && peek(1).is_punct("<")) {
                bump();
            }
            if (cur().is_punct("<")) {
                path.args.clear();
                if (auto args = parse_generic_args(path.args); !args) {
                    return std::unexpected(args.error());
                }
            } else if (cur().is_punct("(")) {
                // Fn(A, B) -> C sugar
                skip_group();
                if (cur().is_punct("->")) {
                    bump();
                    if (auto ret = parse_type(); !ret) {
                        return ret;
                    }
                }
            }

            if (cur().is_punct("::") && peek(1).kind == TokenKind::kIdent) {
                bump();
                continue;
            }
            return path;
        }
    }

    Step parse_generic_args(std::vector<TypeExpr>& out)
    {
        bump();  // <
        while (!cur().is_punct(">")) {
            const auto& t = cur();
            if (t.kind == TokenKind::kEof) {
                return std::unexpected(error_here("unterminated generic argument list"));
            }
            if (t.kind == TokenKind::kLifetime) {
                bump();
            } else if (t.kind == TokenKind::kIdent && peek(1).is_punct("=")) {
                bump();
                bump();
                if (auto bound_type = parse_type(); !bound_type) {
                    return std::unexpected(bound_type.error());
                }
            } else if (t.kind == TokenKind::kIdent && peek(1).is_punct(":")) {
                bump();
                bump();
                if (auto bounds = parse_bounds(); !bounds) {
                    return bounds;
                }
            } else if (t.kind == TokenKind::kNumber || t.kind == TokenKind::kString
                       || t.kind == TokenKind::kChar || t.is_ident("true") || t.is_ident("false")) {
                bump();
            } else if (t.is_punct("-")) {
                bump();
                bump();
            } else if (t.is_punct("{")) {
                skip_group();
            } else {
                auto arg = parse_type();
                if (!arg) {
                    return std::unexpected(arg.error());
                }
                out.push_back(std::move(*arg));
            }

            if (cur().is_punct(",")) {
                bump();
                continue;
            }
            if (!cur().is_punct(">")) {
                return std::unexpected(error_here("expected ',' or '>' in generic argument list"));
            }
        }
        bump();  // >
        return {};
    }

    const std::vector<Token>& m_tokens;
    std::size_t& m_pos;
    const std::string& m_file;
};

}  // namespace

std::expected<TypeExpr, ParseError>
parse_type_tokens(const std::vector<Token>& tokens, std::size_t& pos, const std::string& file)
{
    if (tokens.empty()) {
        return std::unexpected(ParseError{.file = file, .line = 0, .column = 0, .reason = "empty token stream"});
    }
    TypeParser parser(tokens, pos, file);
    return parser.parse();
}

std::expected<TypeExpr, ParseError> parse_type_text(std::string_view text)
{
    static const std::string kFile = "<type>";
    auto tokens = tokenize(text, kFile);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    std::size_t pos = 0;
    auto type = parse_type_tokens(*tokens, pos, kFile);
    if (!type) {
        return type;
    }
    const auto& rest = (*tokens)[pos];
    if (rest.kind != TokenKind::kEof) {
        return std::unexpected(ParseError{.file = kFile,
                                          .line = rest.line,
                                          .column = rest.column,
                                          .reason = "unexpected trailing tokens after type"});
    }
    return type;
}

}  // namespace tsgen::syntax
