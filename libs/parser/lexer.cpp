/**
 * @file lexer.cpp
 * @brief Tokenizer for backend sources
 *
 * Produces identifiers, lifetimes, literals, punctuation and outer doc
 * comments. Regular comments and inner doc comments are dropped. Columns are
 * 1-based byte offsets within the line.
 */

#include "tsgen/syntax.hpp"

#include <cctype>
#include <cstdint>
#include <format>
#include <vector>

namespace tsgen::syntax {

namespace {

[[nodiscard]] bool is_ident_start(char c)
{
    const auto u = static_cast<unsigned char>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u >= 0x80;
}

[[nodiscard]] bool is_ident_continue(char c)
{
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

[[nodiscard]] bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Lexer
{
public:
    Lexer(std::string_view text, const std::string& file)
        : m_text(text)
        , m_file(file)
    {}

    [[nodiscard]] std::expected<std::vector<Token>, ParseError> run()
    {
        skip_shebang();
        while (true) {
            skip_whitespace();
            if (at_end()) {
                break;
            }
            if (auto result = lex_one(); !result) {
                return std::unexpected(result.error());
            }
        }
        m_tokens.push_back(Token{.kind = TokenKind::kEof, .text = {}, .line = m_line, .column = m_column});
        if (auto balanced = check_balance(); !balanced) {
            return std::unexpected(balanced.error());
        }
        return std::move(m_tokens);
    }

private:
    using Step = std::expected<void, ParseError>;

    [[nodiscard]] bool at_end() const { return m_pos >= m_text.size(); }

    [[nodiscard]] char peek(std::size_t ahead = 0) const
    {
        return m_pos + ahead < m_text.size() ? m_text[m_pos + ahead] : '\0';
    }

    void advance(std::size_t count = 1)
    {
        for (std::size_t i = 0; i < count && !at_end(); ++i) {
            if (m_text[m_pos] == '\n') {
                ++m_line;
                m_column = 1;
            } else {
                ++m_column;
            }
            ++m_pos;
        }
    }

    [[nodiscard]] ParseError error_at(int line, int column, std::string reason) const
    {
        return ParseError{.file = m_file, .line = line, .column = column, .reason = std::move(reason)};
    }

    void push(TokenKind kind, std::string text, int line, int column)
    {
        m_tokens.push_back(
            Token{.kind = kind, .text = std::move(text), .line = line, .column = column});
    }

    void skip_shebang()
    {
        if (m_text.starts_with("#!") && !m_text.starts_with("#![")) {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        }
    }

    void skip_whitespace()
    {
        while (!at_end()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
                advance();
            } else {
                break;
            }
        }
    }

    Step lex_one()
    {
        const char c = peek();
        if (c == '/' && peek(1) == '/') {
            lex_line_comment();
            return {};
        }
        if (c == '/' && peek(1) == '*') {
            return lex_block_comment();
        }
        if (c == '"') {
            return lex_string(0);
        }
        if (c == '\'') {
            return lex_quote();
        }
        if (is_digit(c)) {
            lex_number();
            return {};
        }
        if (is_ident_start(c)) {
            return lex_word();
        }
        lex_punct();
        return {};
    }

    void lex_line_comment()
    {
        const int line = m_line;
        const int column = m_column;
        const bool is_doc = peek(2) == '/' && peek(3) != '/';
        advance(is_doc ? 3 : 2);
        std::string body;
        while (!at_end() && peek() != '\n') {
            body += peek();
            advance();
        }
        if (is_doc) {
            push(TokenKind::kDocComment, std::move(body), line, column);
        }
    }

    Step lex_block_comment()
    {
        const int line = m_line;
        const int column = m_column;
        // "/**/" and "/***" are plain comments
        const bool is_doc = peek(2) == '*' && peek(3) != '*' && peek(3) != '/';
        advance(2);
        int depth = 1;
        std::string body;
        while (!at_end()) {
            if (peek() == '/' && peek(1) == '*') {
                ++depth;
                body += "/*";
                advance(2);
                continue;
            }
            if (peek() == '*' && peek(1) == '/') {
                --depth;
                advance(2);
                if (depth == 0) {
                    break;
                }
                body += "*/";
                continue;
            }
            body += peek();
            advance();
        }
        if (depth != 0) {
            return std::unexpected(error_at(line, column, "unterminated block comment"));
        }
        if (is_doc) {
            // drop the second '*' of the opener
            push(TokenKind::kDocComment, body.substr(1), line, column);
        }
        return {};
    }

    /// Cooked string literal starting at the opening quote; @p prefix_len bytes of prefix already consumed.
    Step lex_string(int prefix_len)
    {
        const int line = m_line;
        const int column = m_column - prefix_len;
        advance();  // opening quote
        std::string value;
        while (true) {
            if (at_end()) {
                return std::unexpected(error_at(line, column, "unterminated string literal"));
            }
            const char c = peek();
            if (c == '"') {
                advance();
                break;
            }
            if (c == '\\') {
                if (auto escaped = lex_escape(value, line, column); !escaped) {
                    return escaped;
                }
                continue;
            }
            value += c;
            advance();
        }
        push(TokenKind::kString, std::move(value), line, column);
        return {};
    }

    Step lex_escape(std::string& out, int line, int column)
    {
        advance();  // backslash
        if (at_end()) {
            return std::unexpected(error_at(line, column, "unterminated escape sequence"));
        }
        const char e = peek();
        advance();
        switch (e) {
            case 'n':
                out += '\n';
                return {};
            case 't':
                out += '\t';
                return {};
            case 'r':
                out += '\r';
                return {};
            case '0':
                out += '\0';
                return {};
            case '\\':
            case '\'':
            case '"':
                out += e;
                return {};
            case '\n':
                skip_whitespace();
                return {};
            case 'x': {
                std::uint32_t cp = 0;
                for (int i = 0; i < 2 && std::isxdigit(static_cast<unsigned char>(peek())) != 0; ++i) {
                    cp = cp * 16 + hex_value(peek());
                    advance();
                }
                append_utf8(out, cp);
                return {};
            }
            case 'u': {
                if (peek() != '{') {
                    return std::unexpected(error_at(line, column, "malformed unicode escape"));
                }
                advance();
                std::uint32_t cp = 0;
                while (!at_end() && peek() != '}') {
                    if (peek() != '_') {
                        cp = cp * 16 + hex_value(peek());
                    }
                    advance();
                }
                if (at_end()) {
                    return std::unexpected(error_at(line, column, "malformed unicode escape"));
                }
                advance();
                append_utf8(out, cp);
                return {};
            }
            default:
                out += e;
                return {};
        }
    }

    [[nodiscard]] static std::uint32_t hex_value(char c)
    {
        if (c >= '0' && c <= '9') {
            return static_cast<std::uint32_t>(c - '0');
        }
        if (c >= 'a' && c <= 'f') {
            return static_cast<std::uint32_t>(c - 'a' + 10);
        }
        if (c >= 'A' && c <= 'F') {
            return static_cast<std::uint32_t>(c - 'A' + 10);
        }
        return 0;
    }

    /// r"..", r#".."#; positioned on the first '#' or '"' after the prefix.
    Step lex_raw_string(int prefix_len)
    {
        const int line = m_line;
        const int column = m_column - prefix_len;
        std::size_t hashes = 0;
        while (peek() == '#') {
            ++hashes;
            advance();
        }
        if (peek() != '"') {
            return std::unexpected(error_at(line, column, "malformed raw string literal"));
        }
        advance();
        std::string value;
        while (true) {
            if (at_end()) {
                return std::unexpected(error_at(line, column, "unterminated raw string literal"));
            }
            if (peek() == '"') {
                std::size_t closing = 0;
                while (closing < hashes && peek(1 + closing) == '#') {
                    ++closing;
                }
                if (closing == hashes) {
                    advance(1 + hashes);
                    break;
                }
            }
            value += peek();
            advance();
        }
        push(TokenKind::kString, std::move(value), line, column);
        return {};
    }

    /// Lifetime ('a) or character literal ('a', '\n', 'é').
    Step lex_quote()
    {
        const int line = m_line;
        const int column = m_column;
        if (peek(1) == '\\') {
            advance();
            std::string value;
            if (auto escaped = lex_escape(value, line, column); !escaped) {
                return escaped;
            }
            if (peek() != '\'') {
                return std::unexpected(error_at(line, column, "unterminated character literal"));
            }
            advance();
            push(TokenKind::kChar, std::move(value), line, column);
            return {};
        }
        // length of the UTF-8 sequence after the quote
        const auto lead = static_cast<unsigned char>(peek(1));
        std::size_t width = 1;
        if (lead >= 0xF0) {
            width = 4;
        } else if (lead >= 0xE0) {
            width = 3;
        } else if (lead >= 0xC0) {
            width = 2;
        }
        if (lead != 0 && lead != '\'' && peek(1 + width) == '\'') {
            std::string value(m_text.substr(m_pos + 1, width));
            advance(2 + width);
            push(TokenKind::kChar, std::move(value), line, column);
            return {};
        }
        if (is_ident_start(peek(1))) {
            advance();
            std::string name;
            while (!at_end() && is_ident_continue(peek())) {
                name += peek();
                advance();
            }
            push(TokenKind::kLifetime, std::move(name), line, column);
            return {};
        }
        return std::unexpected(error_at(line, column, "unterminated character literal"));
    }

    void lex_number()
    {
        const int line = m_line;
        const int column = m_column;
        std::string text;
        const auto take_run = [this, &text] {
            while (!at_end() && (is_ident_continue(peek()))) {
                text += peek();
                advance();
            }
        };
        take_run();
        if (peek() == '.' && is_digit(peek(1))) {
            text += '.';
            advance();
            take_run();
        }
        push(TokenKind::kNumber, std::move(text), line, column);
    }

    Step lex_word()
    {
        const int line = m_line;
        const int column = m_column;
        const char c0 = peek();
        const char c1 = peek(1);
        const char c2 = peek(2);

        // literal prefixes: b"..", b'..', br"..", r"..", r#"..", c"..", cr".."
        if ((c0 == 'b' || c0 == 'c') && c1 == '"') {
            advance();
            return lex_string(1);
        }
        if (c0 == 'b' && c1 == '\'') {
            advance();
            return lex_quote();
        }
        if ((c0 == 'b' || c0 == 'c') && c1 == 'r' && (c2 == '"' || c2 == '#')) {
            advance(2);
            return lex_raw_string(2);
        }
        if (c0 == 'r' && (c1 == '"' || (c1 == '#' && (c2 == '"' || c2 == '#')))) {
            advance();
            return lex_raw_string(1);
        }
        if (c0 == 'r' && c1 == '#' && is_ident_start(c2)) {
            advance(2);  // raw identifier
        }

        std::string word;
        while (!at_end() && is_ident_continue(peek())) {
            word += peek();
            advance();
        }
        push(TokenKind::kIdent, std::move(word), line, column);
        return {};
    }

    void lex_punct()
    {
        const int line = m_line;
        const int column = m_column;
        const char c0 = peek();
        const char c1 = peek(1);
        if ((c0 == ':' && c1 == ':') || (c0 == '-' && c1 == '>') || (c0 == '=' && c1 == '>')) {
            advance(2);
            push(TokenKind::kPunct, std::string{c0, c1}, line, column);
            return;
        }
        advance();
        push(TokenKind::kPunct, std::string(1, c0), line, column);
    }

    Step check_balance() const
    {
        struct Open
        {
            char delimiter;
            int line;
            int column;
        };
        std::vector<Open> stack;
        for (const auto& token : m_tokens) {
            if (token.kind != TokenKind::kPunct || token.text.size() != 1) {
                continue;
            }
            const char c = token.text[0];
            if (c == '(' || c == '[' || c == '{') {
                stack.push_back(Open{.delimiter = c, .line = token.line, .column = token.column});
                continue;
            }
            if (c != ')' && c != ']' && c != '}') {
                continue;
            }
            const char expected_open = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back().delimiter != expected_open) {
                return std::unexpected(error_at(
                    token.line, token.column, std::format("unbalanced delimiter '{}'", c)));
            }
            stack.pop_back();
        }
        if (!stack.empty()) {
            const auto& open = stack.back();
            return std::unexpected(error_at(
                open.line, open.column, std::format("unclosed delimiter '{}'", open.delimiter)));
        }
        return {};
    }

    std::string_view m_text;
    const std::string& m_file;
    std::size_t m_pos = 0;
    int m_line = 1;
    int m_column = 1;
    std::vector<Token> m_tokens;
};

}  // namespace

std::expected<std::vector<Token>, ParseError> tokenize(std::string_view text, const std::string& file)
{
    Lexer lexer(text, file);
    return lexer.run();
}

}  // namespace tsgen::syntax
