/**
 * @file parser.cpp
 * @brief Top-level item parser
 *
 * Retained items: `use` trees (alias table), functions (top level and inside
 * `impl` blocks), structs and enums. Everything else is skipped as one
 * balanced token run. The lexer has already verified delimiter balance, so
 * matching-delimiter lookups cannot fail.
 */

#include "tsgen/syntax.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace tsgen::syntax {

namespace {

struct Range
{
    std::size_t begin;
    std::size_t end;
};

[[nodiscard]] std::string trim(std::string_view input)
{
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(first, last - first + 1));
}

/// Doc comment token bodies -> one doc string (lines trimmed, '*' gutters removed).
[[nodiscard]] std::string join_doc_lines(const std::vector<std::string>& raw)
{
    std::vector<std::string> lines;
    for (const auto& chunk : raw) {
        for (auto part : chunk | std::views::split('\n')) {
            std::string line = trim(std::string_view(part.begin(), part.end()));
            // block doc comments carry a '*' gutter on continuation lines
            if (chunk.find('\n') != std::string::npos && line.starts_with('*')) {
                line = trim(std::string_view(line).substr(1));
            }
            lines.push_back(std::move(line));
        }
    }
    while (!lines.empty() && lines.front().empty()) {
        lines.erase(lines.begin());
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    std::string doc;
    for (auto [i, line] : std::views::enumerate(lines)) {
        if (i > 0) {
            doc += '\n';
        }
        doc += line;
    }
    return doc;
}

class Parser
{
public:
    explicit Parser(ParsedFile& out)
        : m_out(out)
        , m_tokens(out.tokens)
        , m_match(compute_matches(out.tokens))
    {}

    [[nodiscard]] std::expected<void, ParseError> run()
    {
        return parse_items(false, m_tokens.size() - 1);
    }

private:
    using Step = std::expected<void, ParseError>;

    struct Preamble
    {
        std::vector<std::string> doc_chunks;
        std::vector<Attribute> attributes;
    };

    [[nodiscard]] static std::vector<std::size_t> compute_matches(const std::vector<Token>& tokens)
    {
        std::vector<std::size_t> match(tokens.size(), 0);
        std::vector<std::size_t> stack;
        for (auto [i, t] : std::views::enumerate(tokens)) {
            if (t.kind != TokenKind::kPunct) {
                continue;
            }
            const auto index = static_cast<std::size_t>(i);
            if (t.text == "(" || t.text == "[" || t.text == "{") {
                stack.push_back(index);
            } else if ((t.text == ")" || t.text == "]" || t.text == "}") && !stack.empty()) {
                match[stack.back()] = index;
                match[index] = stack.back();
                stack.pop_back();
            }
        }
        return match;
    }

    [[nodiscard]] const Token& at(std::size_t index) const
    {
        return index < m_tokens.size() ? m_tokens[index] : m_tokens.back();
    }
    [[nodiscard]] const Token& cur() const { return at(m_pos); }
    [[nodiscard]] const Token& peek(std::size_t ahead) const { return at(m_pos + ahead); }

    void bump()
    {
        if (m_pos + 1 < m_tokens.size()) {
            ++m_pos;
        }
    }

    [[nodiscard]] bool is_open(const Token& t) const
    {
        return t.is_punct("(") || t.is_punct("[") || t.is_punct("{");
    }

    /// Current token is an opening delimiter: move past its partner.
    void skip_group() { m_pos = m_match[m_pos] + 1; }

    [[nodiscard]] SourceLocation location_of(const Token& t) const
    {
        return SourceLocation{.file = m_out.path, .line = t.line, .column = t.column};
    }

    [[nodiscard]] ParseError error_at(const Token& t, std::string reason) const
    {
        return ParseError{.file = m_out.path, .line = t.line, .column = t.column, .reason = std::move(reason)};
    }

    /// Split [begin, end) at top-level commas; angle brackets count as nesting
    /// until a top-level '=' starts an expression (`A = 1 << 0`).
    [[nodiscard]] std::vector<Range> split_commas(std::size_t begin, std::size_t end) const
    {
        std::vector<Range> parts;
        std::size_t start = begin;
        int angle = 0;
        bool in_expression = false;
        for (std::size_t i = begin; i < end; ++i) {
            const auto& t = m_tokens[i];
            if (is_open(t)) {
                i = m_match[i];
                continue;
            }
            if (t.is_punct(",") && angle == 0) {
                parts.push_back(Range{.begin = start, .end = i});
                start = i + 1;
                in_expression = false;
            } else if (in_expression) {
                continue;
            } else if (t.is_punct("=") && angle == 0) {
                in_expression = true;
            } else if (t.is_punct("<")) {
                ++angle;
            } else if (t.is_punct(">") && angle > 0) {
                --angle;
            }
        }
        if (start < end) {
            parts.push_back(Range{.begin = start, .end = end});
        }
        return parts;
    }

    // ------------------------------------------------------------------------
    // Item loop
    // ------------------------------------------------------------------------

    Step parse_items(bool in_impl, std::size_t end)
    {
        while (m_pos < end && cur().kind != TokenKind::kEof) {
            if (cur().is_punct("}")) {
                return std::unexpected(error_at(cur(), "unbalanced delimiter '}'"));
            }
            Preamble preamble;
            if (auto step = parse_preamble(preamble, end); !step) {
                return step;
            }
            if (m_pos >= end) {
                break;
            }
            if (cur().is_punct(";")) {
                bump();
                continue;
            }
            if (auto step = parse_item(std::move(preamble), in_impl); !step) {
                return step;
            }
        }
        return {};
    }

    Step parse_preamble(Preamble& preamble, std::size_t end)
    {
        while (m_pos < end) {
            const auto& t = cur();
            if (t.kind == TokenKind::kDocComment) {
                preamble.doc_chunks.push_back(t.text);
                bump();
                continue;
            }
            if (t.is_punct("#") && peek(1).is_punct("!") && peek(2).is_punct("[")) {
                bump();
                bump();
                skip_group();
                continue;
            }
            if (t.is_punct("#") && peek(1).is_punct("[")) {
                bump();
                auto attribute = parse_attribute();
                if (attribute.path == "doc" && !attribute.tokens.empty()
                    && attribute.tokens.back().kind == TokenKind::kString) {
                    preamble.doc_chunks.push_back(attribute.tokens.back().text);
                }
                preamble.attributes.push_back(std::move(attribute));
                continue;
            }
            break;
        }
        return {};
    }

    /// Positioned on '['; returns with m_pos after ']'.
    [[nodiscard]] Attribute parse_attribute()
    {
        const std::size_t open = m_pos;
        const std::size_t close = m_match[open];
        Attribute attribute;
        std::size_t i = open + 1;
        if (at(i).is_ident("unsafe") && at(i + 1).is_punct("(")) {
            i += 2;
        }
        while (i < close) {
            const auto& t = m_tokens[i];
            if (t.kind == TokenKind::kIdent) {
                attribute.path += t.text;
                ++i;
            } else if (t.is_punct("::")) {
                attribute.path += "::";
                ++i;
            } else {
                break;
            }
        }
        if (i < close && m_tokens[i].is_punct("(")) {
            const std::size_t args_close = m_match[i];
            attribute.tokens.assign(m_tokens.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                    m_tokens.begin() + static_cast<std::ptrdiff_t>(args_close));
        } else if (i < close && m_tokens[i].is_punct("=")) {
            attribute.tokens.assign(m_tokens.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                    m_tokens.begin() + static_cast<std::ptrdiff_t>(close));
        }
        m_pos = close + 1;
        return attribute;
    }

    void skip_visibility()
    {
        if (cur().is_ident("pub")) {
            bump();
            if (cur().is_punct("(")) {
                skip_group();
            }
        }
    }

    /// Skip one unretained item: up to and including ';' or a brace-delimited body.
    void skip_item()
    {
        while (cur().kind != TokenKind::kEof) {
            const auto& t = cur();
            if (t.is_punct(";")) {
                bump();
                return;
            }
            if (t.is_punct("{")) {
                skip_group();
                return;
            }
            if (t.is_punct("}")) {
                return;
            }
            if (is_open(t)) {
                skip_group();
                continue;
            }
            bump();
        }
    }

    Step parse_item(Preamble preamble, bool in_impl)
    {
        skip_visibility();

        bool is_async = false;
        while (true) {
            const auto& t = cur();
            const auto& next = peek(1);
            if (t.is_ident("async") || t.is_ident("unsafe") || t.is_ident("default")) {
                is_async = is_async || t.text == "async";
                bump();
                continue;
            }
            if (t.is_ident("const") && (next.is_ident("fn") || next.is_ident("async")
                                        || next.is_ident("unsafe") || next.is_ident("extern"))) {
                bump();
                continue;
            }
            if (t.is_ident("extern") && next.kind == TokenKind::kString && peek(2).is_ident("fn")) {
                bump();
                bump();
                continue;
            }
            if (t.is_ident("extern") && next.is_ident("fn")) {
                bump();
                continue;
            }
            break;
        }

        const auto& keyword = cur();
        if (keyword.is_ident("fn")) {
            return parse_function(std::move(preamble), is_async, in_impl);
        }
        if (!in_impl && keyword.is_ident("struct")) {
            return parse_struct(std::move(preamble));
        }
        if (!in_impl && keyword.is_ident("enum")) {
            return parse_enum(std::move(preamble));
        }
        if (!in_impl && keyword.is_ident("use")) {
            return parse_use();
        }
        if (!in_impl && keyword.is_ident("impl")) {
            return parse_impl();
        }
        skip_item();
        return {};
    }

    // ------------------------------------------------------------------------
    // use trees
    // ------------------------------------------------------------------------

    void bind_alias(const std::string& alias, std::vector<std::string> path)
    {
        if (alias.empty() || alias == "_" || path.empty()) {
            return;
        }
        // expand a leading segment that is itself an alias (use tauri::ipc; use ipc::Response;)
        if (auto it = m_out.aliases.find(path.front()); it != m_out.aliases.end() && path.size() > 1) {
            std::vector<std::string> expanded;
            for (auto part : it->second | std::views::split(std::string_view("::"))) {
                expanded.emplace_back(part.begin(), part.end());
            }
            expanded.insert(expanded.end(), path.begin() + 1, path.end());
            path = std::move(expanded);
        }
        std::string joined;
        for (auto [i, segment] : std::views::enumerate(path)) {
            if (i > 0) {
                joined += "::";
            }
            joined += segment;
        }
        m_out.aliases.insert_or_assign(alias, std::move(joined));
    }

    Step parse_use_tree(std::vector<std::string> prefix, std::size_t end)
    {
        if (m_pos < end && cur().is_punct("::")) {
            bump();
        }
        while (m_pos < end) {
            const auto& t = cur();
            if (t.is_punct("{")) {
                const std::size_t close = m_match[m_pos];
                for (const auto& part : split_commas(m_pos + 1, close)) {
                    m_pos = part.begin;
                    if (auto step = parse_use_tree(prefix, part.end); !step) {
                        return step;
                    }
                }
                m_pos = close + 1;
                return {};
            }
            if (t.is_punct("*")) {
                bump();
                return {};
            }
            if (t.kind != TokenKind::kIdent) {
                return std::unexpected(error_at(t, "malformed use declaration"));
            }
            prefix.push_back(t.text);
            bump();
            if (m_pos < end && cur().is_punct("::")) {
                bump();
                continue;
            }
            break;
        }
        if (prefix.empty()) {
            return {};
        }

        std::string alias = prefix.back();
        if (m_pos < end && cur().is_ident("as")) {
            bump();
            if (cur().kind != TokenKind::kIdent) {
                return std::unexpected(error_at(cur(), "expected identifier after 'as'"));
            }
            alias = cur().text;
            bump();
        }
        if (prefix.back() == "self") {
            prefix.pop_back();
            if (alias == "self") {
                alias = prefix.empty() ? std::string{} : prefix.back();
            }
        }
        bind_alias(alias, std::move(prefix));
        return {};
    }

    Step parse_use()
    {
        bump();  // use
        std::size_t end = m_pos;
        while (end < m_tokens.size() - 1 && !m_tokens[end].is_punct(";")) {
            end = is_open(m_tokens[end]) ? m_match[end] + 1 : end + 1;
        }
        if (auto step = parse_use_tree({}, end); !step) {
            return step;
        }
        m_pos = end;
        if (cur().is_punct(";")) {
            bump();
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // impl blocks
    // ------------------------------------------------------------------------

    Step parse_impl()
    {
        bump();  // impl
        while (cur().kind != TokenKind::kEof) {
            if (cur().is_punct(";")) {
                bump();
                return {};
            }
            if (cur().is_punct("{")) {
                const std::size_t close = m_match[m_pos];
                bump();
                if (auto step = parse_items(true, close); !step) {
                    return step;
                }
                m_pos = close + 1;
                return {};
            }
            if (is_open(cur())) {
                skip_group();
                continue;
            }
            bump();
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // functions
    // ------------------------------------------------------------------------

    Step skip_generics()
    {
        if (!cur().is_punct("<")) {
            return {};
        }
        int depth = 0;
        do {
            const auto& t = cur();
            if (t.kind == TokenKind::kEof) {
                return std::unexpected(error_at(t, "unterminated generic parameter list"));
            }
            if (is_open(t)) {
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

    /// where-clauses end at the body, a ';' or (for tuple structs) never start.
    void skip_where_clause()
    {
        if (!cur().is_ident("where")) {
            return;
        }
        while (cur().kind != TokenKind::kEof && !cur().is_punct("{") && !cur().is_punct(";")) {
            if (is_open(cur())) {
                skip_group();
                continue;
            }
            bump();
        }
    }

    static void apply_command_marker(FunctionDecl& fn)
    {
        for (const auto& attribute : fn.attributes) {
            if (attribute.path != "tauri::command" && attribute.path != "command") {
                continue;
            }
            fn.is_command = true;
            const auto& args = attribute.tokens;
            for (std::size_t i = 0; i + 2 < args.size(); ++i) {
                if (args[i].is_ident("rename_all") && args[i + 1].is_punct("=")
                    && args[i + 2].kind == TokenKind::kString) {
                    fn.rename_all = args[i + 2].text;
                }
            }
        }
    }

    Step parse_param(const Range& range, FunctionDecl& fn)
    {
        std::size_t i = range.begin;
        while (i < range.end && m_tokens[i].is_punct("#") && at(i + 1).is_punct("[")) {
            i = m_match[i + 1] + 1;
        }
        if (i >= range.end) {
            return {};
        }

        std::size_t colon = range.end;
        for (std::size_t j = i; j < range.end; ++j) {
            if (is_open(m_tokens[j])) {
                j = m_match[j];
                continue;
            }
            if (m_tokens[j].is_punct(":")) {
                colon = j;
                break;
            }
        }

        std::vector<const Token*> pattern;
        for (std::size_t j = i; j < colon; ++j) {
            pattern.push_back(&m_tokens[j]);
        }
        if (std::ranges::any_of(pattern, [](const Token* t) { return t->is_ident("self"); })) {
            fn.has_self = true;
            return {};
        }
        if (colon == range.end) {
            return std::unexpected(error_at(m_tokens[i], "expected ':' in function parameter"));
        }

        std::string name;
        std::vector<const Token*> bindings;
        for (const auto* t : pattern) {
            if (!t->is_ident("mut") && !t->is_ident("ref")) {
                bindings.push_back(t);
            }
        }
        if (bindings.size() == 1 && bindings.front()->kind == TokenKind::kIdent) {
            name = bindings.front()->text;
        } else {
            for (const auto* t : pattern) {
                name += t->text;
            }
        }

        std::size_t pos = colon + 1;
        auto type = parse_type_tokens(m_tokens, pos, m_out.path);
        if (!type) {
            return std::unexpected(type.error());
        }
        if (pos != range.end) {
            return std::unexpected(error_at(m_tokens[pos], "unexpected token after parameter type"));
        }
        fn.params.push_back(FnParam{.name = std::move(name),
                                    .type = std::move(*type),
                                    .location = location_of(m_tokens[i])});
        return {};
    }

    Step parse_function(Preamble preamble, bool is_async, bool in_impl)
    {
        const Token& fn_token = cur();
        bump();  // fn
        if (cur().kind != TokenKind::kIdent) {
            return std::unexpected(error_at(cur(), "expected function name after 'fn'"));
        }
        FunctionDecl fn;
        fn.name = cur().text;
        fn.location = location_of(fn_token);
        fn.doc = join_doc_lines(preamble.doc_chunks);
        fn.attributes = std::move(preamble.attributes);
        fn.is_async = is_async;
        fn.in_impl = in_impl;
        if (!in_impl) {
            apply_command_marker(fn);
        }
        bump();

        if (auto step = skip_generics(); !step) {
            return step;
        }
        if (!cur().is_punct("(")) {
            return std::unexpected(
                error_at(cur(), std::format("expected parameter list for function '{}'", fn.name)));
        }
        const std::size_t close = m_match[m_pos];
        for (const auto& part : split_commas(m_pos + 1, close)) {
            if (auto step = parse_param(part, fn); !step) {
                return step;
            }
        }
        m_pos = close + 1;

        if (cur().is_punct("->")) {
            bump();
            auto ret = parse_type_tokens(m_tokens, m_pos, m_out.path);
            if (!ret) {
                return std::unexpected(ret.error());
            }
            fn.return_type = std::move(*ret);
        }
        skip_where_clause();

        if (cur().is_punct("{")) {
            fn.body_begin = m_pos + 1;
            fn.body_end = m_match[m_pos];
            skip_group();
        } else if (cur().is_punct(";")) {
            fn.body_begin = fn.body_end = m_pos;
            bump();
        } else {
            return std::unexpected(
                error_at(cur(), std::format("expected body for function '{}'", fn.name)));
        }
        m_out.functions.push_back(std::move(fn));
        return {};
    }

    // ------------------------------------------------------------------------
    // structs and enums
    // ------------------------------------------------------------------------

    static void apply_derives(const std::vector<Attribute>& attributes, TypeDecl& decl)
    {
        const auto scan = [&decl](const std::vector<Token>& tokens, std::size_t begin) {
            for (std::size_t i = begin; i < tokens.size(); ++i) {
                if (tokens[i].is_punct(")")) {
                    return;
                }
                if (tokens[i].kind != TokenKind::kIdent) {
                    continue;
                }
                if (i + 1 < tokens.size() && tokens[i + 1].is_punct("::")) {
                    continue;
                }
                decl.derives_serialize = decl.derives_serialize || tokens[i].text == "Serialize";
                decl.derives_deserialize =
                    decl.derives_deserialize || tokens[i].text == "Deserialize";
            }
        };
        for (const auto& attribute : attributes) {
            if (attribute.path == "derive") {
                scan(attribute.tokens, 0);
                continue;
            }
            // cfg_attr(..., derive(...))
            for (std::size_t i = 0; i + 1 < attribute.tokens.size(); ++i) {
                if (attribute.tokens[i].is_ident("derive") && attribute.tokens[i + 1].is_punct("(")) {
                    scan(attribute.tokens, i + 2);
                }
            }
        }
    }

    Step parse_field(const Range& range, std::size_t index, bool named, std::vector<FieldDecl>& out)
    {
        m_pos = range.begin;
        Preamble preamble;
        if (auto step = parse_preamble(preamble, range.end); !step) {
            return step;
        }
        if (m_pos >= range.end) {
            return {};
        }
        skip_visibility();

        FieldDecl field;
        field.doc = join_doc_lines(preamble.doc_chunks);
        field.location = location_of(cur());
        if (named) {
            if (cur().kind != TokenKind::kIdent || !peek(1).is_punct(":")) {
                return std::unexpected(error_at(cur(), "expected field name"));
            }
            field.name = cur().text;
            bump();
            bump();
        } else {
            field.name = std::to_string(index);
        }
        auto type = parse_type_tokens(m_tokens, m_pos, m_out.path);
        if (!type) {
            return std::unexpected(type.error());
        }
        // `field: T = default` (default field values) ends the field early
        if (m_pos != range.end && !cur().is_punct("=")) {
            return std::unexpected(error_at(cur(), "unexpected token after field type"));
        }
        field.type = std::move(*type);
        out.push_back(std::move(field));
        return {};
    }

    Step parse_field_group(bool named, std::vector<FieldDecl>& out)
    {
        const std::size_t close = m_match[m_pos];
        for (const auto& part : split_commas(m_pos + 1, close)) {
            if (auto step = parse_field(part, out.size(), named, out); !step) {
                return step;
            }
        }
        m_pos = close + 1;
        return {};
    }

    Step parse_struct(Preamble preamble)
    {
        const Token& keyword = cur();
        bump();  // struct
        if (cur().kind != TokenKind::kIdent) {
            return std::unexpected(error_at(cur(), "expected identifier after 'struct'"));
        }
        TypeDecl decl;
        decl.kind = TypeDeclKind::kStruct;
        decl.name = cur().text;
        decl.doc = join_doc_lines(preamble.doc_chunks);
        decl.location = location_of(keyword);
        apply_derives(preamble.attributes, decl);
        bump();

        if (auto step = skip_generics(); !step) {
            return step;
        }
        skip_where_clause();
        if (cur().is_punct("{")) {
            decl.shape = StructShape::kNamed;
            if (auto step = parse_field_group(true, decl.fields); !step) {
                return step;
            }
        } else if (cur().is_punct("(")) {
            decl.shape = StructShape::kTuple;
            if (auto step = parse_field_group(false, decl.fields); !step) {
                return step;
            }
            skip_where_clause();
            if (!cur().is_punct(";")) {
                return std::unexpected(
                    error_at(cur(), std::format("expected ';' after tuple struct '{}'", decl.name)));
            }
            bump();
        } else if (cur().is_punct(";")) {
            decl.shape = StructShape::kUnit;
            bump();
        } else {
            return std::unexpected(
                error_at(cur(), std::format("expected body for struct '{}'", decl.name)));
        }
        m_out.types.push_back(std::move(decl));
        return {};
    }

    Step parse_variant(const Range& range, std::vector<VariantDecl>& out)
    {
        m_pos = range.begin;
        Preamble preamble;
        if (auto step = parse_preamble(preamble, range.end); !step) {
            return step;
        }
        if (m_pos >= range.end) {
            return {};
        }
        if (cur().kind != TokenKind::kIdent) {
            return std::unexpected(error_at(cur(), "expected variant name"));
        }
        VariantDecl variant;
        variant.name = cur().text;
        variant.doc = join_doc_lines(preamble.doc_chunks);
        variant.location = location_of(cur());
        bump();
        if (m_pos < range.end && cur().is_punct("{")) {
            variant.shape = VariantShape::kStruct;
            if (auto step = parse_field_group(true, variant.fields); !step) {
                return step;
            }
        } else if (m_pos < range.end && cur().is_punct("(")) {
            variant.shape = VariantShape::kTuple;
            if (auto step = parse_field_group(false, variant.fields); !step) {
                return step;
            }
        }
        // explicit discriminants are not part of the serialized shape
        out.push_back(std::move(variant));
        return {};
    }

    Step parse_enum(Preamble preamble)
    {
        const Token& keyword = cur();
        bump();  // enum
        if (cur().kind != TokenKind::kIdent) {
            return std::unexpected(error_at(cur(), "expected identifier after 'enum'"));
        }
        TypeDecl decl;
        decl.kind = TypeDeclKind::kEnum;
        decl.name = cur().text;
        decl.doc = join_doc_lines(preamble.doc_chunks);
        decl.location = location_of(keyword);
        apply_derives(preamble.attributes, decl);
        bump();

        if (auto step = skip_generics(); !step) {
            return step;
        }
        skip_where_clause();
        if (!cur().is_punct("{")) {
            return std::unexpected(
                error_at(cur(), std::format("expected body for enum '{}'", decl.name)));
        }
        const std::size_t close = m_match[m_pos];
        for (const auto& part : split_commas(m_pos + 1, close)) {
            if (auto step = parse_variant(part, decl.variants); !step) {
                return step;
            }
        }
        m_pos = close + 1;
        m_out.types.push_back(std::move(decl));
        return {};
    }

    ParsedFile& m_out;
    const std::vector<Token>& m_tokens;
    std::vector<std::size_t> m_match;
    std::size_t m_pos = 0;
};

}  // namespace

std::expected<ParsedFile, ParseError> parse_source(const std::string& path, std::string_view text)
{
    auto tokens = tokenize(text, path);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    ParsedFile parsed;
    parsed.path = path;
    parsed.tokens = std::move(*tokens);

    Parser parser(parsed);
    if (auto result = parser.run(); !result) {
        return std::unexpected(result.error());
    }
    return parsed;
}

}  // namespace tsgen::syntax
