/**
 * @file event_detector.cpp
 * @brief Detection of `emit` / `emit_to` broadcast sites in function bodies
 *
 * The detector works on the token range of each body. Receivers are
 * followed backwards as a method chain (`app.get_webview_window("main")
 * .unwrap().emit(..)`) and resolved through parameters and `let` bindings.
 */

#include "tsgen/events.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <ranges>
#include <utility>

namespace tsgen::events {

namespace {

using syntax::Token;
using syntax::TokenKind;
using types::TypeDescriptor;

constexpr std::size_t kNpos = static_cast<std::size_t>(-1);
constexpr int kMaxBindingDepth = 8;

constexpr std::string_view kEmit = "emit";
constexpr std::string_view kEmitTo = "emit_to";

[[nodiscard]] bool is_window_lookup(std::string_view name)
{
    return name == "get_webview_window" || name == "get_window" || name == "get_webview";
}

/// Half-open token range inside a body.
struct Span
{
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t size() const { return end - begin; }
    [[nodiscard]] bool empty() const { return begin >= end; }
};

/// One link of a method chain: `name` or `name(args)`.
struct ChainLink
{
    std::string name;
    std::size_t open = kNpos;  ///< index of '(' for calls
    std::size_t close = kNpos;

    [[nodiscard]] bool is_call() const { return open != kNpos; }
};

struct LocalBinding
{
    std::string name;
    std::size_t position = 0;  ///< index of the 'let' token
    std::optional<syntax::TypeExpr> type;
    Span init;
};

enum class ScopeOutcome {
    kResolved,
    kSkipped,  ///< a warning has been recorded
    kUnresolved,
};

struct ScopeResolution
{
    ScopeOutcome outcome = ScopeOutcome::kUnresolved;
    EventScope scope;
};

/**
 * @brief Token view of one function body with delimiter matching and locals
 */
class FunctionBody
{
public:
    FunctionBody(const std::vector<Token>& tokens, std::size_t begin, std::size_t end)
        : m_tokens(tokens)
        , m_begin(begin)
        , m_end(end)
        , m_match(end - begin, kNpos)
    {
        std::vector<std::size_t> stack;
        for (std::size_t i = begin; i < end; ++i) {
            const Token& t = tokens[i];
            if (t.kind != TokenKind::kPunct) {
                continue;
            }
            if (t.text == "(" || t.text == "[" || t.text == "{") {
                stack.push_back(i);
            } else if ((t.text == ")" || t.text == "]" || t.text == "}") && !stack.empty()) {
                const auto open = stack.back();
                stack.pop_back();
                m_match[open - begin] = i;
                m_match[i - begin] = open;
            }
        }
        collect_bindings();
    }

    [[nodiscard]] std::size_t begin() const { return m_begin; }
    [[nodiscard]] std::size_t end() const { return m_end; }
    [[nodiscard]] const Token& at(std::size_t i) const { return m_tokens[i]; }

    [[nodiscard]] std::size_t match(std::size_t i) const
    {
        if (i < m_begin || i >= m_end) {
            return kNpos;
        }
        return m_match[i - m_begin];
    }

    [[nodiscard]] bool is_punct(std::size_t i, std::string_view text) const
    {
        return i >= m_begin && i < m_end && m_tokens[i].is_punct(text);
    }

    [[nodiscard]] bool is_ident(std::size_t i) const
    {
        return i >= m_begin && i < m_end && m_tokens[i].kind == TokenKind::kIdent;
    }

    /// Split the contents of a call at top-level commas.
    [[nodiscard]] std::vector<Span> arguments(std::size_t open, std::size_t close) const
    {
        std::vector<Span> args;
        std::size_t start = open + 1;
        for (std::size_t i = open + 1; i < close; ++i) {
            if (const auto m = match(i); m != kNpos && m > i) {
                i = m;
                continue;
            }
            if (m_tokens[i].is_punct(",")) {
                args.push_back(Span{.begin = start, .end = i});
                start = i + 1;
            }
        }
        if (start < close) {
            args.push_back(Span{.begin = start, .end = close});
        }
        return args;
    }

    /// Latest binding of @p name introduced before @p position.
    [[nodiscard]] const LocalBinding* binding(const std::string& name, std::size_t position) const
    {
        const LocalBinding* found = nullptr;
        for (const auto& local : m_bindings) {
            if (local.position >= position) {
                break;
            }
            if (local.name == name) {
                found = &local;
            }
        }
        return found;
    }

    [[nodiscard]] std::string spell(Span span) const
    {
        std::string out;
        for (std::size_t i = span.begin; i < span.end; ++i) {
            const Token& t = m_tokens[i];
            const bool word = t.kind != TokenKind::kPunct;
            if (i > span.begin && word && m_tokens[i - 1].kind != TokenKind::kPunct) {
                out += ' ';
            }
            out += t.kind == TokenKind::kString ? std::format("\"{}\"", t.text) : t.text;
        }
        return out;
    }

private:
    /// `let [mut] x [: T] = init;` and `let Some(x) = init {` / `let Ok(x) = init else`
    void collect_bindings()
    {
        for (std::size_t i = m_begin; i < m_end; ++i) {
            if (!m_tokens[i].is_ident("let")) {
                continue;
            }
            std::size_t pos = i + 1;
            bool unwrapped = false;
            if (is_ident(pos) && (at(pos).text == "Some" || at(pos).text == "Ok")
                && is_punct(pos + 1, "(")) {
                unwrapped = true;
                pos += 2;
            }
            if (is_ident(pos) && at(pos).text == "mut") {
                ++pos;
            }
            if (!is_ident(pos)) {
                continue;
            }
            LocalBinding local{.name = at(pos).text, .position = i};
            ++pos;
            if (unwrapped) {
                if (!is_punct(pos, ")")) {
                    continue;
                }
                ++pos;
            }
            if (is_punct(pos, ":")) {
                ++pos;
                auto type = syntax::parse_type_tokens(m_tokens, pos, std::string{});
                if (type.has_value()) {
                    local.type = std::move(*type);
                }
            }
            if (is_punct(pos, "=")) {
                local.init = Span{.begin = pos + 1, .end = statement_end(pos + 1, unwrapped)};
            }
            m_bindings.push_back(std::move(local));
        }
    }

    [[nodiscard]] std::size_t statement_end(std::size_t pos, bool stop_at_block) const
    {
        for (std::size_t i = pos; i < m_end; ++i) {
            const Token& t = m_tokens[i];
            if (t.is_punct(";") || (stop_at_block && (t.is_punct("{") || t.is_ident("else")))) {
                return i;
            }
            if (t.is_punct("}") && match(i) < pos) {
                return i;  // end of the enclosing block
            }
            if (const auto m = match(i); m != kNpos && m > i) {
                i = m;
            }
        }
        return m_end;
    }

    const std::vector<Token>& m_tokens;
    std::size_t m_begin;
    std::size_t m_end;
    std::vector<std::size_t> m_match;
    std::vector<LocalBinding> m_bindings;
};

/**
 * Walk a method chain backwards from the token before a '.'.
 * Returns links root-first; empty when the receiver is not a chain.
 */
[[nodiscard]] std::vector<ChainLink> chain_before(const FunctionBody& body, std::size_t last)
{
    std::vector<ChainLink> links;
    std::size_t i = last;
    while (i >= body.begin() && i < body.end()) {
        if (body.is_punct(i, "?")) {
            --i;
            continue;
        }
        ChainLink link;
        if (body.is_punct(i, ")")) {
            const auto open = body.match(i);
            if (open == kNpos || open == body.begin() || !body.is_ident(open - 1)) {
                break;
            }
            link = ChainLink{.name = body.at(open - 1).text, .open = open, .close = i};
            i = open - 1;
        } else if (body.is_ident(i)) {
            link = ChainLink{.name = body.at(i).text};
        } else {
            break;
        }
        links.push_back(std::move(link));
        if (i == body.begin() || !body.is_punct(i - 1, ".")) {
            break;
        }
        i -= 2;
    }
    std::ranges::reverse(links);
    return links;
}

[[nodiscard]] std::optional<std::string> string_literal(const FunctionBody& body, Span span)
{
    if (span.size() == 1 && body.at(span.begin).kind == TokenKind::kString) {
        return body.at(span.begin).text;
    }
    return std::nullopt;
}

[[nodiscard]] Span strip_borrows(const FunctionBody& body, Span span)
{
    while (!span.empty() && body.is_punct(span.begin, "&")) {
        ++span.begin;
        if (!span.empty() && body.is_ident(span.begin) && body.at(span.begin).text == "mut") {
            ++span.begin;
        }
    }
    return span;
}

/// Canonical path of a type expression after one level of borrow, "" when not a path.
[[nodiscard]] std::string handle_path(const syntax::TypeExpr& type, const syntax::AliasTable& aliases)
{
    const syntax::TypeExpr* referent = &type;
    if (type.kind == syntax::TypeExpr::Kind::kReference) {
        referent = &type.args.front();
    }
    if (referent->kind != syntax::TypeExpr::Kind::kPath) {
        return {};
    }
    return types::canonical_path(referent->segments, aliases);
}

/**
 * @brief Per-function scan state
 */
class SiteScanner
{
public:
    SiteScanner(const syntax::ParsedFile& file,
                const syntax::FunctionDecl& function,
                types::TypeResolver& resolver,
                std::vector<Diagnostic>& diagnostics)
        : m_file(file)
        , m_function(function)
        , m_body(file.tokens, function.body_begin, function.body_end)
        , m_resolver(resolver)
        , m_diagnostics(diagnostics)
    {}

    void scan(std::vector<EventSite>& sites)
    {
        for (std::size_t i = m_body.begin(); i + 2 < m_body.end(); ++i) {
            if (!m_body.is_punct(i, ".") || !m_body.is_ident(i + 1) || !m_body.is_punct(i + 2, "(")) {
                continue;
            }
            const std::string& method = m_body.at(i + 1).text;
            if (method != kEmit && method != kEmitTo) {
                continue;
            }
            const auto close = m_body.match(i + 2);
            if (close == kNpos) {
                continue;
            }
            if (auto site = read_site(i, method == kEmitTo, close)) {
                sites.push_back(std::move(*site));
            }
        }
    }

private:
    [[nodiscard]] SourceLocation location_of(std::size_t index) const
    {
        const Token& t = m_body.at(index);
        return SourceLocation{.file = m_file.path, .line = t.line, .column = t.column};
    }

    void warn(std::string_view code, std::size_t index, std::string message)
    {
        m_diagnostics.push_back(Diagnostic::warning(code, location_of(index), std::move(message)));
    }

    [[nodiscard]] std::optional<EventSite> read_site(std::size_t dot, bool targeted, std::size_t close)
    {
        const std::size_t method = dot + 1;
        const auto args = m_body.arguments(dot + 2, close);
        const std::size_t name_index = targeted ? 1 : 0;
        if (args.size() <= name_index) {
            return std::nullopt;
        }

        const auto name = string_literal(m_body, strip_borrows(m_body, args[name_index]));
        if (!name.has_value()) {
            warn(diag::kUnstaticEventName,
                 method,
                 std::format("event name '{}' is not a string literal; site skipped",
                             m_body.spell(args[name_index])));
            return std::nullopt;
        }

        EventScope scope;
        if (targeted) {
            const auto label = string_literal(m_body, strip_borrows(m_body, args.front()));
            if (!label.has_value()) {
                warn(diag::kUnstaticEventTarget,
                     method,
                     std::format("target '{}' of event '{}' is not a string literal; site skipped",
                                 m_body.spell(args.front()),
                                 *name));
                return std::nullopt;
            }
            scope = EventScope{.kind = ScopeKind::kWindow, .label = *label};
        } else {
            const auto resolution = resolve_chain(chain_before(m_body, dot - 1), dot, 0);
            if (resolution.outcome == ScopeOutcome::kSkipped) {
                return std::nullopt;
            }
            if (resolution.outcome == ScopeOutcome::kUnresolved) {
                warn(diag::kUnresolvedEventScope,
                     method,
                     std::format("cannot tell which window receives event '{}'; site skipped", *name));
                return std::nullopt;
            }
            scope = resolution.scope;
        }

        TypeDescriptor payload = TypeDescriptor::make_primitive(types::PrimitiveKind::kVoid);
        if (args.size() > name_index + 1) {
            const Span payload_span = args[name_index + 1];
            auto inferred = infer_payload(payload_span, 0);
            if (!inferred.has_value()) {
                warn(diag::kUnsupportedType,
                     method,
                     std::format("cannot infer the payload type of event '{}' from '{}'",
                                 *name,
                                 m_body.spell(payload_span)));
                inferred = TypeDescriptor::make_unsupported(m_body.spell(payload_span));
            }
            payload = std::move(*inferred);
        }

        return EventSite{.name = *name,
                         .payload = std::move(payload),
                         .scope = std::move(scope),
                         .location = location_of(method)};
    }

    // ------------------------------------------------------------------------
    // Scope
    // ------------------------------------------------------------------------

    [[nodiscard]] ScopeResolution resolve_chain(const std::vector<ChainLink>& links,
                                                std::size_t position,
                                                int depth)
    {
        if (links.empty() || depth > kMaxBindingDepth) {
            return {};
        }
        // The innermost lookup decides: app.get_webview_window("a").emit(..)
        for (const auto& link : links | std::views::reverse) {
            if (!link.is_call()) {
                continue;
            }
            if (is_window_lookup(link.name)) {
                const auto args = m_body.arguments(link.open, link.close);
                const auto label = args.empty()
                                       ? std::nullopt
                                       : string_literal(m_body, strip_borrows(m_body, args.front()));
                if (!label.has_value()) {
                    warn(diag::kUnstaticEventTarget,
                         link.open - 1,
                         "window label passed to a lookup is not a string literal; site skipped");
                    return ScopeResolution{.outcome = ScopeOutcome::kSkipped};
                }
                return resolved(EventScope{.kind = ScopeKind::kWindow, .label = *label});
            }
            if (link.name == "app_handle") {
                return resolved(EventScope{.kind = ScopeKind::kGlobal});
            }
        }

        const ChainLink& root = links.front();
        if (root.is_call()) {
            return {};
        }
        if (const auto* local = m_body.binding(root.name, position)) {
            if (local->type.has_value()) {
                return from_handle(handle_path(*local->type, m_file.aliases), root.name);
            }
            if (local->init.empty()) {
                return {};
            }
            return resolve_chain(chain_before(m_body, local->init.end - 1), local->position, depth + 1);
        }
        const auto param = std::ranges::find(m_function.params, root.name, &syntax::FnParam::name);
        if (param != m_function.params.end()) {
            return from_handle(handle_path(param->type, m_file.aliases), root.name);
        }
        return {};
    }

    [[nodiscard]] static ScopeResolution resolved(EventScope scope)
    {
        return ScopeResolution{.outcome = ScopeOutcome::kResolved, .scope = std::move(scope)};
    }

    [[nodiscard]] static ScopeResolution from_handle(const std::string& canonical,
                                                     const std::string& identifier)
    {
        // tauri::App only appears in setup hooks, where it broadcasts like the app handle
        if (canonical == "tauri::App") {
            return resolved(EventScope{.kind = ScopeKind::kGlobal});
        }
        switch (types::classify_handle(canonical)) {
            case types::HandleKind::kWindow:
                return resolved(EventScope{.kind = ScopeKind::kWindow, .label = identifier});
            case types::HandleKind::kApp:
                return resolved(EventScope{.kind = ScopeKind::kGlobal});
            case types::HandleKind::kState:
            case types::HandleKind::kNone:
                break;
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // Payload
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<TypeDescriptor> infer_payload(Span span, int depth)
    {
        span = strip_borrows(m_body, span);
        if (depth > kMaxBindingDepth) {
            return std::nullopt;
        }
        if (span.empty() || (span.size() == 2 && m_body.is_punct(span.begin, "(")
                             && m_body.is_punct(span.begin + 1, ")"))) {
            return TypeDescriptor::make_primitive(types::PrimitiveKind::kVoid);
        }

        const Token& first = m_body.at(span.begin);
        if (span.size() == 1) {
            switch (first.kind) {
                case TokenKind::kString:
                case TokenKind::kChar:
                    return TypeDescriptor::make_primitive(types::PrimitiveKind::kString);
                case TokenKind::kNumber:
                    return TypeDescriptor::make_primitive(types::PrimitiveKind::kNumber);
                case TokenKind::kIdent:
                    if (first.text == "true" || first.text == "false") {
                        return TypeDescriptor::make_primitive(types::PrimitiveKind::kBoolean);
                    }
                    return variable_type(first.text, span.begin, depth);
                default:
                    return std::nullopt;
            }
        }
        if (span.size() == 2 && first.is_punct("-") && m_body.at(span.begin + 1).kind == TokenKind::kNumber) {
            return TypeDescriptor::make_primitive(types::PrimitiveKind::kNumber);
        }

        const std::size_t last = span.end - 1;
        // format!(..), String::from(..), String::new()
        if (first.is_ident("format") && m_body.is_punct(span.begin + 1, "!")
            && m_body.match(span.begin + 2) == last) {
            return TypeDescriptor::make_primitive(types::PrimitiveKind::kString);
        }
        if (first.is_ident("String") && m_body.is_punct(span.begin + 1, "::")) {
            return TypeDescriptor::make_primitive(types::PrimitiveKind::kString);
        }
        // x.to_string(), "lit".to_owned(), x.clone()
        if (m_body.is_punct(last, ")") && m_body.match(last) == last - 1 && last >= span.begin + 3
            && m_body.is_punct(last - 3, ".")) {
            const std::string& method = m_body.at(last - 2).text;
            const Span receiver{.begin = span.begin, .end = last - 3};
            if (method == "to_string") {
                return TypeDescriptor::make_primitive(types::PrimitiveKind::kString);
            }
            if (method == "to_owned" || method == "clone") {
                return infer_payload(receiver, depth + 1);
            }
        }
        return struct_literal(span);
    }

    /// `Path { .. }` spanning the whole expression.
    [[nodiscard]] std::optional<TypeDescriptor> struct_literal(Span span)
    {
        const std::size_t last = span.end - 1;
        if (!m_body.is_punct(last, "}")) {
            return std::nullopt;
        }
        const auto open = m_body.match(last);
        if (open == kNpos || open <= span.begin) {
            return std::nullopt;
        }
        syntax::TypeExpr path{.kind = syntax::TypeExpr::Kind::kPath};
        for (std::size_t i = span.begin; i < open; ++i) {
            const bool expect_ident = (i - span.begin) % 2 == 0;
            if (expect_ident ? !m_body.is_ident(i) : !m_body.is_punct(i, "::")) {
                return std::nullopt;
            }
            if (expect_ident) {
                path.segments.push_back(m_body.at(i).text);
            }
        }
        if ((open - span.begin) % 2 == 0) {
            return std::nullopt;  // trailing '::'
        }
        path.text = m_body.spell(Span{.begin = span.begin, .end = open});
        return m_resolver.classify(path, location_of(span.begin));
    }

    [[nodiscard]] std::optional<TypeDescriptor> variable_type(const std::string& name,
                                                              std::size_t position,
                                                              int depth)
    {
        if (const auto* local = m_body.binding(name, position)) {
            if (local->type.has_value()) {
                return m_resolver.classify(*local->type, location_of(local->position));
            }
            if (local->init.empty()) {
                return std::nullopt;
            }
            return infer_payload(local->init, depth + 1);
        }
        const auto param = std::ranges::find(m_function.params, name, &syntax::FnParam::name);
        if (param != m_function.params.end()) {
            return m_resolver.classify(param->type, param->location);
        }
        return std::nullopt;
    }

    const syntax::ParsedFile& m_file;
    const syntax::FunctionDecl& m_function;
    FunctionBody m_body;
    types::TypeResolver& m_resolver;
    std::vector<Diagnostic>& m_diagnostics;
};

}  // namespace

EventDetector::EventDetector(const syntax::ParsedFile& file,
                             types::TypeResolver& resolver,
                             std::vector<Diagnostic>& diagnostics)
    : m_file(file)
    , m_resolver(resolver)
    , m_diagnostics(diagnostics)
{}

std::vector<EventSite> EventDetector::detect()
{
    std::vector<EventSite> sites;
    for (const auto& function : m_file.functions) {
        scan_function(function, sites);
    }
    return sites;
}

void EventDetector::scan_function(const syntax::FunctionDecl& function, std::vector<EventSite>& sites)
{
    if (function.body_end <= function.body_begin) {
        return;
    }
    SiteScanner scanner(m_file, function, m_resolver, m_diagnostics);
    scanner.scan(sites);
}

}  // namespace tsgen::events
