/**
 * @file type_resolver.cpp
 * @brief First-pass type resolution: aliases, exclusion set, wrapper shapes
 */

#include "tsgen/types.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <utility>

namespace tsgen::types {

namespace {

using syntax::TypeExpr;

constexpr std::array<std::string_view, 6> kWindowHandles = {
    "tauri::Window",
    "tauri::WebviewWindow",
    "tauri::Webview",
    "tauri::window::Window",
    "tauri::webview::WebviewWindow",
    "tauri::webview::Webview",
};
constexpr std::array<std::string_view, 1> kStateHandles = {"tauri::State"};
constexpr std::array<std::string_view, 1> kAppHandles = {"tauri::AppHandle"};

constexpr std::array<std::string_view, 2> kOpaqueResponses = {
    "tauri::ipc::Response",
    "tauri::ipc::InvokeResponseBody",
};

constexpr std::array<std::string_view, 5> kStringNames = {"String", "str", "char", "PathBuf", "Path"};
constexpr std::array<std::string_view, 14> kNumberNames = {"u8",
                                                           "u16",
                                                           "u32",
                                                           "u64",
                                                           "u128",
                                                           "usize",
                                                           "i8",
                                                           "i16",
                                                           "i32",
                                                           "i64",
                                                           "i128",
                                                           "isize",
                                                           "f32",
                                                           "f64"};
constexpr std::array<std::string_view, 6> kCollectionNames =
    {"Vec", "VecDeque", "LinkedList", "HashSet", "BTreeSet", "BinaryHeap"};
constexpr std::array<std::string_view, 3> kMapNames = {"HashMap", "BTreeMap", "IndexMap"};
constexpr std::array<std::string_view, 4> kTransparentNames = {"Box", "Arc", "Rc", "Cow"};

/// Roots under which a path names a standard-library item by its last segment.
constexpr std::array<std::string_view, 4> kStdRoots = {"std", "core", "alloc", "indexmap"};

template <std::size_t N>
[[nodiscard]] bool contains(const std::array<std::string_view, N>& table, std::string_view value)
{
    return std::ranges::find(table, value) != table.end();
}

[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> segments;
    for (auto part : path | std::views::split(std::string_view("::"))) {
        segments.emplace_back(part.begin(), part.end());
    }
    return segments;
}

}  // namespace

// ============================================================================
// TypeDescriptor factories
// ============================================================================

TypeDescriptor TypeDescriptor::make_primitive(PrimitiveKind kind)
{
    TypeDescriptor type;
    type.kind = Kind::kPrimitive;
    type.primitive = kind;
    return type;
}

TypeDescriptor TypeDescriptor::make_optional(TypeDescriptor inner)
{
    TypeDescriptor type;
    type.kind = Kind::kOptional;
    type.args.push_back(std::move(inner));
    return type;
}

TypeDescriptor TypeDescriptor::make_result(TypeDescriptor ok, TypeDescriptor err)
{
    TypeDescriptor type;
    type.kind = Kind::kResult;
    type.args.push_back(std::move(ok));
    type.args.push_back(std::move(err));
    return type;
}

TypeDescriptor TypeDescriptor::make_collection(TypeDescriptor element)
{
    TypeDescriptor type;
    type.kind = Kind::kCollection;
    type.args.push_back(std::move(element));
    return type;
}

TypeDescriptor TypeDescriptor::make_map(TypeDescriptor key, TypeDescriptor value)
{
    TypeDescriptor type;
    type.kind = Kind::kMap;
    type.args.push_back(std::move(key));
    type.args.push_back(std::move(value));
    return type;
}

TypeDescriptor TypeDescriptor::make_tuple(std::vector<TypeDescriptor> elements)
{
    TypeDescriptor type;
    type.kind = Kind::kTuple;
    type.args = std::move(elements);
    return type;
}

TypeDescriptor TypeDescriptor::make_named(std::string path)
{
    TypeDescriptor type;
    type.kind = Kind::kNamedRef;
    const auto last = path.rfind("::");
    type.name = last == std::string::npos ? path : path.substr(last + 2);
    type.path = std::move(path);
    return type;
}

TypeDescriptor TypeDescriptor::make_opaque(std::string path)
{
    TypeDescriptor type;
    type.kind = Kind::kOpaque;
    type.path = std::move(path);
    return type;
}

TypeDescriptor TypeDescriptor::make_unsupported(std::string spelling)
{
    TypeDescriptor type;
    type.kind = Kind::kUnsupported;
    type.path = std::move(spelling);
    return type;
}

// ============================================================================
// Canonical paths and the exclusion set
// ============================================================================

std::string canonical_path(const std::vector<std::string>& segments, const syntax::AliasTable& aliases)
{
    if (segments.empty()) {
        return {};
    }
    std::string result;
    if (auto it = aliases.find(segments.front()); it != aliases.end()) {
        result = it->second;
    } else {
        result = segments.front();
    }
    for (const auto& segment : segments | std::views::drop(1)) {
        result += "::";
        result += segment;
    }
    return result;
}

HandleKind classify_handle(std::string_view canonical)
{
    if (contains(kWindowHandles, canonical)) {
        return HandleKind::kWindow;
    }
    if (contains(kStateHandles, canonical)) {
        return HandleKind::kState;
    }
    if (contains(kAppHandles, canonical)) {
        return HandleKind::kApp;
    }
    return HandleKind::kNone;
}

bool is_excluded(HandleKind handle)
{
    return handle != HandleKind::kNone;
}

// ============================================================================
// TypeResolver
// ============================================================================

TypeResolver::TypeResolver(const syntax::AliasTable& aliases, std::vector<Diagnostic>& diagnostics)
    : m_aliases(aliases)
    , m_diagnostics(diagnostics)
{}

TypeDescriptor TypeResolver::unsupported(const TypeExpr& expr,
                                         const SourceLocation& location,
                                         std::string_view why)
{
    m_diagnostics.push_back(Diagnostic::warning(
        diag::kUnsupportedType,
        location,
        std::format("no TypeScript mapping for '{}' ({})", expr.text, why)));
    return TypeDescriptor::make_unsupported(expr.text);
}

TypeDescriptor TypeResolver::classify(const TypeExpr& expr, const SourceLocation& location)
{
    switch (expr.kind) {
        case TypeExpr::Kind::kReference:
            return classify(expr.args.front(), location);
        case TypeExpr::Kind::kTuple: {
            if (expr.args.empty()) {
                return TypeDescriptor::make_primitive(PrimitiveKind::kVoid);
            }
            std::vector<TypeDescriptor> elements;
            elements.reserve(expr.args.size());
            for (const auto& element : expr.args) {
                elements.push_back(classify(element, location));
            }
            return TypeDescriptor::make_tuple(std::move(elements));
        }
        case TypeExpr::Kind::kSlice:
        case TypeExpr::Kind::kArray:
            return TypeDescriptor::make_collection(classify(expr.args.front(), location));
        case TypeExpr::Kind::kPath:
            return classify_path(expr, location);
        case TypeExpr::Kind::kOther:
            return unsupported(expr, location, "unsupported type form");
    }
    return unsupported(expr, location, "unsupported type form");
}

TypeDescriptor TypeResolver::classify_path(const TypeExpr& expr, const SourceLocation& location)
{
    const std::string canonical = canonical_path(expr.segments, m_aliases);
    if (contains(kOpaqueResponses, canonical)) {
        return TypeDescriptor::make_opaque(canonical);
    }

    const auto segments = split_path(canonical);
    const bool std_item = segments.size() == 1 || contains(kStdRoots, segments.front());
    if (!std_item) {
        return TypeDescriptor::make_named(canonical);
    }

    const std::string& name = segments.back();
    const auto arity = expr.args.size();
    const auto arg = [this, &expr, &location](std::size_t index) {
        return classify(expr.args[index], location);
    };

    if (contains(kStringNames, name) && arity == 0) {
        return TypeDescriptor::make_primitive(PrimitiveKind::kString);
    }
    if (contains(kNumberNames, name) && arity == 0) {
        return TypeDescriptor::make_primitive(PrimitiveKind::kNumber);
    }
    if (name == "bool" && arity == 0) {
        return TypeDescriptor::make_primitive(PrimitiveKind::kBoolean);
    }
    if (name == "Option") {
        if (arity != 1) {
            return unsupported(expr, location, "Option expects one type argument");
        }
        return TypeDescriptor::make_optional(arg(0));
    }
    if (name == "Result") {
        if (arity == 2) {
            return TypeDescriptor::make_result(arg(0), arg(1));
        }
        if (arity == 1) {
            // Result<T> aliases carry a library error that serializes to a message
            return TypeDescriptor::make_result(arg(0),
                                               TypeDescriptor::make_primitive(PrimitiveKind::kString));
        }
        return unsupported(expr, location, "Result expects type arguments");
    }
    if (contains(kCollectionNames, name)) {
        if (arity != 1) {
            return unsupported(expr, location, "collection expects one type argument");
        }
        return TypeDescriptor::make_collection(arg(0));
    }
    if (contains(kMapNames, name)) {
        if (arity < 2) {
            return unsupported(expr, location, "map expects key and value types");
        }
        return TypeDescriptor::make_map(arg(0), arg(1));
    }
    if (contains(kTransparentNames, name)) {
        if (arity == 0) {
            return unsupported(expr, location, "smart pointer without a type argument");
        }
        return arg(0);
    }
    if (segments.size() > 1) {
        return unsupported(expr, location, "standard library type without a mapping");
    }
    return TypeDescriptor::make_named(canonical);
}

ResolvedParam TypeResolver::classify_param(const TypeExpr& expr, const SourceLocation& location)
{
    ResolvedParam resolved;
    const TypeExpr* referent = &expr;
    if (expr.kind == TypeExpr::Kind::kReference) {
        resolved.is_reference = true;
        referent = &expr.args.front();
    }
    if (referent->kind == TypeExpr::Kind::kPath) {
        resolved.canonical_path = canonical_path(referent->segments, m_aliases);
        resolved.handle = classify_handle(resolved.canonical_path);
    }
    if (is_excluded(resolved.handle)) {
        resolved.type = TypeDescriptor::make_named(resolved.canonical_path);
        return resolved;
    }
    resolved.type = classify(*referent, location);
    return resolved;
}

// ============================================================================
// Narrowing and serialization
// ============================================================================

TypeDescriptor narrow(const TypeDescriptor& type)
{
    if (type.kind == TypeDescriptor::Kind::kResult) {
        return narrow(type.args.front());
    }
    TypeDescriptor narrowed = type;
    for (auto& arg : narrowed.args) {
        arg = narrow(arg);
    }
    return narrowed;
}

std::string_view kind_name(TypeDescriptor::Kind kind)
{
    switch (kind) {
        case TypeDescriptor::Kind::kPrimitive:
            return "primitive";
        case TypeDescriptor::Kind::kOptional:
            return "optional";
        case TypeDescriptor::Kind::kResult:
            return "result";
        case TypeDescriptor::Kind::kCollection:
            return "collection";
        case TypeDescriptor::Kind::kMap:
            return "map";
        case TypeDescriptor::Kind::kTuple:
            return "tuple";
        case TypeDescriptor::Kind::kNamedRef:
            return "named";
        case TypeDescriptor::Kind::kOpaque:
            return "opaque";
        case TypeDescriptor::Kind::kUnsupported:
            return "unsupported";
    }
    return "unsupported";
}

std::string_view primitive_name(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::kString:
            return "string";
        case PrimitiveKind::kNumber:
            return "number";
        case PrimitiveKind::kBoolean:
            return "boolean";
        case PrimitiveKind::kVoid:
            return "void";
    }
    return "void";
}

void to_json(nlohmann::json& j, const TypeDescriptor& type)
{
    j = nlohmann::json{
        {"kind", std::string(kind_name(type.kind))}
    };
    switch (type.kind) {
        case TypeDescriptor::Kind::kPrimitive:
            j["primitive"] = std::string(primitive_name(type.primitive));
            break;
        case TypeDescriptor::Kind::kNamedRef:
            j["path"] = type.path;
            j["name"] = type.name;
            if (type.target.has_value()) {
                j["target"] = *type.target;
            }
            break;
        case TypeDescriptor::Kind::kOpaque:
            j["path"] = type.path;
            break;
        case TypeDescriptor::Kind::kUnsupported:
            j["spelling"] = type.path;
            break;
        default:
            j["args"] = type.args;
            break;
    }
}

}  // namespace tsgen::types
