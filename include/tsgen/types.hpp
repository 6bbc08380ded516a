#pragma once

/**
 * @file types.hpp
 * @brief Normalized type descriptors and the type resolver
 */

#include "tsgen/diagnostics.hpp"
#include "tsgen/syntax.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tsgen::types {

enum class PrimitiveKind {
    kString,
    kNumber,
    kBoolean,
    kVoid,
};

/**
 * @brief Tagged type descriptor
 *
 * | kind         | args         | path / name                    |
 * |--------------|--------------|--------------------------------|
 * | kPrimitive   | -            | -                              |
 * | kOptional    | [T]          | -                              |
 * | kResult      | [T, E]       | -                              |
 * | kCollection  | [T]          | -                              |
 * | kMap         | [K, V]       | -                              |
 * | kTuple       | [T...]       | -                              |
 * | kNamedRef    | -            | canonical path / bare name     |
 * | kOpaque      | -            | canonical path                 |
 * | kUnsupported | -            | source spelling                |
 */
struct TypeDescriptor
{
    enum class Kind {
        kPrimitive,
        kOptional,
        kResult,
        kCollection,
        kMap,
        kTuple,
        kNamedRef,
        kOpaque,
        kUnsupported,
    };

    Kind kind = Kind::kUnsupported;
    PrimitiveKind primitive = PrimitiveKind::kVoid;
    std::vector<TypeDescriptor> args;
    std::string path;
    std::string name;
    /// Declaration id once a kNamedRef is resolved against the type model
    std::optional<std::string> target;

    bool operator==(const TypeDescriptor&) const = default;

    [[nodiscard]] static TypeDescriptor make_primitive(PrimitiveKind kind);
    [[nodiscard]] static TypeDescriptor make_optional(TypeDescriptor inner);
    [[nodiscard]] static TypeDescriptor make_result(TypeDescriptor ok, TypeDescriptor err);
    [[nodiscard]] static TypeDescriptor make_collection(TypeDescriptor element);
    [[nodiscard]] static TypeDescriptor make_map(TypeDescriptor key, TypeDescriptor value);
    [[nodiscard]] static TypeDescriptor make_tuple(std::vector<TypeDescriptor> elements);
    [[nodiscard]] static TypeDescriptor make_named(std::string path);
    [[nodiscard]] static TypeDescriptor make_opaque(std::string path);
    [[nodiscard]] static TypeDescriptor make_unsupported(std::string spelling);

    [[nodiscard]] bool is_void() const
    {
        return kind == Kind::kPrimitive && primitive == PrimitiveKind::kVoid;
    }
};

/// Bridge-injected handles. kNone means "supplied by the caller".
enum class HandleKind {
    kNone,
    kWindow,
    kState,
    kApp,
};

/**
 * @brief Result of resolving a parameter-position type
 */
struct ResolvedParam
{
    TypeDescriptor type;
    bool is_reference = false;
    std::string canonical_path;  ///< alias-expanded path of the referent, "" when not a path
    HandleKind handle = HandleKind::kNone;
};

/**
 * Expand the first path segment through @p aliases and join with "::".
 * A leading "crate"/"self"/"super" segment is kept as written.
 */
[[nodiscard]] std::string canonical_path(const std::vector<std::string>& segments,
                                         const syntax::AliasTable& aliases);

/**
 * Classify a canonical path against the injected-handle exclusion set.
 * Generic arguments are not part of the path, so `State<'_, T>` matches by prefix.
 */
[[nodiscard]] HandleKind classify_handle(std::string_view canonical);

/// True for any handle the bridge injects (window, state, app).
[[nodiscard]] bool is_excluded(HandleKind handle);

/**
 * @brief First-pass type resolution for one file
 *
 * Pure function of (expression, alias table). Warnings for unmappable
 * expressions are appended to the sink together with @p location.
 */
class TypeResolver
{
public:
    TypeResolver(const syntax::AliasTable& aliases, std::vector<Diagnostic>& diagnostics);

    /// Classify, keeping Result and Optional wrappers.
    [[nodiscard]] TypeDescriptor classify(const syntax::TypeExpr& expr, const SourceLocation& location);

    /// Strip one reference level, resolve aliases, test the exclusion set, then classify.
    [[nodiscard]] ResolvedParam classify_param(const syntax::TypeExpr& expr,
                                               const SourceLocation& location);

private:
    [[nodiscard]] TypeDescriptor classify_path(const syntax::TypeExpr& expr,
                                               const SourceLocation& location);
    [[nodiscard]] TypeDescriptor unsupported(const syntax::TypeExpr& expr,
                                             const SourceLocation& location,
                                             std::string_view why);

    const syntax::AliasTable& m_aliases;
    std::vector<Diagnostic>& m_diagnostics;
};

/**
 * Result(T, E) -> T, recursively; Optional(T) stays Optional with a narrowed T.
 */
[[nodiscard]] TypeDescriptor narrow(const TypeDescriptor& type);

/// Visit every descriptor in the tree (pre-order), including @p type itself.
template <typename Fn>
void visit(TypeDescriptor& type, Fn&& fn)
{
    fn(type);
    for (auto& arg : type.args) {
        visit(arg, fn);
    }
}

template <typename Fn>
void visit(const TypeDescriptor& type, Fn&& fn)
{
    fn(type);
    for (const auto& arg : type.args) {
        visit(arg, fn);
    }
}

[[nodiscard]] std::string_view kind_name(TypeDescriptor::Kind kind);
[[nodiscard]] std::string_view primitive_name(PrimitiveKind kind);

void to_json(nlohmann::json& j, const TypeDescriptor& type);

}  // namespace tsgen::types
