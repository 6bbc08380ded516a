#pragma once

/**
 * @file model.hpp
 * @brief Semantic model: commands, data types, events and the module tree
 *
 * Every entity is built once per run from the scanned sources and is not
 * mutated after rendering starts. The model serializes to JSON; its
 * canonical form is byte-identical across runs on an unchanged tree.
 */

#include "tsgen/common.hpp"
#include "tsgen/diagnostics.hpp"
#include "tsgen/events.hpp"
#include "tsgen/syntax.hpp"
#include "tsgen/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tsgen::model {

// ============================================================================
// Commands
// ============================================================================

struct Parameter
{
    std::string name;     ///< as declared
    std::string ts_name;  ///< camelCase wrapper parameter
    std::string arg_key;  ///< key of the invoke payload, per rename_all
    types::TypeDescriptor type;
    bool is_reference = false;
    std::string canonical_path;
    SourceLocation location;
};

struct CommandFunction
{
    std::string name;         ///< invoke name
    std::string method_name;  ///< camelCase wrapper method
    std::string doc;
    std::vector<Parameter> params;
    std::vector<std::string> injected;  ///< names of dropped bridge-injected parameters
    types::TypeDescriptor return_type;  ///< as declared, Result kept
    types::TypeDescriptor result_type;  ///< narrowed, what the promise resolves to
    std::string module;                 ///< relative path of the declaring file
    std::string rename_all;
    bool is_async = false;
    SourceLocation location;
};

// ============================================================================
// Data types
// ============================================================================

struct Field
{
    std::string name;
    std::string doc;
    types::TypeDescriptor type;
    SourceLocation location;
};

struct Variant
{
    std::string name;
    std::string doc;
    syntax::VariantShape shape = syntax::VariantShape::kUnit;
    std::vector<Field> fields;
};

struct TypeDeclaration
{
    std::string id;  ///< "<file>#<Name>", unique across the run
    std::string name;
    syntax::TypeDeclKind kind = syntax::TypeDeclKind::kStruct;
    syntax::StructShape shape = syntax::StructShape::kNamed;
    std::string doc;
    std::vector<Field> fields;
    std::vector<Variant> variants;
    bool derives_serialize = false;
    bool derives_deserialize = false;
    std::string module;
    SourceLocation location;
};

// ============================================================================
// Files and the module tree
// ============================================================================

struct SourceFile
{
    std::string path;                      ///< normalized relative path, the identity
    std::vector<std::string> module_path;  ///< "src/api/user.rs" -> {"src", "api", "user"}
    syntax::AliasTable aliases;
    bool parsed = false;
};

/// Everything derived from one file before cross-file resolution.
struct FileAnalysis
{
    SourceFile file;
    std::vector<CommandFunction> commands;
    std::vector<TypeDeclaration> types;
    std::vector<events::EventSite> events;
    std::vector<Diagnostic> diagnostics;
};

/**
 * @brief Node of the module tree
 *
 * Directory nodes own children; file nodes own declarations. Every
 * declaration belongs to exactly one file node.
 */
struct ModuleNode
{
    std::string segment;       ///< directory name, or file stem for file nodes
    std::string path;          ///< '/'-joined directory path of the node ("" for the root)
    bool is_file = false;
    std::string wrapper_name;  ///< PascalCase stem, disambiguated within the directory
    std::string source;        ///< relative file path, file nodes only
    std::vector<ModuleNode> children;
    std::vector<CommandFunction> commands;
    std::vector<TypeDeclaration> types;
};

struct SemanticModel
{
    std::string schema_version;
    std::vector<SourceFile> files;  ///< scan order
    ModuleNode root;
    std::vector<events::EventScopeModel> events;
};

struct AnalysisResult
{
    SemanticModel model;
    std::vector<Diagnostic> diagnostics;  ///< sorted
};

// ============================================================================
// Builders
// ============================================================================

/// "src/api/user.rs" -> {"src", "api", "user"}
[[nodiscard]] std::vector<std::string> module_path_of(std::string_view relative_path);

/**
 * Collect the marked free functions of one file. Injected handle
 * parameters are dropped; a repeated command name keeps the first
 * declaration and warns.
 */
[[nodiscard]] std::vector<CommandFunction> build_commands(const syntax::ParsedFile& file,
                                                          types::TypeResolver& resolver,
                                                          std::vector<Diagnostic>& diagnostics);

/// Collect every struct and enum of one file, fields and variants resolved.
[[nodiscard]] std::vector<TypeDeclaration> build_types(const syntax::ParsedFile& file,
                                                       types::TypeResolver& resolver);

/**
 * Second pass: bind every forward NamedRef to a declaration id.
 *
 * Candidates with the referenced name are tried in order: one in the same
 * file, one whose module path ends with the reference's qualifier, the
 * first in scan order. A reference with no candidate becomes Unsupported
 * and warns. Also raises the serde derive warnings for command signatures.
 */
void resolve_references(std::vector<FileAnalysis>& files, std::vector<Diagnostic>& diagnostics);

/// One NameCollisionWarning per type name declared in more than one place.
void check_type_collisions(const std::vector<FileAnalysis>& files,
                           std::vector<Diagnostic>& diagnostics);

/**
 * Move the declarations of @p files into a tree mirroring the directory
 * layout. Fails with InternalInvariantViolation when a declaration ends
 * up owned by no node.
 */
[[nodiscard]] tsgen::Result<ModuleNode> assemble_module_tree(std::vector<FileAnalysis>& files,
                                                             std::vector<Diagnostic>& diagnostics);

/// Pre-order walk over file nodes.
template <typename Fn>
void for_each_file(const ModuleNode& node, Fn&& fn)
{
    if (node.is_file) {
        fn(node);
    }
    for (const auto& child : node.children) {
        for_each_file(child, fn);
    }
}

// ============================================================================
// Serialization
// ============================================================================

void to_json(nlohmann::json& j, const Parameter& param);
void to_json(nlohmann::json& j, const CommandFunction& command);
void to_json(nlohmann::json& j, const Field& field);
void to_json(nlohmann::json& j, const Variant& variant);
void to_json(nlohmann::json& j, const TypeDeclaration& decl);
void to_json(nlohmann::json& j, const SourceFile& file);
void to_json(nlohmann::json& j, const ModuleNode& node);
void to_json(nlohmann::json& j, const SemanticModel& model);

}  // namespace tsgen::model
