/**
 * @file model_json.cpp
 * @brief JSON serialization of the semantic model (model.v1)
 */

#include "tsgen/model.hpp"

namespace tsgen::model {

namespace {

[[nodiscard]] std::string decl_kind_name(syntax::TypeDeclKind kind)
{
    return kind == syntax::TypeDeclKind::kStruct ? "struct" : "enum";
}

[[nodiscard]] std::string struct_shape_name(syntax::StructShape shape)
{
    switch (shape) {
        case syntax::StructShape::kNamed:
            return "named";
        case syntax::StructShape::kTuple:
            return "tuple";
        case syntax::StructShape::kUnit:
            return "unit";
    }
    return "named";
}

[[nodiscard]] std::string variant_shape_name(syntax::VariantShape shape)
{
    switch (shape) {
        case syntax::VariantShape::kUnit:
            return "unit";
        case syntax::VariantShape::kTuple:
            return "tuple";
        case syntax::VariantShape::kStruct:
            return "struct";
    }
    return "unit";
}

}  // namespace

void to_json(nlohmann::json& j, const Parameter& param)
{
    j = nlohmann::json{
        {          "name",           param.name},
        {       "ts_name",        param.ts_name},
        {       "arg_key",        param.arg_key},
        {          "type",           param.type},
        {  "is_reference",   param.is_reference},
        {"canonical_path", param.canonical_path},
        {      "location",       param.location}
    };
}

void to_json(nlohmann::json& j, const CommandFunction& command)
{
    j = nlohmann::json{
        {       "name",        command.name},
        {"method_name", command.method_name},
        {        "doc",         command.doc},
        {     "params",      command.params},
        {   "injected",    command.injected},
        {"return_type", command.return_type},
        {"result_type", command.result_type},
        {     "module",      command.module},
        { "rename_all",  command.rename_all},
        {   "is_async",    command.is_async},
        {   "location",    command.location}
    };
}

void to_json(nlohmann::json& j, const Field& field)
{
    j = nlohmann::json{
        {    "name",     field.name},
        {     "doc",      field.doc},
        {    "type",     field.type},
        {"location", field.location}
    };
}

void to_json(nlohmann::json& j, const Variant& variant)
{
    j = nlohmann::json{
        {  "name",                          variant.name},
        {   "doc",                           variant.doc},
        { "shape", variant_shape_name(variant.shape)},
        {"fields",                        variant.fields}
    };
}

void to_json(nlohmann::json& j, const TypeDeclaration& decl)
{
    j = nlohmann::json{
        {                 "id",                       decl.id},
        {               "name",                     decl.name},
        {               "kind",      decl_kind_name(decl.kind)},
        {              "shape", struct_shape_name(decl.shape)},
        {                "doc",                      decl.doc},
        {             "fields",                   decl.fields},
        {           "variants",                 decl.variants},
        {  "derives_serialize",        decl.derives_serialize},
        {"derives_deserialize",      decl.derives_deserialize},
        {             "module",                   decl.module},
        {           "location",                 decl.location}
    };
}

void to_json(nlohmann::json& j, const SourceFile& file)
{
    j = nlohmann::json{
        {       "path",        file.path},
        {"module_path", file.module_path},
        {    "aliases",     file.aliases},
        {     "parsed",      file.parsed}
    };
}

void to_json(nlohmann::json& j, const ModuleNode& node)
{
    j = nlohmann::json{
        {     "segment",      node.segment},
        {        "path",         node.path},
        {     "is_file",      node.is_file},
        {    "children",     node.children},
        {    "commands",     node.commands},
        {       "types",        node.types}
    };
    if (node.is_file) {
        j["wrapper_name"] = node.wrapper_name;
        j["source"] = node.source;
    }
}

void to_json(nlohmann::json& j, const SemanticModel& model)
{
    j = nlohmann::json{
        {"schema_version", model.schema_version},
        {         "files",          model.files},
        {          "root",           model.root},
        {        "events",         model.events}
    };
}

}  // namespace tsgen::model
