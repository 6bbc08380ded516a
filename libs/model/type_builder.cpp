/**
 * @file type_builder.cpp
 * @brief Struct and enum declarations -> TypeDeclaration entries
 */

#include "tsgen/model.hpp"

#include <utility>

namespace tsgen::model {

namespace {

[[nodiscard]] std::vector<Field> build_fields(const std::vector<syntax::FieldDecl>& decls,
                                              types::TypeResolver& resolver)
{
    std::vector<Field> fields;
    fields.reserve(decls.size());
    for (const auto& decl : decls) {
        fields.push_back(Field{.name = decl.name,
                               .doc = decl.doc,
                               .type = resolver.classify(decl.type, decl.location),
                               .location = decl.location});
    }
    return fields;
}

}  // namespace

std::vector<TypeDeclaration> build_types(const syntax::ParsedFile& file, types::TypeResolver& resolver)
{
    std::vector<TypeDeclaration> result;
    result.reserve(file.types.size());

    for (const auto& decl : file.types) {
        TypeDeclaration type{.id = file.path + "#" + decl.name,
                             .name = decl.name,
                             .kind = decl.kind,
                             .shape = decl.shape,
                             .doc = decl.doc,
                             .derives_serialize = decl.derives_serialize,
                             .derives_deserialize = decl.derives_deserialize,
                             .module = file.path,
                             .location = decl.location};
        if (decl.kind == syntax::TypeDeclKind::kStruct) {
            type.fields = build_fields(decl.fields, resolver);
        } else {
            for (const auto& variant : decl.variants) {
                type.variants.push_back(Variant{.name = variant.name,
                                                .doc = variant.doc,
                                                .shape = variant.shape,
                                                .fields = build_fields(variant.fields, resolver)});
            }
        }
        result.push_back(std::move(type));
    }
    return result;
}

}  // namespace tsgen::model
