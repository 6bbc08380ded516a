/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "tsgen/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace tsgen::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "tsgen:schema/";

/// valijson resolves draft-07 "definitions"; rewrite 2020-12 "$defs" to match.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
        schema.erase("$defs");
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] tsgen::Result<nlohmann::json> load_schema_document(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(document);
    return document;
}

[[nodiscard]] std::string collect_errors(valijson::ValidationResults& results)
{
    std::string joined;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return joined.empty() ? std::string("Schema validation failed.") : joined;
}

}  // namespace

std::string schema_file(const std::string& schema_dir, std::string_view name)
{
    return (std::filesystem::path(schema_dir) / (std::string(name) + ".schema.json")).string();
}

tsgen::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto root = load_schema_document(schema_path);
    if (!root) {
        return std::unexpected(root.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto document =
            load_schema_document(schema_dir / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!document) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*document)));
        return referenced.back().get();
    };
    // Documents stay owned by `referenced`.
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*root);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", collect_errors(results)));
    }
    return {};
}

}  // namespace tsgen::common
