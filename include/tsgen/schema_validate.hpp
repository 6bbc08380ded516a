#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of config files and model dumps
 */

#include "tsgen/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace tsgen::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Cross-schema references of the form "tsgen:schema/<name>" are loaded from
 * "<name>.schema.json" next to @p schema_path.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error listing every violation on failure
 */
[[nodiscard]] tsgen::VoidResult validate_json(const nlohmann::json& j,
                                              const std::string& schema_path);

/**
 * Path of a named schema inside @p schema_dir ("config.v1" -> "<dir>/config.v1.schema.json")
 */
[[nodiscard]] std::string schema_file(const std::string& schema_dir, std::string_view name);

}  // namespace tsgen::common
