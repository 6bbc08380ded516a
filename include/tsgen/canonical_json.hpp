#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for byte-identical model dumps
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point)
 */

#include "tsgen/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace tsgen::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] tsgen::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Serialize JSON to an indented form with sorted keys, for human-facing dumps
 * @param j JSON value
 * @param indent Indentation width
 */
[[nodiscard]] tsgen::Result<std::string> canonicalize_pretty(const nlohmann::json& j,
                                                             int indent = 2);

/**
 * Validate JSON for canonical form requirements
 * - No floating point numbers
 * @param j JSON value
 * @return Empty on success, error naming the first offending location
 */
[[nodiscard]] tsgen::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace tsgen::canonical
