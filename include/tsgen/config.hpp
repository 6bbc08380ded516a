#pragma once

/**
 * @file config.hpp
 * @brief Generation settings from a JSON config file and command-line flags
 */

#include "tsgen/common.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tsgen::config {

struct GenerateConfig
{
    std::string input_path;
    std::string output_path;
    bool mock_api = false;
    int jobs = 0;
};

/// Values given on the command line; unset fields fall back to the config file.
struct ConfigOverrides
{
    std::optional<std::string> config_file;
    std::optional<std::string> input_path;
    std::optional<std::string> output_path;
    std::optional<bool> mock_api;
    std::optional<int> jobs;
};

/**
 * Read a JSON document from disk.
 * @return Parsed JSON, or IOError / ParseError
 */
[[nodiscard]] tsgen::Result<nlohmann::json> read_json_file(const std::string& path);

/**
 * Load and validate a config file (schema config.v1).
 * @param schema_dir Directory holding config.v1.schema.json
 */
[[nodiscard]] tsgen::Result<GenerateConfig> load_config_file(const std::string& path,
                                                             const std::string& schema_dir);

/**
 * Merge command-line values over the config file.
 *
 * Either a config file or both input and output paths must be given.
 */
[[nodiscard]] tsgen::Result<GenerateConfig> resolve_config(const ConfigOverrides& overrides,
                                                           const std::string& schema_dir);

void to_json(nlohmann::json& j, const GenerateConfig& config);

}  // namespace tsgen::config
