/**
 * @file config.cpp
 * @brief Config file loading and command-line merge
 */

#include "tsgen/config.hpp"

#include "tsgen/schema_validate.hpp"
#include "tsgen/version.hpp"

#include <format>
#include <fstream>

namespace tsgen::config {

tsgen::Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Could not read config file: " + path));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Could not parse config file: {}: {}", path, ex.what())));
    }
    return payload;
}

tsgen::Result<GenerateConfig> load_config_file(const std::string& path, const std::string& schema_dir)
{
    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (auto valid = common::validate_json(*payload, common::schema_file(schema_dir, kConfigSchemaVersion));
        !valid) {
        return std::unexpected(Error::make(
            "ConfigInvalid",
            std::format("Config file {} does not match {}: {}", path, kConfigSchemaVersion, valid.error().message)));
    }

    const auto& j = *payload;
    return GenerateConfig{.input_path = j.at("input_path").get<std::string>(),
                          .output_path = j.at("output_path").get<std::string>(),
                          .mock_api = j.value("mock_api", false),
                          .jobs = j.value("jobs", 0)};
}

tsgen::Result<GenerateConfig> resolve_config(const ConfigOverrides& overrides, const std::string& schema_dir)
{
    GenerateConfig config;
    if (overrides.config_file.has_value()) {
        auto loaded = load_config_file(*overrides.config_file, schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    } else if (!overrides.input_path.has_value() || !overrides.output_path.has_value()) {
        return std::unexpected(
            Error::make("MissingArgument",
                        "Either --config or both --input-path and --output-path must be provided."));
    }

    if (overrides.input_path.has_value()) {
        config.input_path = *overrides.input_path;
    }
    if (overrides.output_path.has_value()) {
        config.output_path = *overrides.output_path;
    }
    if (overrides.mock_api.has_value()) {
        config.mock_api = *overrides.mock_api;
    }
    if (overrides.jobs.has_value()) {
        config.jobs = *overrides.jobs;
    }
    if (config.jobs < 0) {
        return std::unexpected(
            Error::make("InvalidArgument", std::format("Invalid jobs value: {}", config.jobs)));
    }
    return config;
}

void to_json(nlohmann::json& j, const GenerateConfig& config)
{
    j = nlohmann::json{
        { "input_path",  config.input_path},
        {"output_path", config.output_path},
        {   "mock_api",    config.mock_api},
        {       "jobs",        config.jobs}
    };
}

}  // namespace tsgen::config
