#pragma once

/**
 * @file version.hpp
 * @brief tsgen version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace tsgen {

/// tsgen version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the JSON documents tsgen reads and writes
constexpr const char* kModelSchemaVersion = "model.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

/// Banner placed at the top of every generated TypeScript artifact
constexpr const char* kGeneratedBanner = "// This file is generated by tsgen. Do not edit.";

}  // namespace tsgen
