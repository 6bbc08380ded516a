#pragma once

/**
 * @file diagnostics.hpp
 * @brief Non-fatal findings collected during analysis
 *
 * Fatal conditions are reported through tsgen::Error; everything that lets
 * the run continue (a file that failed to parse, an unmappable type, an
 * event that cannot be typed, a naming collision) becomes a Diagnostic.
 */

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tsgen {

enum class Severity {
    kError,
    kWarning,
};

/// Diagnostic codes
namespace diag {
constexpr std::string_view kSyntaxError = "SyntaxError";
constexpr std::string_view kSourceReadFailed = "SourceReadFailed";
constexpr std::string_view kUnsupportedType = "UnsupportedTypeWarning";
constexpr std::string_view kUnstaticEventName = "UnstaticEventNameWarning";
constexpr std::string_view kUnstaticEventTarget = "UnstaticEventTargetWarning";
constexpr std::string_view kUnresolvedEventScope = "UnresolvedEventScopeWarning";
constexpr std::string_view kNameCollision = "NameCollisionWarning";
constexpr std::string_view kMissingSerialize = "MissingSerializeWarning";
constexpr std::string_view kMissingDeserialize = "MissingDeserializeWarning";
}  // namespace diag

struct SourceLocation
{
    std::string file;
    int line = 0;
    int column = 0;
};

struct Diagnostic
{
    std::string code;
    Severity severity = Severity::kWarning;
    SourceLocation location;
    std::string message;

    [[nodiscard]] static Diagnostic
    warning(std::string_view code, SourceLocation location, std::string message)
    {
        return Diagnostic{.code = std::string(code),
                          .severity = Severity::kWarning,
                          .location = std::move(location),
                          .message = std::move(message)};
    }

    [[nodiscard]] static Diagnostic
    error(std::string_view code, SourceLocation location, std::string message)
    {
        return Diagnostic{.code = std::string(code),
                          .severity = Severity::kError,
                          .location = std::move(location),
                          .message = std::move(message)};
    }
};

[[nodiscard]] std::string_view severity_name(Severity severity);

/// Sort by (file, line, column, code, message) so output never depends on worker timing.
void sort_diagnostics(std::vector<Diagnostic>& diagnostics);

[[nodiscard]] bool has_errors(const std::vector<Diagnostic>& diagnostics);

/// "src/a.rs:3:7: warning: [UnsupportedTypeWarning] no mapping for '*const u8'"
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diagnostic);

void to_json(nlohmann::json& j, const SourceLocation& location);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);

}  // namespace tsgen
