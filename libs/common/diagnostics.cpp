/**
 * @file diagnostics.cpp
 * @brief Diagnostic ordering, formatting and serialization
 */

#include "tsgen/diagnostics.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace tsgen {

std::string_view severity_name(Severity severity)
{
    switch (severity) {
        case Severity::kError:
            return "error";
        case Severity::kWarning:
            return "warning";
    }
    return "warning";
}

void sort_diagnostics(std::vector<Diagnostic>& diagnostics)
{
    std::ranges::stable_sort(diagnostics, [](const Diagnostic& a, const Diagnostic& b) {
        return std::tie(a.location.file, a.location.line, a.location.column, a.code, a.message)
               < std::tie(b.location.file, b.location.line, b.location.column, b.code, b.message);
    });
}

bool has_errors(const std::vector<Diagnostic>& diagnostics)
{
    return std::ranges::any_of(diagnostics, [](const Diagnostic& d) {
        return d.severity == Severity::kError;
    });
}

std::string format_diagnostic(const Diagnostic& diagnostic)
{
    const auto& loc = diagnostic.location;
    std::string where = loc.file.empty() ? std::string("<input>") : loc.file;
    if (loc.line > 0) {
        where += std::format(":{}:{}", loc.line, loc.column);
    }
    return std::format("{}: {}: [{}] {}",
                       where,
                       severity_name(diagnostic.severity),
                       diagnostic.code,
                       diagnostic.message);
}

void to_json(nlohmann::json& j, const SourceLocation& location)
{
    j = nlohmann::json{
        {  "file",   location.file},
        {  "line",   location.line},
        {"column", location.column}
    };
}

void to_json(nlohmann::json& j, const Diagnostic& diagnostic)
{
    j = nlohmann::json{
        {    "code",                 diagnostic.code},
        {"severity", std::string(severity_name(diagnostic.severity))},
        {"location",             diagnostic.location},
        { "message",              diagnostic.message}
    };
}

}  // namespace tsgen
