/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 *
 * nlohmann::json keeps object keys in a std::map, so key order is already
 * lexicographic by byte value; canonicalization only has to reject values
 * that have no stable textual form and pin the dump settings.
 */

#include "tsgen/canonical_json.hpp"

#include <format>
#include <ranges>

namespace tsgen::canonical {

namespace {

tsgen::VoidResult reject_float(const nlohmann::json& j, const std::string& where)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", where)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = reject_float(val, where + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = reject_float(elem, std::format("{}[{}]", where, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

[[nodiscard]] tsgen::Result<std::string> dump_checked(const nlohmann::json& j, int indent)
{
    if (auto result = reject_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }
    try {
        return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

}  // namespace

tsgen::Result<std::string> canonicalize(const nlohmann::json& j)
{
    return dump_checked(j, -1);
}

tsgen::Result<std::string> canonicalize_pretty(const nlohmann::json& j, int indent)
{
    return dump_checked(j, indent);
}

tsgen::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return reject_float(j, "$");
}

}  // namespace tsgen::canonical
