#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error types, path normalization, identifier casing
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsgen {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace tsgen

namespace tsgen::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove empty segments and trailing slashes
 * - Resolve '.' and '..'
 *
 * @param input Input path
 * @return Normalized path ("." for an empty result)
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Split a normalized relative path into its directory segments and file name.
 * "a/b/c.rs" -> {"a", "b"}, "c.rs"
 */
[[nodiscard]] std::pair<std::vector<std::string>, std::string>
split_parent_segments(std::string_view relative_path);

/**
 * Join segments with '/'
 */
[[nodiscard]] std::string join_segments(const std::vector<std::string>& segments);

/**
 * Relative prefix ("../" repeated) climbing out of @p depth directories
 */
[[nodiscard]] std::string climb(std::size_t depth);

// ============================================================================
// Identifier Casing
// ============================================================================

/**
 * Split an identifier into words at '_', '-', '.', spaces and case boundaries.
 * "getHTTPStatus_code" -> {"get", "HTTP", "Status", "code"}
 */
[[nodiscard]] std::vector<std::string> split_words(std::string_view identifier);

/// "get_user" -> "GetUser"
[[nodiscard]] std::string to_pascal_case(std::string_view identifier);

/// "get_user" -> "getUser"
[[nodiscard]] std::string to_camel_case(std::string_view identifier);

/// "getUser" -> "get_user"
[[nodiscard]] std::string to_snake_case(std::string_view identifier);

// ============================================================================
// Stable Sort Comparators
// ============================================================================

/**
 * Compare two strings for stable sorting (lexicographic)
 */
[[nodiscard]] inline bool stable_string_less(const std::string& a, const std::string& b)
{
    return a < b;
}

}  // namespace tsgen::common
