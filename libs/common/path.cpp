/**
 * @file path.cpp
 * @brief Path normalization for deterministic output
 *
 * Scanned source paths and generated artifact paths are always relative,
 * '/'-separated and free of '.'/'..' segments.
 */

#include "tsgen/common.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace tsgen::common {

namespace {

/**
 * @brief Split a path string into non-empty parts on '/' and '\\'
 */
[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::string unified(path);
    std::ranges::replace(unified, '\\', '/');

    std::vector<std::string> parts;
    for (auto part : unified | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        if (!sv.empty()) {
            parts.emplace_back(sv);
        }
    }
    return parts;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

}  // namespace

std::string join_segments(const std::vector<std::string>& segments)
{
    std::string result;
    std::size_t total_size = segments.empty() ? 0UZ : segments.size() - 1UZ;
    for (const auto& s : segments) {
        total_size += s.size();
    }
    result.reserve(total_size);

    for (auto [i, s] : std::views::enumerate(segments)) {
        if (i > 0) {
            result += '/';
        }
        result += s;
    }
    return result;
}

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    const bool absolute_input = input.front() == '/' || input.front() == '\\';
    std::string normalized = join_segments(resolve_parts(split_path(input), absolute_input));
    if (absolute_input) {
        return "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

std::pair<std::vector<std::string>, std::string> split_parent_segments(std::string_view relative_path)
{
    auto parts = split_path(normalize_path(relative_path));
    if (parts.empty()) {
        return {{}, std::string{}};
    }
    std::string file_name = std::move(parts.back());
    parts.pop_back();
    return {std::move(parts), std::move(file_name)};
}

std::string climb(std::size_t depth)
{
    std::string result;
    result.reserve(depth * 3UZ);
    for (std::size_t i = 0; i < depth; ++i) {
        result += "../";
    }
    return result;
}

}  // namespace tsgen::common
