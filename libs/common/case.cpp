/**
 * @file case.cpp
 * @brief Identifier case conversion (PascalCase, camelCase, snake_case)
 */

#include "tsgen/common.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace tsgen::common {

namespace {

[[nodiscard]] bool is_upper(char c)
{
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_lower(char c)
{
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_separator(char c)
{
    return c == '_' || c == '-' || c == '.' || c == ' ' || c == '/';
}

[[nodiscard]] std::string lowered(std::string_view word)
{
    std::string out;
    out.reserve(word.size());
    for (char c : word) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

[[nodiscard]] std::string capitalized(std::string_view word)
{
    std::string out = lowered(word);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

}  // namespace

std::vector<std::string> split_words(std::string_view identifier)
{
    std::vector<std::string> words;
    std::string current;

    const auto flush = [&words, &current] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (std::size_t i = 0; i < identifier.size(); ++i) {
        const char c = identifier[i];
        if (is_separator(c)) {
            flush();
            continue;
        }
        if (!current.empty()) {
            const char prev = current.back();
            const bool next_is_lower = i + 1 < identifier.size() && is_lower(identifier[i + 1]);
            // fooBar | HTTPServer -> HTTP Server
            if (is_upper(c) && (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_is_lower))) {
                flush();
            }
        }
        current += c;
    }
    flush();
    return words;
}

std::string to_pascal_case(std::string_view identifier)
{
    std::string result;
    for (const auto& word : split_words(identifier)) {
        result += capitalized(word);
    }
    return result;
}

std::string to_camel_case(std::string_view identifier)
{
    std::string result;
    bool first = true;
    for (const auto& word : split_words(identifier)) {
        result += first ? lowered(word) : capitalized(word);
        first = false;
    }
    return result;
}

std::string to_snake_case(std::string_view identifier)
{
    std::string result;
    for (const auto& word : split_words(identifier)) {
        if (!result.empty()) {
            result += '_';
        }
        result += lowered(word);
    }
    return result;
}

}  // namespace tsgen::common
