/**
 * @file file_provider.cpp
 * @brief Disk and in-memory source providers
 */

#include "tsgen/source.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace tsgen::source {

namespace {

[[nodiscard]] bool is_source_file(const std::filesystem::path& path)
{
    return path.extension() == kSourceExtension;
}

}  // namespace

DiskFileProvider::DiskFileProvider(std::filesystem::path root)
    : m_root(std::move(root))
{}

tsgen::Result<std::vector<std::string>> DiskFileProvider::list() const
{
    std::error_code ec;
    if (!std::filesystem::is_directory(m_root, ec)) {
        return std::unexpected(Error::make(
            "InputRootMissing",
            std::format("Input path is not a readable directory: {}", m_root.string())));
    }

    std::vector<std::string> files;
    std::filesystem::recursive_directory_iterator it(
        m_root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "InputRootUnreadable",
            std::format("Failed to scan {}: {}", m_root.string(), ec.message())));
    }
    const auto end = std::filesystem::recursive_directory_iterator{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(Error::make(
                "InputRootUnreadable",
                std::format("Failed to scan {}: {}", m_root.string(), ec.message())));
        }
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || !is_source_file(entry.path())) {
            continue;
        }
        auto relative = std::filesystem::relative(entry.path(), m_root, type_ec);
        if (type_ec) {
            continue;
        }
        files.push_back(common::normalize_path(relative.generic_string()));
    }
    if (ec) {
        return std::unexpected(Error::make(
            "InputRootUnreadable",
            std::format("Failed to scan {}: {}", m_root.string(), ec.message())));
    }

    std::ranges::sort(files, common::stable_string_less);
    return files;
}

tsgen::Result<std::string> DiskFileProvider::read(const std::string& relative_path) const
{
    const auto path = m_root / relative_path;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("SourceReadFailed", "Failed to open source file: " + path.string()));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(
            Error::make("SourceReadFailed", "Failed to read source file: " + path.string()));
    }
    return text;
}

MemoryFileProvider::MemoryFileProvider(std::map<std::string, std::string> files)
{
    for (auto& [path, text] : files) {
        add(path, std::move(text));
    }
}

void MemoryFileProvider::add(const std::string& relative_path, std::string text)
{
    m_files.insert_or_assign(common::normalize_path(relative_path), std::move(text));
}

tsgen::Result<std::vector<std::string>> MemoryFileProvider::list() const
{
    std::vector<std::string> files;
    files.reserve(m_files.size());
    for (const auto& [path, _] : m_files) {
        if (path.ends_with(kSourceExtension)) {
            files.push_back(path);
        }
    }
    return files;
}

tsgen::Result<std::string> MemoryFileProvider::read(const std::string& relative_path) const
{
    auto it = m_files.find(relative_path);
    if (it == m_files.end()) {
        return std::unexpected(
            Error::make("SourceReadFailed", "No such source file: " + relative_path));
    }
    return it->second;
}

}  // namespace tsgen::source
