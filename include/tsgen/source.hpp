#pragma once

/**
 * @file source.hpp
 * @brief Source scanning: enumerate backend files and supply their text
 */

#include "tsgen/common.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tsgen::source {

/// Extension of scanned backend sources
constexpr std::string_view kSourceExtension = ".rs";

/**
 * Read access to a tree of backend sources.
 *
 * Paths are normalized, '/'-separated and relative to the tree root.
 * list() must be deterministic: lexicographic by relative path.
 */
class FileProvider
{
public:
    FileProvider() = default;
    FileProvider(const FileProvider&) = delete;
    FileProvider& operator=(const FileProvider&) = delete;
    FileProvider(FileProvider&&) = delete;
    FileProvider& operator=(FileProvider&&) = delete;
    virtual ~FileProvider() = default;

    /// Enumerate every source file. Failure here is fatal for the run.
    [[nodiscard]] virtual tsgen::Result<std::vector<std::string>> list() const = 0;

    /// Read one file. Failure is local to that file.
    [[nodiscard]] virtual tsgen::Result<std::string> read(const std::string& relative_path) const = 0;
};

/**
 * Recursive scan of a directory on disk.
 */
class DiskFileProvider final : public FileProvider
{
public:
    explicit DiskFileProvider(std::filesystem::path root);

    [[nodiscard]] tsgen::Result<std::vector<std::string>> list() const override;
    [[nodiscard]] tsgen::Result<std::string> read(const std::string& relative_path) const override;

    [[nodiscard]] const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path m_root;
};

/**
 * In-memory source tree (tests, embedding).
 */
class MemoryFileProvider final : public FileProvider
{
public:
    MemoryFileProvider() = default;
    explicit MemoryFileProvider(std::map<std::string, std::string> files);

    void add(const std::string& relative_path, std::string text);

    [[nodiscard]] tsgen::Result<std::vector<std::string>> list() const override;
    [[nodiscard]] tsgen::Result<std::string> read(const std::string& relative_path) const override;

private:
    std::map<std::string, std::string> m_files;
};

}  // namespace tsgen::source
