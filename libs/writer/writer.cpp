/**
 * @file writer.cpp
 * @brief Staged disk writer and in-memory writer
 */

#include "tsgen/writer.hpp"

#include <format>
#include <fstream>
#include <ranges>
#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace tsgen::writer {

namespace {

/// Removes the staging directory on scope exit unless it was moved into place.
class StagingArea
{
public:
    explicit StagingArea(std::filesystem::path path)
        : m_path(std::move(path))
    {}

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    StagingArea(StagingArea&&) = delete;
    StagingArea& operator=(StagingArea&&) = delete;

    ~StagingArea()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

[[nodiscard]] tsgen::VoidResult ensure_directory(const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", std::format("Failed to create directory {}: {}", dir.string(), ec.message())));
    }
    return {};
}

[[nodiscard]] tsgen::VoidResult write_text_file(const std::filesystem::path& path, const std::string& content)
{
    if (auto dir = ensure_directory(path.parent_path()); !dir) {
        return dir;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] tsgen::VoidResult move_into_place(const std::filesystem::path& from, const std::filesystem::path& to)
{
    if (auto dir = ensure_directory(to.parent_path()); !dir) {
        return dir;
    }
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to move {} into place: {}", to.string(), ec.message())));
    }
    return {};
}

[[nodiscard]] tsgen::VoidResult path_conflict(const std::filesystem::path& path, std::string_view reason)
{
    return std::unexpected(Error::make("OutputPathConflict", std::format("{}: {}", reason, path.string())));
}

/// Copy every entry of the existing root that is not an artifact into the staging tree.
[[nodiscard]] tsgen::VoidResult carry_over_unrelated(const std::filesystem::path& root,
                                                     const std::filesystem::path& staging,
                                                     const std::set<std::string>& artifact_paths)
{
    namespace fs = std::filesystem;
    const auto io_error = [&](const fs::path& path, const std::error_code& ec) -> tsgen::VoidResult {
        return std::unexpected(
            Error::make("IOError", std::format("Failed to carry over {}: {}", path.string(), ec.message())));
    };

    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return io_error(root, ec);
    }
    while (it != fs::recursive_directory_iterator{}) {
        const fs::path source = it->path();
        const auto relative = source.lexically_relative(root);
        const auto target = staging / relative;
        const bool is_artifact = artifact_paths.contains(relative.generic_string());

        const auto status = it->symlink_status(ec);
        if (ec) {
            return io_error(source, ec);
        }
        if (fs::is_directory(status)) {
            if (is_artifact) {
                return path_conflict(source, "Artifact would replace a directory");
            }
            fs::create_directory(target, ec);
            if (ec) {
                return io_error(source, ec);
            }
        } else if (!is_artifact) {
            // Anything already staged here is a directory holding artifacts.
            if (fs::exists(fs::symlink_status(target, ec))) {
                return path_conflict(source, "Artifact needs a directory where the output root has a file");
            }
            if (fs::is_symlink(status)) {
                fs::copy_symlink(source, target, ec);
            } else {
                fs::copy_file(source, target, ec);
            }
            if (ec) {
                return io_error(source, ec);
            }
        }
        it.increment(ec);
        if (ec) {
            return io_error(source, ec);
        }
    }
    return {};
}

}  // namespace

tsgen::VoidResult validate_artifact_path(std::string_view path)
{
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string_view::npos
        || path.find(':') != std::string_view::npos) {
        return std::unexpected(
            Error::make("InvalidArtifactPath", std::format("Artifact path is not relative: '{}'", path)));
    }
    for (auto part : path | std::views::split('/')) {
        const std::string_view segment(part.begin(), part.end());
        if (segment.empty() || segment == "." || segment == "..") {
            return std::unexpected(Error::make(
                "InvalidArtifactPath",
                std::format("Artifact path has an empty, '.' or '..' segment: '{}'", path)));
        }
    }
    return {};
}

DiskWriter::DiskWriter(std::filesystem::path output_root)
    : m_root(std::move(output_root))
{
    m_root = m_root.lexically_normal();
    if (!m_root.has_filename() && m_root.has_parent_path()) {
        m_root = m_root.parent_path();
    }
}

std::filesystem::path DiskWriter::staging_path() const
{
    const auto absolute = std::filesystem::absolute(m_root);
    return absolute.parent_path() / std::format(".{}.tsgen-staging", absolute.filename().string());
}

std::filesystem::path DiskWriter::backup_path() const
{
    const auto absolute = std::filesystem::absolute(m_root);
    return absolute.parent_path() / std::format(".{}.tsgen-backup", absolute.filename().string());
}

tsgen::VoidResult DiskWriter::commit(const std::vector<render::Artifact>& artifacts)
{
    for (const auto& artifact : artifacts) {
        if (auto valid = validate_artifact_path(artifact.path); !valid) {
            return valid;
        }
    }
    if (artifacts.empty()) {
        return {};
    }

    const StagingArea staging(staging_path());
    std::error_code ec;
    std::filesystem::remove_all(staging.path(), ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to clear staging directory {}: {}", staging.path().string(), ec.message())));
    }

    for (const auto& artifact : artifacts) {
        if (auto written = write_text_file(staging.path() / artifact.path, artifact.content); !written) {
            return written;
        }
    }

    if (!std::filesystem::exists(m_root, ec)) {
        if (m_root.has_parent_path()) {
            if (auto dir = ensure_directory(m_root.parent_path()); !dir) {
                return dir;
            }
        }
        return move_into_place(staging.path(), m_root);
    }
    if (!std::filesystem::is_directory(m_root, ec)) {
        return path_conflict(m_root, "Output root is not a directory");
    }
    std::set<std::string> artifact_paths;
    for (const auto& artifact : artifacts) {
        artifact_paths.insert(artifact.path);
    }
    if (auto carried = carry_over_unrelated(m_root, staging.path(), artifact_paths); !carried) {
        return carried;
    }

    // The staging tree is now the complete new root; swap it in.
    const auto backup = backup_path();
    std::filesystem::remove_all(backup, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to clear backup directory {}: {}", backup.string(), ec.message())));
    }
    std::filesystem::rename(m_root, backup, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to move output root {} aside: {}", m_root.string(), ec.message())));
    }
    std::filesystem::rename(staging.path(), m_root, ec);
    if (ec) {
        std::error_code restore_ec;
        std::filesystem::rename(backup, m_root, restore_ec);
        if (restore_ec) {
            return std::unexpected(Error::make(
                "IOError",
                std::format("Failed to move {} into place: {}; previous output is kept at {}",
                            m_root.string(),
                            ec.message(),
                            backup.string())));
        }
        return std::unexpected(Error::make(
            "IOError",
            std::format("Failed to move {} into place: {}", m_root.string(), ec.message())));
    }
    std::filesystem::remove_all(backup, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError",
            std::format("Output written but backup {} could not be removed: {}", backup.string(), ec.message())));
    }
    return {};
}

tsgen::VoidResult MemoryWriter::commit(const std::vector<render::Artifact>& artifacts)
{
    std::map<std::string, std::string> staged;
    for (const auto& artifact : artifacts) {
        if (auto valid = validate_artifact_path(artifact.path); !valid) {
            return valid;
        }
        staged[artifact.path] = artifact.content;
    }
    for (auto& [path, content] : staged) {
        m_files[path] = std::move(content);
    }
    return {};
}

}  // namespace tsgen::writer
