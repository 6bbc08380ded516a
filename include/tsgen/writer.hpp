#pragma once

/**
 * @file writer.hpp
 * @brief Artifact sinks: all-or-nothing disk output and an in-memory collector
 */

#include "tsgen/common.hpp"
#include "tsgen/render.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tsgen::writer {

class Writer
{
public:
    Writer() = default;
    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;
    Writer(Writer&&) = delete;
    Writer& operator=(Writer&&) = delete;
    virtual ~Writer() = default;

    /// Persist every artifact of one run, or none of them.
    [[nodiscard]] virtual tsgen::VoidResult commit(const std::vector<render::Artifact>& artifacts) = 0;
};

/**
 * Reject anything but a relative, '/'-separated path without "." or ".." segments.
 */
[[nodiscard]] tsgen::VoidResult validate_artifact_path(std::string_view path);

/**
 * @brief Writes artifacts below an output root
 *
 * Artifacts are first written to "<parent>/.<root-name>.tsgen-staging". When
 * the root already exists, every file under it that is not an artifact of
 * this run is copied into the staging tree as well, so the staging tree is
 * the complete new root. The old root is then renamed to
 * "<parent>/.<root-name>.tsgen-backup", the staging tree is renamed onto the
 * root, and the backup is removed. Any failure before the swap leaves the
 * root untouched; a failed swap renames the backup back.
 *
 * An artifact that would replace a directory, or that needs a directory
 * where the root holds a file, fails with "OutputPathConflict".
 */
class DiskWriter final : public Writer
{
public:
    explicit DiskWriter(std::filesystem::path output_root);

    [[nodiscard]] tsgen::VoidResult commit(const std::vector<render::Artifact>& artifacts) override;

    [[nodiscard]] const std::filesystem::path& output_root() const { return m_root; }
    [[nodiscard]] std::filesystem::path staging_path() const;
    [[nodiscard]] std::filesystem::path backup_path() const;

private:
    std::filesystem::path m_root;
};

/**
 * @brief Collects artifacts in memory (tests, embedding)
 */
class MemoryWriter final : public Writer
{
public:
    [[nodiscard]] tsgen::VoidResult commit(const std::vector<render::Artifact>& artifacts) override;

    [[nodiscard]] const std::map<std::string, std::string>& files() const { return m_files; }

private:
    std::map<std::string, std::string> m_files;
};

}  // namespace tsgen::writer
