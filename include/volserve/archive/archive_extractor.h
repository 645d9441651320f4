#pragma once

#include <volserve/assembly/part_locator.h>
#include <volserve/config/server_config.h>
#include <volserve/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace volserve::archive {

struct ExtractionStats {
    std::size_t files{0};
    std::size_t directories{0};
    std::uint64_t bytes{0};
};

/**
 * Unpacks the concatenation of parts into destDir.
 * scratchDir is a private, caller-owned directory for working copies and tool logs;
 * the caller removes it afterwards.
 */
class IArchiveExtractor {
public:
    virtual ~IArchiveExtractor() = default;

    virtual Result<ExtractionStats> extract(const std::vector<assembly::LocatedPart>& parts,
                                            const std::filesystem::path& scratchDir,
                                            const std::filesystem::path& destDir) = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    // One line for the diagnostic report
    [[nodiscard]] virtual std::string availability() const = 0;
};

/**
 * Concatenates the parts into a disk-backed working copy and reads it through
 * libarchive's index reader. Unreadable containers fail with CorruptArchive.
 */
class LibArchiveExtractor final : public IArchiveExtractor {
public:
    explicit LibArchiveExtractor(std::size_t chunkSize = DEFAULT_CHUNK_SIZE)
        : chunkSize_(chunkSize) {}

    Result<ExtractionStats> extract(const std::vector<assembly::LocatedPart>& parts,
                                    const std::filesystem::path& scratchDir,
                                    const std::filesystem::path& destDir) override;

    // Extract an archive file already on disk
    Result<ExtractionStats> extractFile(const std::filesystem::path& archivePath,
                                        const std::filesystem::path& destDir) const;

    [[nodiscard]] std::string name() const override { return "libarchive"; }
    [[nodiscard]] std::string availability() const override;

private:
    std::size_t chunkSize_;
};

/**
 * Runs an external unpacker (7-Zip family) on the volumes in place, for multi-volume
 * layouts whose offsets a plain index reader cannot span. The tool is opened on the
 * last ".zip" volume when there is one, otherwise on the first volume.
 */
class ExternalToolExtractor final : public IArchiveExtractor {
public:
    // tool: explicit path or program name; empty searches the default candidates
    explicit ExternalToolExtractor(std::string tool = {}) : tool_(std::move(tool)) {}

    Result<ExtractionStats> extract(const std::vector<assembly::LocatedPart>& parts,
                                    const std::filesystem::path& scratchDir,
                                    const std::filesystem::path& destDir) override;

    [[nodiscard]] std::string name() const override { return "external"; }
    [[nodiscard]] std::string availability() const override;

    // Resolve the executable; ToolUnavailable when nothing usable is found
    Result<std::filesystem::path> resolveTool() const;

    static const std::filesystem::path& entryVolume(const std::vector<assembly::LocatedPart>& parts);

private:
    std::string tool_;
};

// Search PATH for an executable program name; absolute/relative paths are checked directly
std::optional<std::filesystem::path> findExecutable(const std::string& program);

std::unique_ptr<IArchiveExtractor> makeExtractor(const config::PipelineSettings& pipeline);

// Count files, directories and bytes under a tree
ExtractionStats summarizeTree(const std::filesystem::path& tree);

} // namespace volserve::archive
