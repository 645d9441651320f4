#pragma once

#include <volserve/archive/archive_extractor.h>
#include <volserve/archive/artifact_selector.h>
#include <volserve/assembly/part_locator.h>
#include <volserve/config/server_config.h>
#include <volserve/core/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace volserve::archive {

/**
 * Result of one materialization, laid out inside the staging directory.
 */
struct BuildOutput {
    std::filesystem::path servedRelative; // file to stream, relative to the staging directory
    std::string servedName;               // attachment filename
    std::uint64_t servedSize{0};
    std::filesystem::path mainArtifact;   // selected member, relative to the extracted tree
    std::uint64_t mainArtifactSize{0};
    ExtractionStats extraction;
};

/**
 * Produces a servable artifact from located parts into a fresh staging directory.
 * Implementations must leave nothing behind outside stagingDir, on success or failure.
 */
class IArtifactBuilder {
public:
    virtual ~IArtifactBuilder() = default;

    virtual Result<BuildOutput> build(const std::vector<assembly::LocatedPart>& parts,
                                      const std::filesystem::path& stagingDir) = 0;
};

/**
 * Concatenate -> Extract -> [Repackage] -> Select.
 *
 * Extract mode: members are unpacked to <staging>/tree and the selected member is served.
 * Repackage mode: members are unpacked to a scratch directory, then rewritten as one
 * normalized zip at <staging>/<output stem>.zip, which is served.
 * Scratch directories live under scratchRoot and are removed on every exit path.
 */
class ArchiveMaterializer final : public IArtifactBuilder {
public:
    struct Options {
        config::PipelineMode mode{config::PipelineMode::Extract};
        std::string outputName;
        std::filesystem::path scratchRoot;
    };

    ArchiveMaterializer(Options options, std::unique_ptr<IArchiveExtractor> extractor,
                        SelectionPolicy select);

    Result<BuildOutput> build(const std::vector<assembly::LocatedPart>& parts,
                              const std::filesystem::path& stagingDir) override;

    [[nodiscard]] const IArchiveExtractor& extractor() const { return *extractor_; }

    static constexpr const char* kTreeDir = "tree";

private:
    Options options_;
    std::unique_ptr<IArchiveExtractor> extractor_;
    SelectionPolicy select_;
};

// Deterministic zip of every regular file under tree (sorted paths, member mtimes kept)
Result<std::uint64_t> writeZipArchive(const std::filesystem::path& tree,
                                      const std::filesystem::path& destination);

// Name of the normalized single-volume archive for an output name
std::string normalizedArchiveName(const std::string& outputName);

std::unique_ptr<ArchiveMaterializer> makeMaterializer(const config::ServerConfig& cfg,
                                                      const std::string& outputName);

} // namespace volserve::archive
