#pragma once

#include <volserve/config/server_config.h>
#include <volserve/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace volserve::manifest {

/**
 * One volume of a split artifact. Parts are concatenated in ascending index order.
 */
struct PartDescriptor {
    std::size_t index{0};               // 1-based position in the concatenation
    std::filesystem::path path;         // absolute location on disk
    std::filesystem::path displayPath;  // path relative to the served root, for diagnostics
    std::optional<std::uint64_t> expectedSize;
};

/**
 * Declarative description of the single artifact this deployment serves.
 * Read-only once built.
 */
struct ArtifactManifest {
    std::string outputName;
    std::vector<PartDescriptor> parts;
    std::string mimeType{"application/octet-stream"};

    // Sum of declared part sizes; nullopt unless every part declares one
    [[nodiscard]] std::optional<std::uint64_t> declaredTotalSize() const;
};

// Implicit manifest: <dir>/<base>.<prefix>01 .. <prefix>NN followed by <base>.<final_extension>
Result<ArtifactManifest> fromNamingConvention(const config::ServerConfig& cfg);

// Explicit manifest parsed from JSON text. Relative part paths resolve against baseDir.
Result<ArtifactManifest> parseManifestJson(std::string_view text,
                                           const std::filesystem::path& baseDir,
                                           const std::filesystem::path& rootDir);

Result<ArtifactManifest> loadManifestFile(const std::filesystem::path& file,
                                          const std::filesystem::path& rootDir);

// Explicit manifest when configured, naming convention otherwise
Result<ArtifactManifest> resolveManifest(const config::ServerConfig& cfg);

// Volume file name for sequence number i, e.g. ("Client", "z", 7, 2) -> "Client.z07"
std::string volumeFileName(std::string_view baseName, std::string_view prefix, std::size_t i,
                           int padWidth);

std::filesystem::path relativeForDisplay(const std::filesystem::path& p,
                                         const std::filesystem::path& rootDir);

} // namespace volserve::manifest
