#pragma once

#include <volserve/core/types.h>
#include <volserve/manifest/part_manifest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace volserve::assembly {

/**
 * A part confirmed present on disk, with the size and modification time observed
 * when it was located.
 */
struct LocatedPart {
    manifest::PartDescriptor descriptor;
    std::uint64_t size{0};
    std::filesystem::file_time_type modified{};
};

enum class PartState { Ok, Missing, Placeholder, SizeMismatch };

constexpr const char* toString(PartState state) {
    switch (state) {
        case PartState::Ok: return "OK";
        case PartState::Missing: return "MISSING";
        case PartState::Placeholder: return "PLACEHOLDER";
        case PartState::SizeMismatch: return "SIZE_MISMATCH";
    }
    return "UNKNOWN";
}

struct PartStatus {
    manifest::PartDescriptor descriptor;
    PartState state{PartState::Missing};
    std::uint64_t size{0};
    std::filesystem::file_time_type modified{};
    std::string reason; // empty when Ok
};

/**
 * Decides whether a part is a stand-in reference rather than real content.
 * Receives the leading bytes of the file (at most signatureBytes) and its full size.
 * Returns a reason string when the part is a placeholder, empty otherwise.
 */
using PlaceholderDetector =
    std::function<std::string(const std::filesystem::path& path, std::uint64_t size, ByteSpan head)>;

// Git LFS pointer files ("version https://git-lfs.github.com/spec/v1 ...")
PlaceholderDetector gitLfsPointerDetector();

class PartLocator {
public:
    struct Options {
        std::uint64_t minPartBytes{DEFAULT_MIN_PART_BYTES}; // 0 disables
        std::size_t signatureBytes{64};
        PlaceholderDetector detector{gitLfsPointerDetector()};
    };

    PartLocator();
    explicit PartLocator(Options options);

    /**
     * Validate every part of the manifest, in order.
     * Fails with MissingParts enumerating every absent path, then with
     * PlaceholderPartsDetected enumerating every stand-in, then with PartSizeMismatch.
     * Read-only.
     */
    Result<std::vector<LocatedPart>> locate(const manifest::ArtifactManifest& manifest) const;

    // Per-part status without failing; used by the diagnostic report
    std::vector<PartStatus> inspect(const manifest::ArtifactManifest& manifest) const;

private:
    PartStatus inspectOne(const manifest::PartDescriptor& part) const;

    Options options_;
};

std::uint64_t totalSize(const std::vector<LocatedPart>& parts);

// Latest modification time across parts (min() for an empty list)
std::filesystem::file_time_type newestModification(const std::vector<LocatedPart>& parts);

} // namespace volserve::assembly
