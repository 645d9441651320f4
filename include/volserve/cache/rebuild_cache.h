#pragma once

#include <volserve/archive/archive_materializer.h>
#include <volserve/assembly/part_locator.h>
#include <volserve/core/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace volserve::cache {

/**
 * The published (Ready) materialization.
 */
struct CacheEntry {
    std::string generation;                // directory name under the cache dir
    std::filesystem::path artifact;        // served file, relative to the generation dir
    std::string servedName;
    std::uint64_t size{0};
    std::filesystem::path mainArtifact;    // selected member, relative to the extracted tree
    std::uint64_t mainArtifactSize{0};
    std::int64_t sourceMtimeNs{0};         // newest part modification time at build time
    std::int64_t builtAtUnix{0};
};

enum class CacheState { Absent, Ready, Stale };

constexpr const char* toString(CacheState state) {
    switch (state) {
        case CacheState::Absent: return "absent";
        case CacheState::Ready: return "ready";
        case CacheState::Stale: return "stale";
    }
    return "absent";
}

struct Obtained {
    CacheEntry entry;
    bool rebuilt{false};
};

// An artifact opened for streaming. The open handle keeps the data readable even if
// its generation is retired while the stream is in progress.
struct OpenedArtifact {
    CacheEntry entry;
    std::filesystem::path path;
    std::ifstream stream;
};

/**
 * Memoizes materialization, keyed on the newest modification time of the source parts.
 *
 * Absent -> Building -> Ready; Ready goes back to Building when forced, when any part is
 * newer than the recorded timestamp, or when the published output is missing or empty.
 * Builds are serialized. Each build runs in a private staging directory that is renamed
 * into a new generation, and cache.json is then replaced atomically. A failed build
 * leaves the previous generation published.
 */
class RebuildCache {
public:
    RebuildCache(std::filesystem::path cacheDir, archive::IArtifactBuilder& builder);

    RebuildCache(const RebuildCache&) = delete;
    RebuildCache& operator=(const RebuildCache&) = delete;

    // Create the directory, drop leftovers of interrupted builds, load cache.json
    Result<void> initialize();

    // Fresh entry, rebuilding when needed
    Result<Obtained> obtain(const std::vector<assembly::LocatedPart>& parts, bool force);

    // obtain() then open the published artifact for reading
    Result<OpenedArtifact> acquire(const std::vector<assembly::LocatedPart>& parts, bool force);

    [[nodiscard]] std::optional<CacheEntry> current() const;
    [[nodiscard]] CacheState stateFor(const std::vector<assembly::LocatedPart>& parts) const;
    [[nodiscard]] std::filesystem::path generationPath(const CacheEntry& entry) const;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return cacheDir_; }
    [[nodiscard]] std::uint64_t buildsCompleted() const noexcept { return builds_.load(); }

    static constexpr const char* kStateFile = "cache.json";

private:
    bool isFresh(const std::optional<CacheEntry>& entry, std::int64_t newestNs) const;
    Result<Obtained> rebuildLocked(const std::vector<assembly::LocatedPart>& parts,
                                   std::int64_t newestNs);
    Result<void> persist(const CacheEntry& entry) const;
    void sweepLeftovers(const std::optional<CacheEntry>& keep) const;

    std::filesystem::path cacheDir_;
    archive::IArtifactBuilder& builder_;

    std::mutex buildMutex_;                 // one build at a time
    mutable std::shared_mutex publishMutex_; // guards current_; shared while opening
    std::optional<CacheEntry> current_;
    std::atomic<std::uint64_t> builds_{0};
};

std::int64_t toNanos(std::filesystem::file_time_type t);

} // namespace volserve::cache
