#include <volserve/cache/rebuild_cache.h>
#include <volserve/common/format.h>
#include <volserve/common/scratch_dir.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iterator>

using nlohmann::json;

namespace volserve::cache {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kStagingPrefix = ".staging-";
constexpr std::string_view kScratchPrefix = ".scratch-";
constexpr std::string_view kGenerationPrefix = "gen-";

bool startsWith(const std::string& s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

json toJson(const CacheEntry& e) {
    return json{{"generation", e.generation},
                {"artifact", e.artifact.generic_string()},
                {"served_name", e.servedName},
                {"size", e.size},
                {"main_artifact", e.mainArtifact.generic_string()},
                {"main_artifact_size", e.mainArtifactSize},
                {"source_mtime_ns", e.sourceMtimeNs},
                {"built_at", e.builtAtUnix}};
}

Result<CacheEntry> fromJson(const json& j) {
    try {
        CacheEntry e;
        e.generation = j.at("generation").get<std::string>();
        e.artifact = j.at("artifact").get<std::string>();
        e.servedName = j.value("served_name", e.artifact.filename().string());
        e.size = j.at("size").get<std::uint64_t>();
        e.mainArtifact = j.value("main_artifact", std::string{});
        e.mainArtifactSize = j.value("main_artifact_size", std::uint64_t{0});
        e.sourceMtimeNs = j.at("source_mtime_ns").get<std::int64_t>();
        e.builtAtUnix = j.value("built_at", std::int64_t{0});
        if (!startsWith(e.generation, kGenerationPrefix) || e.artifact.empty())
            return Error{ErrorCode::InvalidArgument, "cache state names no generation"};
        return e;
    } catch (const json::exception& ex) {
        return Error{ErrorCode::InvalidArgument, std::string("cache state: ") + ex.what()};
    }
}

} // namespace

std::int64_t toNanos(fs::file_time_type t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

RebuildCache::RebuildCache(fs::path cacheDir, archive::IArtifactBuilder& builder)
    : cacheDir_(std::move(cacheDir)), builder_(builder) {}

fs::path RebuildCache::generationPath(const CacheEntry& entry) const {
    return cacheDir_ / entry.generation;
}

Result<void> RebuildCache::initialize() {
    std::error_code ec;
    fs::create_directories(cacheDir_, ec);
    if (ec)
        return Error{ErrorCode::IoError,
                     "cannot create cache directory " + cacheDir_.string() + ": " + ec.message()};

    std::optional<CacheEntry> loaded;
    const auto stateFile = cacheDir_ / kStateFile;
    if (fs::exists(stateFile, ec)) {
        std::ifstream in(stateFile, std::ios::binary);
        std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        auto parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("ignoring unreadable {}", stateFile.string());
        } else if (auto entry = fromJson(parsed)) {
            loaded = entry.value();
        } else {
            spdlog::warn("ignoring {}: {}", stateFile.string(), entry.error().message);
        }
    }

    sweepLeftovers(loaded);
    {
        std::unique_lock lock(publishMutex_);
        current_ = loaded;
    }
    if (loaded) {
        spdlog::info("cache: generation {} ({}, {} bytes)", loaded->generation,
                     loaded->servedName, loaded->size);
    } else {
        spdlog::info("cache: empty ({})", cacheDir_.string());
    }
    return Result<void>();
}

void RebuildCache::sweepLeftovers(const std::optional<CacheEntry>& keep) const {
    std::error_code ec;
    for (const auto& dirent : fs::directory_iterator(cacheDir_, ec)) {
        const auto name = dirent.path().filename().string();
        const bool interrupted = startsWith(name, kStagingPrefix) || startsWith(name, kScratchPrefix);
        const bool orphan = startsWith(name, kGenerationPrefix) && (!keep || keep->generation != name);
        if (!interrupted && !orphan)
            continue;
        std::error_code rmEc;
        fs::remove_all(dirent.path(), rmEc);
        if (rmEc) {
            spdlog::warn("cannot remove leftover {}: {}", dirent.path().string(), rmEc.message());
        } else {
            spdlog::debug("removed leftover {}", dirent.path().string());
        }
    }
}

std::optional<CacheEntry> RebuildCache::current() const {
    std::shared_lock lock(publishMutex_);
    return current_;
}

bool RebuildCache::isFresh(const std::optional<CacheEntry>& entry, std::int64_t newestNs) const {
    if (!entry)
        return false;
    if (newestNs > entry->sourceMtimeNs)
        return false;
    std::error_code ec;
    const auto path = generationPath(*entry) / entry->artifact;
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

CacheState RebuildCache::stateFor(const std::vector<assembly::LocatedPart>& parts) const {
    auto entry = current();
    if (!entry)
        return CacheState::Absent;
    return isFresh(entry, toNanos(assembly::newestModification(parts))) ? CacheState::Ready
                                                                          : CacheState::Stale;
}

Result<Obtained> RebuildCache::obtain(const std::vector<assembly::LocatedPart>& parts, bool force) {
    const auto newestNs = toNanos(assembly::newestModification(parts));

    if (!force) {
        auto entry = current();
        if (isFresh(entry, newestNs)) {
            spdlog::debug("cache hit: {}", entry->generation);
            return Obtained{*entry, false};
        }
    }

    std::unique_lock build(buildMutex_);
    if (!force) {
        // Another worker may have finished the build we were waiting for
        auto entry = current();
        if (isFresh(entry, newestNs)) {
            spdlog::debug("cache hit after wait: {}", entry->generation);
            return Obtained{*entry, false};
        }
    }
    return rebuildLocked(parts, newestNs);
}

Result<Obtained> RebuildCache::rebuildLocked(const std::vector<assembly::LocatedPart>& parts,
                                             std::int64_t newestNs) {
    const auto started = std::chrono::steady_clock::now();
    spdlog::info("rebuild started ({} parts)", parts.size());

    auto staging = ScratchDir::create_under(cacheDir_, std::string(kStagingPrefix));
    if (!staging)
        return staging.error();

    auto built = builder_.build(parts, staging.value().path());
    if (!built) {
        spdlog::warn("rebuild failed, keeping previous generation: {}", built.error().message);
        return built.error();
    }
    const auto& output = built.value();

    CacheEntry entry;
    entry.generation = ScratchDir::unique_component(std::string(kGenerationPrefix));
    entry.artifact = output.servedRelative;
    entry.servedName = output.servedName;
    entry.size = output.servedSize;
    entry.mainArtifact = output.mainArtifact;
    entry.mainArtifactSize = output.mainArtifactSize;
    entry.sourceMtimeNs = newestNs;
    entry.builtAtUnix = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();

    std::error_code ec;
    const auto published = generationPath(entry);
    fs::rename(staging.value().path(), published, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "cannot publish " + published.string() + ": " + ec.message()};
    }
    staging.value().release();

    auto persisted = persist(entry);
    if (!persisted) {
        fs::remove_all(published, ec);
        return persisted.error();
    }

    std::optional<CacheEntry> previous;
    {
        std::unique_lock lock(publishMutex_);
        previous = std::move(current_);
        current_ = entry;
    }
    // No reader can pick the previous generation any more; open handles stay valid
    if (previous && previous->generation != entry.generation) {
        fs::remove_all(generationPath(*previous), ec);
        if (ec)
            spdlog::warn("cannot retire {}: {}", previous->generation, ec.message());
    }

    builds_.fetch_add(1);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("rebuild finished: {} -> {} ({} bytes) in {} ms", entry.generation,
                 entry.servedName, entry.size, elapsed.count());
    return Obtained{entry, true};
}

Result<void> RebuildCache::persist(const CacheEntry& entry) const {
    const auto finalPath = cacheDir_ / kStateFile;
    const auto tmpPath = cacheDir_ / (std::string(kStateFile) + ".tmp");
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out)
            return Error{ErrorCode::IoError, "cannot write " + tmpPath.string()};
        out << toJson(entry).dump(2) << '\n';
        out.flush();
        if (!out)
            return Error{ErrorCode::IoError, "cannot write " + tmpPath.string()};
    }
    std::error_code ec;
    fs::rename(tmpPath, finalPath, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot replace " + finalPath.string() + ": " + ec.message()};
    return Result<void>();
}

Result<OpenedArtifact> RebuildCache::acquire(const std::vector<assembly::LocatedPart>& parts,
                                             bool force) {
    auto obtained = obtain(parts, force);
    if (!obtained)
        return obtained.error();

    std::shared_lock lock(publishMutex_);
    // current_ is at least as new as what obtain() returned
    const auto& entry = current_ ? *current_ : obtained.value().entry;
    OpenedArtifact opened;
    opened.entry = entry;
    opened.path = generationPath(entry) / entry.artifact;
    opened.stream.open(opened.path, std::ios::binary);
    if (!opened.stream)
        return Error{ErrorCode::IoError, "cannot open cached artifact " + opened.path.string()};
    return opened;
}

} // namespace volserve::cache
