#include <volserve/archive/archive_materializer.h>
#include <volserve/common/format.h>
#include <volserve/common/scratch_dir.h>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <vector>

#include <sys/stat.h>

namespace volserve::archive {

namespace fs = std::filesystem;

namespace {

constexpr size_t kCopyBufferSize = 256 * 1024;

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const noexcept { archive_entry_free(e); }
};

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

} // namespace

std::string normalizedArchiveName(const std::string& outputName) {
    fs::path name = outputName.empty() ? fs::path("artifact") : fs::path(outputName).filename();
    name.replace_extension(".zip");
    return name.string();
}

Result<std::uint64_t> writeZipArchive(const fs::path& tree, const fs::path& destination) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(tree, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot walk " + tree.string() + ": " + ec.message()};
    const auto end = fs::recursive_directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec)
            return Error{ErrorCode::IoError, "cannot walk " + tree.string() + ": " + ec.message()};
        if (fs::is_regular_file(it->symlink_status(ec)))
            files.push_back(it->path());
    }
    std::sort(files.begin(), files.end(), [&tree](const fs::path& a, const fs::path& b) {
        return a.lexically_relative(tree).generic_string() <
               b.lexically_relative(tree).generic_string();
    });

    std::unique_ptr<struct archive, ArchiveWriteDeleter> writer(archive_write_new());
    if (!writer)
        return Error{ErrorCode::InternalError, "libarchive allocation failed"};
    archive_write_set_format_zip(writer.get());
    if (archive_write_set_options(writer.get(), "zip:compression=deflate") < ARCHIVE_WARN)
        spdlog::warn("libarchive: {}", archiveError(writer.get()));
    if (archive_write_open_filename(writer.get(), destination.c_str()) != ARCHIVE_OK)
        return Error{ErrorCode::IoError,
                     "cannot create " + destination.string() + ": " + archiveError(writer.get())};

    std::vector<char> buffer(kCopyBufferSize);
    for (const auto& file : files) {
        struct stat st {};
        if (::stat(file.c_str(), &st) != 0)
            return Error{ErrorCode::IoError, "cannot stat " + file.string()};

        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        const auto rel = file.lexically_relative(tree).generic_string();
        archive_entry_set_pathname(entry.get(), rel.c_str());
        archive_entry_set_size(entry.get(), st.st_size);
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), st.st_mode & 0777);
        archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

        if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN)
            return Error{ErrorCode::IoError,
                         fmt_format("cannot add '{}': {}", rel, archiveError(writer.get()))};

        std::ifstream in(file, std::ios::binary);
        if (!in)
            return Error{ErrorCode::IoError, "cannot open " + file.string()};
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got <= 0)
                break;
            if (archive_write_data(writer.get(), buffer.data(), static_cast<size_t>(got)) < 0)
                return Error{ErrorCode::IoError,
                             fmt_format("cannot write '{}': {}", rel, archiveError(writer.get()))};
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK)
        return Error{ErrorCode::IoError,
                     "cannot finalize " + destination.string() + ": " + archiveError(writer.get())};

    auto size = fs::file_size(destination, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot stat " + destination.string()};
    spdlog::info("repackaged {} files into {} ({} bytes)", files.size(),
                 destination.filename().string(), size);
    return static_cast<std::uint64_t>(size);
}

ArchiveMaterializer::ArchiveMaterializer(Options options,
                                         std::unique_ptr<IArchiveExtractor> extractor,
                                         SelectionPolicy select)
    : options_(std::move(options)), extractor_(std::move(extractor)), select_(std::move(select)) {}

Result<BuildOutput> ArchiveMaterializer::build(const std::vector<assembly::LocatedPart>& parts,
                                               const fs::path& stagingDir) {
    auto scratch = ScratchDir::create_under(options_.scratchRoot, ".scratch-");
    if (!scratch)
        return scratch.error();

    const bool repackage = options_.mode == config::PipelineMode::Repackage;
    const auto tree = repackage ? scratch.value().path() / kTreeDir : stagingDir / kTreeDir;

    const auto started = std::chrono::steady_clock::now();
    auto extracted = extractor_->extract(parts, scratch.value().path(), tree);
    if (!extracted) {
        spdlog::warn("extraction via {} failed: {}", extractor_->name(), extracted.error().message);
        return extracted.error();
    }

    auto selected = select_(tree);
    if (!selected)
        return selected.error();

    BuildOutput out;
    out.extraction = extracted.value();
    out.mainArtifact = selected.value().relativePath;
    out.mainArtifactSize = selected.value().size;

    if (repackage) {
        out.servedName = normalizedArchiveName(options_.outputName);
        auto written = writeZipArchive(tree, stagingDir / out.servedName);
        if (!written)
            return written.error();
        out.servedRelative = out.servedName;
        out.servedSize = written.value();
    } else {
        out.servedRelative = fs::path(kTreeDir) / selected.value().relativePath;
        out.servedName = selected.value().path.filename().string();
        out.servedSize = selected.value().size;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("materialized {} ({} bytes) in {} ms", out.servedName, out.servedSize,
                 elapsed.count());
    return out;
}

std::unique_ptr<ArchiveMaterializer> makeMaterializer(const config::ServerConfig& cfg,
                                                      const std::string& outputName) {
    ArchiveMaterializer::Options options;
    options.mode = cfg.pipeline.mode == config::PipelineMode::Repackage
                       ? config::PipelineMode::Repackage
                       : config::PipelineMode::Extract;
    options.outputName = outputName;
    options.scratchRoot = cfg.cacheDir();
    return std::make_unique<ArchiveMaterializer>(std::move(options),
                                                 makeExtractor(cfg.pipeline),
                                                 makeSelectionPolicy(cfg.pipeline));
}

} // namespace volserve::archive
