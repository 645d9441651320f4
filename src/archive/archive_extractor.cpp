#include <volserve/archive/archive_extractor.h>
#include <volserve/assembly/part_stream.h>
#include <volserve/common/format.h>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace volserve::archive {

namespace fs = std::filesystem;

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;
constexpr std::array<const char*, 3> kDefaultTools{"7z", "7za", "7zz"};

constexpr const char* kCorruptHint =
    "Likely causes: parts out of order, wrong part count, or a truncated part.";

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const noexcept { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveDiskWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

Error corrupt(std::string detail) {
    return Error{ErrorCode::CorruptArchive, std::move(detail) + "\n" + kCorruptHint};
}

// Entry names are joined under destDir; absolute names and parent segments are refused
std::optional<fs::path> confinedPath(const fs::path& destDir, const std::string& name) {
    const fs::path rel(name);
    if (rel.has_root_name() || rel.has_root_directory())
        return std::nullopt;
    for (const auto& segment : rel) {
        if (segment == "..")
            return std::nullopt;
    }
    return destDir / rel;
}

Result<void> copyEntryData(struct archive* reader, struct archive* writer, std::uint64_t& bytes) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF)
            return Result<void>();
        if (r < ARCHIVE_WARN)
            return corrupt("cannot read member data: " + archiveError(reader));
        if (r == ARCHIVE_WARN)
            spdlog::warn("libarchive: {}", archiveError(reader));
        if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_WARN)
            return Error{ErrorCode::IoError, "cannot write member data: " + archiveError(writer)};
        bytes += size;
    }
}

std::string tailOfFile(const fs::path& p, size_t maxBytes = 2048) {
    std::ifstream in(p, std::ios::binary);
    if (!in)
        return {};
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (text.size() > maxBytes)
        text.erase(0, text.size() - maxBytes);
    return text;
}

bool isExecutableFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

} // namespace

std::optional<fs::path> findExecutable(const std::string& program) {
    if (program.empty())
        return std::nullopt;
    if (program.find('/') != std::string::npos) {
        if (isExecutableFile(program))
            return fs::path(program);
        return std::nullopt;
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;
    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty())
            continue;
        auto candidate = fs::path(dir) / program;
        if (isExecutableFile(candidate))
            return candidate;
    }
    return std::nullopt;
}

ExtractionStats summarizeTree(const fs::path& tree) {
    ExtractionStats stats;
    std::error_code ec;
    fs::recursive_directory_iterator it(tree, ec);
    if (ec)
        return stats;
    const auto end = fs::recursive_directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec)
            break;
        auto st = it->symlink_status(ec);
        if (fs::is_directory(st)) {
            ++stats.directories;
        } else if (fs::is_regular_file(st)) {
            ++stats.files;
            stats.bytes += it->file_size(ec);
        }
    }
    return stats;
}

// ---------------- LibArchiveExtractor ----------------

std::string LibArchiveExtractor::availability() const {
    return fmt_format("linked ({})", archive_version_string());
}

Result<ExtractionStats> LibArchiveExtractor::extract(const std::vector<assembly::LocatedPart>& parts,
                                                     const fs::path& scratchDir,
                                                     const fs::path& destDir) {
    const auto workingCopy = scratchDir / "assembled.bin";
    auto written = assembly::concatenateToFile(parts, chunkSize_, workingCopy);
    if (!written)
        return written.error();
    spdlog::debug("assembled working copy {} ({} bytes)", workingCopy.string(), written.value());

    auto stats = extractFile(workingCopy, destDir);

    // The working copy can be as large as the artifact; drop it as soon as possible
    std::error_code ec;
    fs::remove(workingCopy, ec);
    return stats;
}

Result<ExtractionStats> LibArchiveExtractor::extractFile(const fs::path& archivePath,
                                                         const fs::path& destDir) const {
    ArchiveReader reader(archive_read_new());
    ArchiveDiskWriter writer(archive_write_disk_new());
    if (!reader || !writer)
        return Error{ErrorCode::InternalError, "libarchive allocation failed"};

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());

    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), kReadBlockSize) !=
        ARCHIVE_OK) {
        return corrupt("cannot open archive index: " + archiveError(reader.get()));
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot create " + destDir.string() + ": " + ec.message()};

    ExtractionStats stats;
    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r < ARCHIVE_WARN)
            return corrupt("cannot read archive entry: " + archiveError(reader.get()));
        if (r == ARCHIVE_WARN)
            spdlog::warn("libarchive: {}", archiveError(reader.get()));

        // Copied: set_pathname below replaces the storage the entry hands out
        const char* rawName = archive_entry_pathname(entry);
        if (!rawName || !*rawName)
            continue;
        const std::string name(rawName);
        auto target = confinedPath(destDir, name);
        if (!target)
            return corrupt(fmt_format("entry '{}' points outside the extraction directory", name));
        archive_entry_set_pathname(entry, target->c_str());

        if (const char* link = archive_entry_hardlink(entry); link && *link) {
            auto linkTarget = confinedPath(destDir, link);
            if (!linkTarget)
                return corrupt(fmt_format("hard link '{}' points outside the extraction directory",
                                          name));
            archive_entry_set_hardlink(entry, linkTarget->c_str());
        }

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            return Error{ErrorCode::IoError,
                         fmt_format("cannot extract '{}': {}", name, archiveError(writer.get()))};
        }
        if (r == ARCHIVE_WARN)
            spdlog::warn("libarchive: {}: {}", name, archiveError(writer.get()));

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            ++stats.directories;
        } else {
            ++stats.files;
            if (archive_entry_size(entry) > 0) {
                auto copied = copyEntryData(reader.get(), writer.get(), stats.bytes);
                if (!copied)
                    return copied.error();
            }
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN)
            return Error{ErrorCode::IoError, "cannot finish entry: " + archiveError(writer.get())};
    }

    if (archive_write_close(writer.get()) < ARCHIVE_WARN)
        return Error{ErrorCode::IoError, "cannot finalize extraction: " + archiveError(writer.get())};

    spdlog::info("extracted {} files, {} directories, {} bytes ({})", stats.files,
                 stats.directories, stats.bytes, archive_format_name(reader.get()));
    return stats;
}

// ---------------- ExternalToolExtractor ----------------

Result<fs::path> ExternalToolExtractor::resolveTool() const {
    if (!tool_.empty()) {
        if (auto found = findExecutable(tool_))
            return *found;
        return Error{ErrorCode::ToolUnavailable,
                     fmt_format("external extractor '{}' not found or not executable.\n"
                                "Hint: install p7zip / 7-Zip or set pipeline.external_tool.",
                                tool_)};
    }
    for (const char* candidate : kDefaultTools) {
        if (auto found = findExecutable(candidate))
            return *found;
    }
    return Error{ErrorCode::ToolUnavailable,
                 "no external extractor found on PATH (tried 7z, 7za, 7zz).\n"
                 "Hint: install p7zip / 7-Zip or set pipeline.external_tool."};
}

std::string ExternalToolExtractor::availability() const {
    auto tool = resolveTool();
    if (tool)
        return "found at " + tool.value().string();
    return "not found";
}

const fs::path& ExternalToolExtractor::entryVolume(const std::vector<assembly::LocatedPart>& parts) {
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (it->descriptor.path.extension() == ".zip")
            return it->descriptor.path;
    }
    return parts.front().descriptor.path;
}

Result<ExtractionStats> ExternalToolExtractor::extract(const std::vector<assembly::LocatedPart>& parts,
                                                       const fs::path& scratchDir,
                                                       const fs::path& destDir) {
    if (parts.empty())
        return Error{ErrorCode::InvalidArgument, "no parts to extract"};

    auto tool = resolveTool();
    if (!tool)
        return tool.error();

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot create " + destDir.string() + ": " + ec.message()};

    const auto& volume = entryVolume(parts);
    const auto logPath = scratchDir / "extractor.log";

    // Everything the child needs is prepared before fork()
    std::vector<std::string> args{tool.value().string(), "x", "-y", "-bd",
                                  "-o" + destDir.string(), volume.string()};
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    int logFd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (logFd < 0)
        return Error{ErrorCode::IoError, "cannot create " + logPath.string() + ": " + std::strerror(errno)};
    int nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    spdlog::info("running {} on {}", args[0], volume.string());
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(logFd);
        if (nullFd >= 0)
            ::close(nullFd);
        return Error{ErrorCode::ToolUnavailable, std::string("fork() failed: ") + std::strerror(err)};
    }
    if (pid == 0) {
        if (nullFd >= 0)
            ::dup2(nullFd, STDIN_FILENO);
        ::dup2(logFd, STDOUT_FILENO);
        ::dup2(logFd, STDERR_FILENO);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }
    ::close(logFd);
    if (nullFd >= 0)
        ::close(nullFd);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0)
        return Error{ErrorCode::InternalError, std::string("waitpid() failed: ") + std::strerror(errno)};

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        auto stats = summarizeTree(destDir);
        spdlog::info("external extractor produced {} files, {} bytes", stats.files, stats.bytes);
        return stats;
    }

    const auto output = tailOfFile(logPath);
    if (WIFEXITED(status) && (WEXITSTATUS(status) == 127 || WEXITSTATUS(status) == 126)) {
        return Error{ErrorCode::ToolUnavailable,
                     fmt_format("cannot execute {}.\nHint: check the binary and its permissions.",
                                args[0])};
    }
    if (WIFSIGNALED(status)) {
        return Error{ErrorCode::InternalError,
                     fmt_format("{} killed by signal {}", args[0], WTERMSIG(status))};
    }
    return corrupt(fmt_format("{} exited with status {}:\n{}", args[0], WEXITSTATUS(status), output));
}

std::unique_ptr<IArchiveExtractor> makeExtractor(const config::PipelineSettings& pipeline) {
    switch (pipeline.extractor) {
        case config::ExtractorKind::ExternalTool:
            return std::make_unique<ExternalToolExtractor>(pipeline.externalTool);
        case config::ExtractorKind::LibArchive:
            break;
    }
    return std::make_unique<LibArchiveExtractor>(pipeline.chunkSizeBytes);
}

} // namespace volserve::archive
