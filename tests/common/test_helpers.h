// Shared fixtures for volserve tests: file builders, zip fixtures, split volumes.
#pragma once

#include <volserve/config/server_config.h>
#include <volserve/manifest/part_manifest.h>

#include <archive.h>
#include <archive_entry.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace volserve::test {

namespace fs = std::filesystem;

// Deterministic, effectively incompressible bytes
inline std::string patternBytes(std::size_t size, std::uint32_t seed = 1) {
    std::string out(size, '\0');
    std::uint32_t state = seed * 2654435761u + 1;
    for (auto& c : out) {
        state = state * 1664525u + 1013904223u;
        c = static_cast<char>(state >> 24);
    }
    return out;
}

inline fs::path writeFile(const fs::path& p, const std::string& data) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    return p;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Push the modification time forward so it is strictly newer than anything recorded
inline void touchLater(const fs::path& p, std::chrono::seconds by = std::chrono::seconds(5)) {
    fs::last_write_time(p, fs::file_time_type::clock::now() + by);
}

using Members = std::vector<std::pair<std::string, std::string>>;

// Zip archive written with libarchive; returns false on any libarchive failure
inline bool writeZip(const fs::path& dest, const Members& members) {
    fs::create_directories(dest.parent_path());
    struct archive* a = archive_write_new();
    if (!a)
        return false;
    bool ok = archive_write_set_format_zip(a) == ARCHIVE_OK &&
              archive_write_open_filename(a, dest.c_str()) == ARCHIVE_OK;
    for (const auto& [name, data] : members) {
        if (!ok)
            break;
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_entry_set_mtime(e, 1700000000, 0);
        ok = archive_write_header(a, e) == ARCHIVE_OK &&
             archive_write_data(a, data.data(), data.size()) == static_cast<la_ssize_t>(data.size());
        archive_entry_free(e);
    }
    ok = archive_write_close(a) == ARCHIVE_OK && ok;
    archive_write_free(a);
    return ok;
}

inline const Members& sampleMembers() {
    static const Members members = {
        {"readme.txt", "Extract everything and run bin/Game.exe\n"},
        {"bin/Game.exe", patternBytes(48 * 1024, 7)},
        {"data/assets.pak", patternBytes(20 * 1024, 11)},
        {"data/config.cfg", "fullscreen 1\n"},
    };
    return members;
}

/**
 * Cut a file into `count` numbered volumes plus a trailing final volume, following the
 * naming convention: <base>.z01 .. <base>.zNN, <base>.zip.
 */
inline std::vector<fs::path> splitIntoVolumes(const fs::path& source, const fs::path& dir,
                                              const std::string& base, std::size_t count) {
    const auto data = readFile(source);
    const std::size_t slices = count + 1;
    const std::size_t step = data.size() / slices;
    std::vector<fs::path> out;
    std::size_t offset = 0;
    for (std::size_t i = 1; i <= slices; ++i) {
        const std::size_t len = i == slices ? data.size() - offset : step;
        auto name = i == slices ? base + ".zip"
                                : manifest::volumeFileName(base, "z", i, 2);
        out.push_back(writeFile(dir / name, data.substr(offset, len)));
        offset += len;
    }
    return out;
}

// Naming-convention configuration rooted at root with parts under root/files
inline config::ServerConfig makeConfig(const fs::path& root, const std::string& base,
                                       std::size_t count,
                                       config::PipelineMode mode = config::PipelineMode::Raw) {
    config::ServerConfig cfg;
    cfg.server.rootDir = root;
    cfg.server.port = 8080;
    cfg.parts.dir = "files";
    cfg.parts.baseName = base;
    cfg.parts.count = count;
    cfg.pipeline.mode = mode;
    cfg.pipeline.chunkSizeBytes = 64 * 1024;
    cfg.cache.dir = "dist";
    return cfg;
}

} // namespace volserve::test
