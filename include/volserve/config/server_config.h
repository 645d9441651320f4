#pragma once

#include <volserve/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace volserve::config {

/**
 * Stages run after concatenation.
 * Raw serves the concatenated stream, Extract serves a member of the unpacked tree,
 * Repackage serves a normalized single-volume archive built from the unpacked tree.
 */
enum class PipelineMode { Raw, Extract, Repackage };

enum class ExtractorKind { LibArchive, ExternalTool };

enum class SelectionOrder { Traversal, Lexicographic };

struct ServerSettings {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::filesystem::path rootDir; // empty = process working directory
    std::string indexDocument{"index.html"};
};

struct PartsSettings {
    std::filesystem::path dir{"files"};
    std::string baseName;
    std::size_t count{0};
    int padWidth{2};
    std::string volumePrefix{"z"};
    std::string finalExtension{"zip"}; // empty = no trailing final volume
    std::optional<std::filesystem::path> manifestFile;
    std::uint64_t minPartBytes{DEFAULT_MIN_PART_BYTES}; // 0 disables the size heuristic
    std::string mimeType{"application/zip"};
};

struct PipelineSettings {
    PipelineMode mode{PipelineMode::Raw};
    ExtractorKind extractor{ExtractorKind::LibArchive};
    std::string externalTool; // empty = search 7z, 7za, 7zz on PATH
    std::size_t chunkSizeBytes{DEFAULT_CHUNK_SIZE};
    std::string preferredArtifact;
    SelectionOrder selectionOrder{SelectionOrder::Lexicographic};
};

struct CacheSettings {
    std::filesystem::path dir{"dist"};
};

struct LoggingSettings {
    std::string level{"info"};
    std::filesystem::path file;
};

/**
 * Immutable deployment configuration. Built once at startup and handed to every
 * component by const reference.
 */
struct ServerConfig {
    ServerSettings server;
    PartsSettings parts;
    PipelineSettings pipeline;
    CacheSettings cache;
    LoggingSettings logging;

    // Resolved absolute directories (relative settings are taken from rootDir)
    [[nodiscard]] std::filesystem::path rootDir() const;
    [[nodiscard]] std::filesystem::path partsDir() const;
    [[nodiscard]] std::filesystem::path cacheDir() const;
};

using TomlSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse a TOML-subset file: [section] headers, key = value, # comments, quoted strings
Result<TomlSections> parseTomlConfig(const std::filesystem::path& path);

// Overlay parsed sections onto cfg. Unknown keys are ignored; malformed values fail.
Result<void> applyTomlSections(const TomlSections& sections, ServerConfig& cfg);

// Defaults overlaid with the given file
Result<ServerConfig> loadServerConfig(const std::filesystem::path& path);

// Report every problem in one InvalidArgument error
Result<void> validate(const ServerConfig& cfg);

// Human readable dump used by --print-config and /diag
std::string describe(const ServerConfig& cfg);

Result<PipelineMode> parsePipelineMode(std::string_view s);
Result<ExtractorKind> parseExtractorKind(std::string_view s);
Result<SelectionOrder> parseSelectionOrder(std::string_view s);

constexpr const char* toString(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::Raw: return "raw";
        case PipelineMode::Extract: return "extract";
        case PipelineMode::Repackage: return "repackage";
    }
    return "raw";
}

constexpr const char* toString(ExtractorKind kind) {
    switch (kind) {
        case ExtractorKind::LibArchive: return "libarchive";
        case ExtractorKind::ExternalTool: return "external";
    }
    return "libarchive";
}

constexpr const char* toString(SelectionOrder order) {
    switch (order) {
        case SelectionOrder::Traversal: return "traversal";
        case SelectionOrder::Lexicographic: return "lexicographic";
    }
    return "lexicographic";
}

} // namespace volserve::config
