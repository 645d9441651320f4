#include <volserve/common/format.h>
#include <volserve/manifest/part_manifest.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

using nlohmann::json;

namespace volserve::manifest {

namespace fs = std::filesystem;

std::optional<std::uint64_t> ArtifactManifest::declaredTotalSize() const {
    std::uint64_t total = 0;
    for (const auto& part : parts) {
        if (!part.expectedSize)
            return std::nullopt;
        total += *part.expectedSize;
    }
    return total;
}

std::string volumeFileName(std::string_view baseName, std::string_view prefix, std::size_t i,
                           int padWidth) {
    auto number = std::to_string(i);
    if (static_cast<int>(number.size()) < padWidth)
        number.insert(0, static_cast<size_t>(padWidth) - number.size(), '0');
    std::string name(baseName);
    name += '.';
    name += prefix;
    name += number;
    return name;
}

fs::path relativeForDisplay(const fs::path& p, const fs::path& rootDir) {
    auto rel = p.lexically_relative(rootDir);
    if (rel.empty())
        return p;
    return rel;
}

Result<ArtifactManifest> fromNamingConvention(const config::ServerConfig& cfg) {
    const auto& parts = cfg.parts;
    if (parts.baseName.empty() || parts.count == 0) {
        return Error{ErrorCode::ManifestInvalid,
                     "naming convention requires parts.base_name and parts.count >= 1"};
    }

    const auto root = cfg.rootDir();
    const auto dir = cfg.partsDir();

    ArtifactManifest manifest;
    manifest.mimeType = parts.mimeType;
    manifest.outputName = parts.finalExtension.empty()
                              ? parts.baseName
                              : parts.baseName + "." + parts.finalExtension;

    manifest.parts.reserve(parts.count + 1);
    for (std::size_t i = 1; i <= parts.count; ++i) {
        PartDescriptor d;
        d.index = i;
        d.path = dir / volumeFileName(parts.baseName, parts.volumePrefix, i, parts.padWidth);
        d.displayPath = relativeForDisplay(d.path, root);
        manifest.parts.push_back(std::move(d));
    }
    if (!parts.finalExtension.empty()) {
        PartDescriptor last;
        last.index = parts.count + 1;
        last.path = dir / manifest.outputName;
        last.displayPath = relativeForDisplay(last.path, root);
        manifest.parts.push_back(std::move(last));
    }
    return manifest;
}

namespace {

// Missing key -> fallback; present but not a string -> error
Result<std::string> stringField(const json& obj, const char* key, std::string fallback,
                                const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (!it->is_string())
        return Error{ErrorCode::ManifestInvalid,
                     fmt_format("{}{} must be a string, got {}", where, key, it->type_name())};
    return it->get<std::string>();
}

Result<ArtifactManifest> manifestFromJson(const json& j, const fs::path& baseDir,
                                          const fs::path& rootDir) {
    if (!j.is_object())
        return Error{ErrorCode::ManifestInvalid, "manifest must be a JSON object"};

    ArtifactManifest manifest;
    auto output = stringField(j, "output", {}, "");
    if (!output)
        return output.error();
    manifest.outputName = std::move(output).value();
    auto mime = stringField(j, "mime_type", "application/octet-stream", "");
    if (!mime)
        return mime.error();
    manifest.mimeType = std::move(mime).value();

    auto it = j.find("parts");
    if (it == j.end() || !it->is_array() || it->empty())
        return Error{ErrorCode::ManifestInvalid, "manifest.parts must be a non-empty array"};

    size_t withIndex = 0;
    size_t position = 0;
    for (const auto& entry : *it) {
        ++position;
        PartDescriptor d;
        std::string rawPath;
        if (entry.is_string()) {
            rawPath = entry.get<std::string>();
        } else if (entry.is_object()) {
            auto path = stringField(entry, "path", {}, fmt_format("part #{}: ", position));
            if (!path)
                return path.error();
            rawPath = std::move(path).value();
            if (auto idx = entry.find("index"); idx != entry.end()) {
                if (!idx->is_number_unsigned())
                    return Error{ErrorCode::ManifestInvalid,
                                 fmt_format("part #{}: index must be an unsigned integer", position)};
                d.index = idx->get<std::size_t>();
                ++withIndex;
            }
            if (auto sz = entry.find("size"); sz != entry.end()) {
                if (!sz->is_number_unsigned())
                    return Error{ErrorCode::ManifestInvalid,
                                 fmt_format("part #{}: size must be an unsigned integer", position)};
                d.expectedSize = sz->get<std::uint64_t>();
            }
        } else {
            return Error{ErrorCode::ManifestInvalid,
                         fmt_format("part #{} must be a string or an object", position)};
        }

        if (rawPath.empty())
            return Error{ErrorCode::ManifestInvalid, fmt_format("part #{} has no path", position)};

        fs::path p(rawPath);
        d.path = (p.is_absolute() ? p : baseDir / p).lexically_normal();
        d.displayPath = relativeForDisplay(d.path, rootDir);
        if (d.index == 0 && withIndex == 0)
            d.index = position;
        manifest.parts.push_back(std::move(d));
    }

    if (withIndex != 0 && withIndex != manifest.parts.size()) {
        return Error{ErrorCode::ManifestInvalid,
                     "either every part declares an index or none does"};
    }
    if (withIndex != 0) {
        std::set<std::size_t> seen;
        for (const auto& part : manifest.parts) {
            if (!seen.insert(part.index).second)
                return Error{ErrorCode::ManifestInvalid,
                             fmt_format("duplicate part index {}", part.index)};
        }
        std::stable_sort(manifest.parts.begin(), manifest.parts.end(),
                         [](const PartDescriptor& a, const PartDescriptor& b) {
                             return a.index < b.index;
                         });
    }

    if (manifest.outputName.empty())
        manifest.outputName = manifest.parts.back().path.filename().string();

    return manifest;
}

} // namespace

Result<ArtifactManifest> parseManifestJson(std::string_view text, const fs::path& baseDir,
                                           const fs::path& rootDir) {
    try {
        return manifestFromJson(json::parse(text.begin(), text.end()), baseDir, rootDir);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ManifestInvalid, std::string("manifest parse error: ") + e.what()};
    } catch (const json::exception& e) {
        return Error{ErrorCode::ManifestInvalid, std::string("manifest is malformed: ") + e.what()};
    }
}

Result<ArtifactManifest> loadManifestFile(const fs::path& file, const fs::path& rootDir) {
    std::ifstream in(file, std::ios::binary);
    if (!in)
        return Error{ErrorCode::ManifestInvalid, "cannot open manifest: " + file.string()};
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    auto manifest = parseManifestJson(text, file.parent_path(), rootDir);
    if (!manifest) {
        return Error{manifest.error().code, file.string() + ": " + manifest.error().message};
    }
    spdlog::debug("Loaded manifest {} ({} parts, output '{}')", file.string(),
                  manifest.value().parts.size(), manifest.value().outputName);
    return manifest;
}

Result<ArtifactManifest> resolveManifest(const config::ServerConfig& cfg) {
    if (cfg.parts.manifestFile) {
        auto file = *cfg.parts.manifestFile;
        if (file.is_relative())
            file = cfg.rootDir() / file;
        return loadManifestFile(file, cfg.rootDir());
    }
    return fromNamingConvention(cfg);
}

} // namespace volserve::manifest
