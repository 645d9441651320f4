#include <volserve/common/format.h>
#include <volserve/config/config_helpers.h>
#include <volserve/config/server_config.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <vector>

namespace volserve::config {

namespace fs = std::filesystem;

namespace {

fs::path resolveUnder(const fs::path& root, const fs::path& p) {
    if (p.is_absolute())
        return p.lexically_normal();
    return (root / p).lexically_normal();
}

// Strip a trailing "# comment" that is not inside quotes
std::string stripInlineComment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

class SectionReader {
public:
    SectionReader(const TomlSections& sections, std::string section)
        : section_(std::move(section)) {
        if (auto it = sections.find(section_); it != sections.end())
            values_ = &it->second;
    }

    const std::string* find(const std::string& key) const {
        if (!values_)
            return nullptr;
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &it->second;
    }

    void readString(const std::string& key, std::string& out) const {
        if (auto* v = find(key))
            out = *v;
    }

    void readPath(const std::string& key, fs::path& out) const {
        if (auto* v = find(key))
            out = expand_tilde(*v);
    }

    template <typename T> void readUnsigned(const std::string& key, T& out) {
        if (auto* v = find(key)) {
            if (auto parsed = parse_unsigned<T>(*v)) {
                out = *parsed;
            } else {
                problems_.push_back(fmt_format("[{}] {} is not a valid number: '{}'", section_, key, *v));
            }
        }
    }

    template <typename T, typename Parser>
    void readEnum(const std::string& key, T& out, Parser parser) {
        if (auto* v = find(key)) {
            auto parsed = parser(*v);
            if (parsed) {
                out = parsed.value();
            } else {
                problems_.push_back(fmt_format("[{}] {}", section_, parsed.error().message));
            }
        }
    }

    std::vector<std::string>& problems() { return problems_; }

private:
    std::string section_;
    const std::map<std::string, std::string>* values_{nullptr};
    std::vector<std::string> problems_;
};

} // namespace

fs::path ServerConfig::rootDir() const {
    std::error_code ec;
    fs::path root = server.rootDir.empty() ? fs::current_path(ec) : server.rootDir;
    auto abs = fs::absolute(root, ec);
    return ec ? root.lexically_normal() : abs.lexically_normal();
}

fs::path ServerConfig::partsDir() const {
    return resolveUnder(rootDir(), parts.dir);
}

fs::path ServerConfig::cacheDir() const {
    return resolveUnder(rootDir(), cache.dir);
}

Result<TomlSections> parseTomlConfig(const fs::path& path) {
    TomlSections config;
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open config file: " + path.string()};
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Check for section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             "Unterminated section header in " + path.string() + ": " + line};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        // Parse key-value pairs
        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = line.substr(0, eq);
        std::string value = stripInlineComment(line.substr(eq + 1));
        trim(key);
        config[currentSection][key] = unquote(value);
    }

    return config;
}

Result<void> applyTomlSections(const TomlSections& sections, ServerConfig& cfg) {
    std::vector<std::string> problems;
    auto collect = [&problems](SectionReader& r) {
        problems.insert(problems.end(), r.problems().begin(), r.problems().end());
    };

    SectionReader server(sections, "server");
    server.readString("host", cfg.server.host);
    server.readUnsigned("port", cfg.server.port);
    server.readPath("root_dir", cfg.server.rootDir);
    server.readString("index_document", cfg.server.indexDocument);
    collect(server);

    SectionReader parts(sections, "parts");
    parts.readPath("dir", cfg.parts.dir);
    parts.readString("base_name", cfg.parts.baseName);
    parts.readUnsigned("count", cfg.parts.count);
    parts.readUnsigned("pad_width", cfg.parts.padWidth);
    parts.readString("volume_prefix", cfg.parts.volumePrefix);
    parts.readString("final_extension", cfg.parts.finalExtension);
    parts.readUnsigned("min_part_bytes", cfg.parts.minPartBytes);
    parts.readString("mime_type", cfg.parts.mimeType);
    if (auto* manifest = parts.find("manifest"); manifest && !manifest->empty())
        cfg.parts.manifestFile = expand_tilde(*manifest);
    collect(parts);

    SectionReader pipeline(sections, "pipeline");
    pipeline.readEnum("mode", cfg.pipeline.mode, parsePipelineMode);
    pipeline.readEnum("extractor", cfg.pipeline.extractor, parseExtractorKind);
    pipeline.readString("external_tool", cfg.pipeline.externalTool);
    pipeline.readUnsigned("chunk_size_bytes", cfg.pipeline.chunkSizeBytes);
    pipeline.readString("preferred_artifact", cfg.pipeline.preferredArtifact);
    pipeline.readEnum("selection_order", cfg.pipeline.selectionOrder, parseSelectionOrder);
    collect(pipeline);

    SectionReader cache(sections, "cache");
    cache.readPath("dir", cfg.cache.dir);
    collect(cache);

    SectionReader logging(sections, "logging");
    logging.readString("level", cfg.logging.level);
    logging.readPath("file", cfg.logging.file);
    collect(logging);

    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid configuration:";
        for (const auto& p : problems)
            oss << "\n- " << p;
        return Error{ErrorCode::InvalidArgument, oss.str()};
    }
    return Result<void>();
}

Result<ServerConfig> loadServerConfig(const fs::path& path) {
    auto sections = parseTomlConfig(path);
    if (!sections)
        return sections.error();

    ServerConfig cfg;
    auto applied = applyTomlSections(sections.value(), cfg);
    if (!applied)
        return applied.error();

    // A relative manifest path in a config file is taken from the config file's directory
    if (cfg.parts.manifestFile && cfg.parts.manifestFile->is_relative())
        cfg.parts.manifestFile = (path.parent_path() / *cfg.parts.manifestFile).lexically_normal();

    spdlog::debug("Loaded configuration from {}", path.string());
    return cfg;
}

Result<void> validate(const ServerConfig& cfg) {
    std::vector<std::string> problems;

    if (cfg.server.port == 0)
        problems.emplace_back("server.port must be in 1..65535");
    if (cfg.pipeline.chunkSizeBytes < MIN_CHUNK_SIZE || cfg.pipeline.chunkSizeBytes > MAX_CHUNK_SIZE)
        problems.push_back(fmt_format("pipeline.chunk_size_bytes must be in [{}, {}], got {}",
                                      MIN_CHUNK_SIZE, MAX_CHUNK_SIZE,
                                      cfg.pipeline.chunkSizeBytes));
    if (!cfg.parts.manifestFile) {
        if (cfg.parts.baseName.empty())
            problems.emplace_back("parts.base_name is required when no parts.manifest is set");
        if (cfg.parts.count == 0)
            problems.emplace_back("parts.count must be at least 1");
        if (cfg.parts.padWidth < 1 || cfg.parts.padWidth > 9)
            problems.emplace_back("parts.pad_width must be in 1..9");
    }
    if (cfg.pipeline.extractor == ExtractorKind::ExternalTool &&
        cfg.pipeline.mode == PipelineMode::Raw) {
        spdlog::debug("pipeline.extractor=external has no effect in raw mode");
    }

    if (problems.empty())
        return Result<void>();

    std::ostringstream oss;
    oss << "Invalid configuration:";
    for (const auto& p : problems)
        oss << "\n- " << p;
    return Error{ErrorCode::InvalidArgument, oss.str()};
}

std::string describe(const ServerConfig& cfg) {
    std::ostringstream oss;
    oss << "listen: " << cfg.server.host << ":" << cfg.server.port << "\n"
        << "root_dir: " << cfg.rootDir().string() << "\n"
        << "index_document: " << cfg.server.indexDocument << "\n"
        << "parts_dir: " << cfg.partsDir().string() << "\n";
    if (cfg.parts.manifestFile) {
        oss << "manifest: " << cfg.parts.manifestFile->string() << "\n";
    } else {
        oss << "base_name: " << cfg.parts.baseName << "\n"
            << "count: " << cfg.parts.count << "\n"
            << "pad_width: " << cfg.parts.padWidth << "\n"
            << "volume_prefix: " << cfg.parts.volumePrefix << "\n"
            << "final_extension: " << cfg.parts.finalExtension << "\n";
    }
    oss << "min_part_bytes: " << cfg.parts.minPartBytes << "\n"
        << "mode: " << toString(cfg.pipeline.mode) << "\n"
        << "extractor: " << toString(cfg.pipeline.extractor) << "\n"
        << "external_tool: "
        << (cfg.pipeline.externalTool.empty() ? "(auto)" : cfg.pipeline.externalTool) << "\n"
        << "chunk_size_bytes: " << cfg.pipeline.chunkSizeBytes << "\n"
        << "preferred_artifact: "
        << (cfg.pipeline.preferredArtifact.empty() ? "(none)" : cfg.pipeline.preferredArtifact)
        << "\n"
        << "selection_order: " << toString(cfg.pipeline.selectionOrder) << "\n"
        << "cache_dir: " << cfg.cacheDir().string() << "\n";
    return oss.str();
}

Result<PipelineMode> parsePipelineMode(std::string_view s) {
    auto v = to_lower(s);
    if (v == "raw" || v == "concat")
        return PipelineMode::Raw;
    if (v == "extract")
        return PipelineMode::Extract;
    if (v == "repackage" || v == "repack")
        return PipelineMode::Repackage;
    return Error{ErrorCode::InvalidArgument,
                 fmt_format("unknown pipeline mode '{}' (expected raw|extract|repackage)", s)};
}

Result<ExtractorKind> parseExtractorKind(std::string_view s) {
    auto v = to_lower(s);
    if (v == "libarchive")
        return ExtractorKind::LibArchive;
    if (v == "external" || v == "7z")
        return ExtractorKind::ExternalTool;
    return Error{ErrorCode::InvalidArgument,
                 fmt_format("unknown extractor '{}' (expected libarchive|external)", s)};
}

Result<SelectionOrder> parseSelectionOrder(std::string_view s) {
    auto v = to_lower(s);
    if (v == "traversal")
        return SelectionOrder::Traversal;
    if (v == "lexicographic" || v == "sorted")
        return SelectionOrder::Lexicographic;
    return Error{ErrorCode::InvalidArgument,
                 fmt_format("unknown selection order '{}' (expected traversal|lexicographic)", s)};
}

} // namespace volserve::config
