#include <gtest/gtest.h>

#include <volserve/config/config_helpers.h>
#include <volserve/config/server_config.h>

#include "../../common/test_helpers.h"
#include "../../support/temp_dir_scope.hpp"

using namespace volserve;
using namespace volserve::config;
using volserve::test_support::TempDirScope;

namespace fs = std::filesystem;

class ServerConfigTest : public ::testing::Test {
protected:
    fs::path writeConfig(const std::string& text) {
        auto path = tmp.path() / "etc" / "volserve.toml";
        test::writeFile(path, text);
        return path;
    }

    TempDirScope tmp{TempDirScope::unique_path("volserve-config")};
};

TEST_F(ServerConfigTest, ParsesSectionsCommentsAndQuotes) {
    auto path = writeConfig(R"(# deployment
[server]
host = "127.0.0.1"   # loopback only
port = 9090

[parts]
base_name = 'Client'
count=3
mime_type = "application/zip"   

[pipeline]
preferred_artifact = "Game #2.exe"
)");
    auto parsed = parseTomlConfig(path);
    ASSERT_TRUE(parsed) << parsed.error().message;
    auto& s = parsed.value();
    EXPECT_EQ(s["server"]["host"], "127.0.0.1");
    EXPECT_EQ(s["server"]["port"], "9090");
    EXPECT_EQ(s["parts"]["base_name"], "Client");
    EXPECT_EQ(s["parts"]["count"], "3");
    EXPECT_EQ(s["parts"]["mime_type"], "application/zip");
    // '#' inside quotes is part of the value
    EXPECT_EQ(s["pipeline"]["preferred_artifact"], "Game #2.exe");
}

TEST_F(ServerConfigTest, UnterminatedSectionIsRejected) {
    auto parsed = parseTomlConfig(writeConfig("[server\nport = 1\n"));
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ServerConfigTest, MissingFileIsIoError) {
    auto parsed = parseTomlConfig(tmp.path() / "absent.toml");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::IoError);
}

TEST_F(ServerConfigTest, AppliesEveryKnownKey) {
    TomlSections s;
    s["server"]["host"] = "::1";
    s["server"]["port"] = "8181";
    s["server"]["root_dir"] = "/srv/volserve";
    s["server"]["index_document"] = "start.html";
    s["parts"]["dir"] = "volumes";
    s["parts"]["base_name"] = "Pack";
    s["parts"]["count"] = "7";
    s["parts"]["pad_width"] = "3";
    s["parts"]["volume_prefix"] = "r";
    s["parts"]["final_extension"] = "";
    s["parts"]["min_part_bytes"] = "0";
    s["pipeline"]["mode"] = "Repackage";
    s["pipeline"]["extractor"] = "7z";
    s["pipeline"]["external_tool"] = "/opt/7zz";
    s["pipeline"]["chunk_size_bytes"] = "131072";
    s["pipeline"]["preferred_artifact"] = "setup.exe";
    s["pipeline"]["selection_order"] = "traversal";
    s["cache"]["dir"] = "out";
    s["logging"]["level"] = "debug";
    s["unknown"]["key"] = "ignored";

    ServerConfig cfg;
    ASSERT_TRUE(applyTomlSections(s, cfg));
    EXPECT_EQ(cfg.server.host, "::1");
    EXPECT_EQ(cfg.server.port, 8181);
    EXPECT_EQ(cfg.server.indexDocument, "start.html");
    EXPECT_EQ(cfg.parts.baseName, "Pack");
    EXPECT_EQ(cfg.parts.count, 7u);
    EXPECT_EQ(cfg.parts.padWidth, 3);
    EXPECT_EQ(cfg.parts.volumePrefix, "r");
    EXPECT_TRUE(cfg.parts.finalExtension.empty());
    EXPECT_EQ(cfg.parts.minPartBytes, 0u);
    EXPECT_EQ(cfg.pipeline.mode, PipelineMode::Repackage);
    EXPECT_EQ(cfg.pipeline.extractor, ExtractorKind::ExternalTool);
    EXPECT_EQ(cfg.pipeline.externalTool, "/opt/7zz");
    EXPECT_EQ(cfg.pipeline.chunkSizeBytes, 131072u);
    EXPECT_EQ(cfg.pipeline.preferredArtifact, "setup.exe");
    EXPECT_EQ(cfg.pipeline.selectionOrder, SelectionOrder::Traversal);
    EXPECT_EQ(cfg.logging.level, "debug");

    EXPECT_EQ(cfg.rootDir().string(), "/srv/volserve");
    EXPECT_EQ(cfg.partsDir().string(), "/srv/volserve/volumes");
    EXPECT_EQ(cfg.cacheDir().string(), "/srv/volserve/out");
}

TEST_F(ServerConfigTest, MalformedValuesAreAllReported) {
    TomlSections s;
    s["server"]["port"] = "80x";
    s["parts"]["count"] = "-2";
    s["pipeline"]["mode"] = "unzip";

    ServerConfig cfg;
    auto applied = applyTomlSections(s, cfg);
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, ErrorCode::InvalidArgument);
    const auto& msg = applied.error().message;
    EXPECT_NE(msg.find("[server] port is not a valid number: '80x'"), std::string::npos);
    EXPECT_NE(msg.find("[parts] count"), std::string::npos);
    EXPECT_NE(msg.find("unknown pipeline mode 'unzip'"), std::string::npos);
}

TEST_F(ServerConfigTest, PortOutOfRangeIsMalformed) {
    TomlSections s;
    s["server"]["port"] = "70000";
    ServerConfig cfg;
    EXPECT_FALSE(applyTomlSections(s, cfg));
    EXPECT_EQ(cfg.server.port, 8080);
}

TEST_F(ServerConfigTest, ValidateCollectsProblems) {
    ServerConfig cfg;
    cfg.server.port = 0;
    cfg.pipeline.chunkSizeBytes = 10;
    auto valid = validate(cfg);
    ASSERT_FALSE(valid);
    const auto& msg = valid.error().message;
    EXPECT_EQ(msg.rfind("Invalid configuration:", 0), 0u);
    EXPECT_NE(msg.find("server.port"), std::string::npos);
    EXPECT_NE(msg.find("pipeline.chunk_size_bytes"), std::string::npos);
    EXPECT_NE(msg.find("parts.base_name is required"), std::string::npos);
    EXPECT_NE(msg.find("parts.count must be at least 1"), std::string::npos);
}

TEST_F(ServerConfigTest, ManifestFileReplacesNamingConvention) {
    ServerConfig cfg;
    cfg.parts.manifestFile = tmp.path() / "parts.json";
    EXPECT_TRUE(validate(cfg));

    auto ok = test::makeConfig(tmp.path(), "Client", 3);
    EXPECT_TRUE(validate(ok));
}

TEST_F(ServerConfigTest, LoadResolvesManifestNextToConfigFile) {
    auto path = writeConfig(R"([server]
root_dir = "/srv/www"
[parts]
manifest = "parts.json"
[pipeline]
mode = extract
)");
    auto loaded = loadServerConfig(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& cfg = loaded.value();
    ASSERT_TRUE(cfg.parts.manifestFile.has_value());
    EXPECT_EQ(cfg.parts.manifestFile->string(), (tmp.path() / "etc" / "parts.json").string());
    EXPECT_EQ(cfg.pipeline.mode, PipelineMode::Extract);
    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.cache.dir.string(), "dist");
}

TEST_F(ServerConfigTest, LoadReportsMalformedFile) {
    auto loaded = loadServerConfig(writeConfig("[pipeline]\nchunk_size_bytes = big\n"));
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().message.find("chunk_size_bytes"), std::string::npos);
}

TEST_F(ServerConfigTest, DescribeShowsEffectiveSettings) {
    auto cfg = test::makeConfig(tmp.path(), "Client", 3, PipelineMode::Extract);
    auto text = describe(cfg);
    EXPECT_NE(text.find("listen: "), std::string::npos);
    EXPECT_NE(text.find("base_name: Client\n"), std::string::npos);
    EXPECT_NE(text.find("count: 3\n"), std::string::npos);
    EXPECT_NE(text.find("mode: extract\n"), std::string::npos);
    EXPECT_NE(text.find("external_tool: (auto)\n"), std::string::npos);
    EXPECT_NE(text.find("preferred_artifact: (none)\n"), std::string::npos);
    EXPECT_NE(text.find("cache_dir: " + cfg.cacheDir().string()), std::string::npos);
}

TEST(ServerConfigParseTest, EnumsAcceptAliasesInAnyCase) {
    EXPECT_EQ(parsePipelineMode("RAW").value(), PipelineMode::Raw);
    EXPECT_EQ(parsePipelineMode("concat").value(), PipelineMode::Raw);
    EXPECT_EQ(parsePipelineMode("Extract").value(), PipelineMode::Extract);
    EXPECT_EQ(parsePipelineMode("repack").value(), PipelineMode::Repackage);
    EXPECT_FALSE(parsePipelineMode(""));

    EXPECT_EQ(parseExtractorKind("libarchive").value(), ExtractorKind::LibArchive);
    EXPECT_EQ(parseExtractorKind("External").value(), ExtractorKind::ExternalTool);
    EXPECT_FALSE(parseExtractorKind("unrar"));

    EXPECT_EQ(parseSelectionOrder("sorted").value(), SelectionOrder::Lexicographic);
    EXPECT_EQ(parseSelectionOrder("traversal").value(), SelectionOrder::Traversal);
    EXPECT_FALSE(parseSelectionOrder("random"));

    EXPECT_STREQ(toString(PipelineMode::Repackage), "repackage");
    EXPECT_STREQ(toString(ExtractorKind::ExternalTool), "external");
}

TEST(ConfigHelpersTest, StrictUnsignedParsing) {
    EXPECT_EQ(parse_unsigned<std::uint16_t>("8080").value_or(0), 8080);
    EXPECT_FALSE(parse_unsigned<std::uint16_t>("65536").has_value());
    EXPECT_FALSE(parse_unsigned<std::size_t>("12k").has_value());
    EXPECT_FALSE(parse_unsigned<std::size_t>("").has_value());
    EXPECT_EQ(unquote("  'x y'  "), "x y");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
}
