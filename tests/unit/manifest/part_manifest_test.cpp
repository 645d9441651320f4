#include <gtest/gtest.h>

#include <volserve/manifest/part_manifest.h>

#include "../../common/test_helpers.h"
#include "../../support/temp_dir_scope.hpp"

using namespace volserve;
using namespace volserve::manifest;
using volserve::test_support::TempDirScope;

namespace fs = std::filesystem;

class PartManifestTest : public ::testing::Test {
protected:
    TempDirScope tmp{TempDirScope::unique_path("volserve-manifest")};
};

TEST_F(PartManifestTest, VolumeFileNameIsZeroPadded) {
    EXPECT_EQ(volumeFileName("Client", "z", 7, 2), "Client.z07");
    EXPECT_EQ(volumeFileName("Client", "z", 26, 2), "Client.z26");
    EXPECT_EQ(volumeFileName("Client", "z", 7, 3), "Client.z007");
    EXPECT_EQ(volumeFileName("Client", "r", 123, 2), "Client.r123");
}

TEST_F(PartManifestTest, NamingConventionListsVolumesThenFinal) {
    auto cfg = test::makeConfig(tmp.path(), "CS_Client", 3);
    auto m = fromNamingConvention(cfg);
    ASSERT_TRUE(m) << m.error().message;

    const auto& parts = m.value().parts;
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(m.value().outputName, "CS_Client.zip");
    EXPECT_EQ(m.value().mimeType, "application/zip");
    EXPECT_EQ(parts[0].displayPath.generic_string(), "files/CS_Client.z01");
    EXPECT_EQ(parts[2].displayPath.generic_string(), "files/CS_Client.z03");
    EXPECT_EQ(parts[3].displayPath.generic_string(), "files/CS_Client.zip");
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].index, i + 1);
        EXPECT_TRUE(parts[i].path.is_absolute());
    }
}

TEST_F(PartManifestTest, NamingConventionWithoutFinalVolume) {
    auto cfg = test::makeConfig(tmp.path(), "disk.img", 2);
    cfg.parts.finalExtension.clear();
    cfg.parts.volumePrefix = "part";
    cfg.parts.padWidth = 3;

    auto m = fromNamingConvention(cfg);
    ASSERT_TRUE(m);
    ASSERT_EQ(m.value().parts.size(), 2u);
    EXPECT_EQ(m.value().outputName, "disk.img");
    EXPECT_EQ(m.value().parts[1].path.filename().string(), "disk.img.part002");
}

TEST_F(PartManifestTest, NamingConventionRequiresBaseAndCount) {
    auto cfg = test::makeConfig(tmp.path(), "", 3);
    auto m = fromNamingConvention(cfg);
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::ManifestInvalid);

    cfg = test::makeConfig(tmp.path(), "Client", 0);
    EXPECT_FALSE(fromNamingConvention(cfg));
}

TEST_F(PartManifestTest, JsonManifestInDeclarationOrder) {
    const char* text = R"({"output": "Game.zip",
                           "parts": ["files/Game.z01", {"path": "files/Game.z02", "size": 10},
                                     "files/Game.zip"]})";
    auto m = parseManifestJson(text, tmp.path(), tmp.path());
    ASSERT_TRUE(m) << m.error().message;
    const auto& parts = m.value().parts;
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(m.value().outputName, "Game.zip");
    EXPECT_EQ(m.value().mimeType, "application/octet-stream");
    EXPECT_EQ(parts[0].path.string(), (tmp.path() / "files/Game.z01").string());
    EXPECT_EQ(parts[1].expectedSize.value_or(0), 10u);
    EXPECT_EQ(parts[2].displayPath.generic_string(), "files/Game.zip");
    EXPECT_EQ(parts[2].index, 3u);
    EXPECT_FALSE(m.value().declaredTotalSize().has_value());
}

TEST_F(PartManifestTest, JsonManifestOrdersByIndex) {
    const char* text = R"({"parts": [{"path": "c.bin", "index": 3, "size": 5},
                                     {"path": "a.bin", "index": 1, "size": 7},
                                     {"path": "b.bin", "index": 2, "size": 11}]})";
    auto m = parseManifestJson(text, tmp.path(), tmp.path());
    ASSERT_TRUE(m) << m.error().message;
    const auto& parts = m.value().parts;
    EXPECT_EQ(parts[0].path.filename().string(), "a.bin");
    EXPECT_EQ(parts[1].path.filename().string(), "b.bin");
    EXPECT_EQ(parts[2].path.filename().string(), "c.bin");
    // Output name defaults to the last part's file name
    EXPECT_EQ(m.value().outputName, "c.bin");
    EXPECT_EQ(m.value().declaredTotalSize().value_or(0), 23u);
}

TEST_F(PartManifestTest, JsonManifestRejectsBadShapes) {
    auto expectInvalid = [this](const char* text) {
        auto m = parseManifestJson(text, tmp.path(), tmp.path());
        ASSERT_FALSE(m) << text;
        EXPECT_EQ(m.error().code, ErrorCode::ManifestInvalid) << text;
    };
    expectInvalid("not json");
    expectInvalid("[]");
    expectInvalid(R"({"parts": []})");
    expectInvalid(R"({"parts": [42]})");
    expectInvalid(R"({"parts": [{"size": 3}]})");
    expectInvalid(R"({"parts": [{"path": "a", "index": 1}, "b"]})");
    expectInvalid(R"({"parts": [{"path": "a", "index": 1}, {"path": "b", "index": 1}]})");
    expectInvalid(R"({"parts": [{"path": "a", "size": -4}]})");
}

TEST_F(PartManifestTest, WronglyTypedFieldsAreManifestInvalid) {
    struct Case {
        const char* text;
        const char* mentions;
    };
    const Case cases[] = {
        {R"({"output": 5, "parts": ["a.bin"]})", "output must be a string"},
        {R"({"mime_type": [], "parts": ["a.bin"]})", "mime_type must be a string"},
        {R"({"parts": [{"path": 7}]})", "part #1: path must be a string"},
        {R"({"parts": ["a.bin", {"path": {"nested": true}}]})", "part #2: path must be a string"},
    };
    for (const auto& c : cases) {
        Result<ArtifactManifest> m = Error{ErrorCode::InternalError, "not run"};
        EXPECT_NO_THROW(m = parseManifestJson(c.text, tmp.path(), tmp.path())) << c.text;
        ASSERT_FALSE(m) << c.text;
        EXPECT_EQ(m.error().code, ErrorCode::ManifestInvalid) << c.text;
        EXPECT_NE(m.error().message.find(c.mentions), std::string::npos) << m.error().message;
    }

    // Through the file loader used at startup
    test::writeFile(tmp.path() / "typed.json", R"({"output": false, "parts": ["a.bin"]})");
    config::ServerConfig cfg;
    cfg.server.rootDir = tmp.path();
    cfg.parts.manifestFile = tmp.path() / "typed.json";
    Result<ArtifactManifest> resolved = Error{ErrorCode::InternalError, "not run"};
    EXPECT_NO_THROW(resolved = resolveManifest(cfg));
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, ErrorCode::ManifestInvalid);
}

TEST_F(PartManifestTest, ManifestFileResolvesAgainstItsDirectory) {
    const auto manifestDir = tmp.path() / "meta";
    test::writeFile(manifestDir / "artifact.json",
                    R"({"output": "out.bin", "parts": ["../files/out.001", "/abs/out.002"]})");

    auto m = loadManifestFile(manifestDir / "artifact.json", tmp.path());
    ASSERT_TRUE(m) << m.error().message;
    EXPECT_EQ(m.value().parts[0].path.string(), (tmp.path() / "files/out.001").string());
    EXPECT_EQ(m.value().parts[0].displayPath.generic_string(), "files/out.001");
    EXPECT_EQ(m.value().parts[1].path.string(), "/abs/out.002");
}

TEST_F(PartManifestTest, ResolvePrefersExplicitManifest) {
    test::writeFile(tmp.path() / "parts.json", R"({"output": "x.bin", "parts": ["x.1", "x.2"]})");
    auto cfg = test::makeConfig(tmp.path(), "Client", 5);
    cfg.parts.manifestFile = "parts.json";

    auto m = resolveManifest(cfg);
    ASSERT_TRUE(m) << m.error().message;
    EXPECT_EQ(m.value().outputName, "x.bin");
    EXPECT_EQ(m.value().parts.size(), 2u);

    cfg.parts.manifestFile.reset();
    auto implicit = resolveManifest(cfg);
    ASSERT_TRUE(implicit);
    EXPECT_EQ(implicit.value().parts.size(), 6u);
}

TEST_F(PartManifestTest, MissingManifestFileIsInvalid) {
    auto m = loadManifestFile(tmp.path() / "nope.json", tmp.path());
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::ManifestInvalid);
}
