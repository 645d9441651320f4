#include <gtest/gtest.h>

#include <volserve/assembly/part_locator.h>

#include "../../common/test_helpers.h"
#include "../../support/temp_dir_scope.hpp"

using namespace volserve;
using namespace volserve::assembly;
using volserve::test_support::TempDirScope;

namespace fs = std::filesystem;

namespace {

const std::string kLfsPointer = "version https://git-lfs.github.com/spec/v1\n"
                                "oid sha256:4d7a214614ab2935c943f9e0ff69d22eadbb8f32b1258daaa5e2ca24d17e2393\n"
                                "size 12345\n";

} // namespace

class PartLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg = test::makeConfig(tmp.path(), "Client", 4);
        auto m = manifest::fromNamingConvention(cfg);
        ASSERT_TRUE(m);
        manifest = m.value();
        for (std::size_t i = 0; i < manifest.parts.size(); ++i)
            test::writeFile(manifest.parts[i].path, test::patternBytes(1000 + i, i + 1));
    }

    TempDirScope tmp{TempDirScope::unique_path("volserve-locator")};
    config::ServerConfig cfg;
    manifest::ArtifactManifest manifest;
};

TEST_F(PartLocatorTest, LocatesEveryPartInOrder) {
    PartLocator locator;
    auto located = locator.locate(manifest);
    ASSERT_TRUE(located) << located.error().message;

    const auto& parts = located.value();
    ASSERT_EQ(parts.size(), 5u);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].descriptor.index, i + 1);
        EXPECT_EQ(parts[i].size, 1000 + i);
    }
    EXPECT_EQ(totalSize(parts), 5010u);
    EXPECT_GT(newestModification(parts), fs::file_time_type::min());
}

TEST_F(PartLocatorTest, MissingPartsListsExactlyTheAbsentFiles) {
    fs::remove(manifest.parts[1].path);
    fs::remove(manifest.parts[4].path);

    PartLocator locator;
    auto located = locator.locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::MissingParts);
    EXPECT_EQ(located.error().message,
              "Missing files:\n- files/Client.z02\n- files/Client.zip");
}

TEST_F(PartLocatorTest, DirectoryInPlaceOfPartCountsAsMissing) {
    fs::remove(manifest.parts[0].path);
    fs::create_directories(manifest.parts[0].path);

    auto located = PartLocator().locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::MissingParts);
    EXPECT_NE(located.error().message.find("files/Client.z01"), std::string::npos);
}

TEST_F(PartLocatorTest, MissingTakesPrecedenceOverPlaceholders) {
    test::writeFile(manifest.parts[0].path, kLfsPointer);
    fs::remove(manifest.parts[3].path);

    auto located = PartLocator().locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::MissingParts);
    EXPECT_EQ(located.error().message.find("Client.z01"), std::string::npos);
}

TEST_F(PartLocatorTest, GitLfsPointersAreReportedWithHint) {
    test::writeFile(manifest.parts[0].path, kLfsPointer);
    test::writeFile(manifest.parts[2].path, kLfsPointer);

    auto located = PartLocator().locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::PlaceholderPartsDetected);
    const auto& msg = located.error().message;
    EXPECT_NE(msg.find("- files/Client.z01 (Git LFS pointer)"), std::string::npos);
    EXPECT_NE(msg.find("- files/Client.z03 (Git LFS pointer)"), std::string::npos);
    EXPECT_EQ(msg.find("Client.z02"), std::string::npos);
    EXPECT_NE(msg.find("git lfs pull"), std::string::npos);
}

TEST_F(PartLocatorTest, TinyAndEmptyFilesArePlaceholders) {
    test::writeFile(manifest.parts[1].path, "tiny");
    test::writeFile(manifest.parts[3].path, "");

    auto statuses = PartLocator().inspect(manifest);
    ASSERT_EQ(statuses.size(), 5u);
    EXPECT_EQ(statuses[0].state, PartState::Ok);
    EXPECT_EQ(statuses[1].state, PartState::Placeholder);
    EXPECT_EQ(statuses[1].size, 4u);
    EXPECT_EQ(statuses[3].state, PartState::Placeholder);
    EXPECT_EQ(statuses[3].reason, "empty file");
}

TEST_F(PartLocatorTest, SizeHeuristicCanBeDisabled) {
    test::writeFile(manifest.parts[1].path, "tiny");

    PartLocator::Options options;
    options.minPartBytes = 0;
    auto located = PartLocator(options).locate(manifest);
    ASSERT_TRUE(located) << located.error().message;
    EXPECT_EQ(located.value()[1].size, 4u);
}

TEST_F(PartLocatorTest, EmptyPartIsRejectedEvenWithoutSizeHeuristic) {
    test::writeFile(manifest.parts[2].path, "");

    PartLocator::Options options;
    options.minPartBytes = 0;
    auto located = PartLocator(options).locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::PlaceholderPartsDetected);
    EXPECT_NE(located.error().message.find("files/Client.z03"), std::string::npos);
}

TEST_F(PartLocatorTest, DetectorIsPluggable) {
    PartLocator::Options options;
    options.detector = [](const fs::path& path, std::uint64_t, ByteSpan) -> std::string {
        return path.extension() == ".z03" ? "checksum mismatch" : "";
    };
    auto located = PartLocator(options).locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::PlaceholderPartsDetected);
    EXPECT_NE(located.error().message.find("files/Client.z03 (checksum mismatch)"),
              std::string::npos);

    // Without a detector only the size heuristic remains
    options.detector = nullptr;
    test::writeFile(manifest.parts[0].path, kLfsPointer + test::patternBytes(400));
    EXPECT_TRUE(PartLocator(options).locate(manifest));
}

TEST_F(PartLocatorTest, DeclaredSizesAreChecked) {
    manifest.parts[0].expectedSize = 1000;
    manifest.parts[2].expectedSize = 5;

    auto located = PartLocator().locate(manifest);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::PartSizeMismatch);
    EXPECT_NE(located.error().message.find("files/Client.z03 (expected 5 bytes, found 1002)"),
              std::string::npos);
    EXPECT_EQ(located.error().message.find("Client.z01"), std::string::npos);
}

TEST_F(PartLocatorTest, EmptyManifestIsInvalid) {
    manifest::ArtifactManifest empty;
    auto located = PartLocator().locate(empty);
    ASSERT_FALSE(located);
    EXPECT_EQ(located.error().code, ErrorCode::ManifestInvalid);
}
