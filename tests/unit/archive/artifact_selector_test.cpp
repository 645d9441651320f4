#include <gtest/gtest.h>

#include <volserve/archive/artifact_selector.h>

#include "../../common/test_helpers.h"
#include "../../support/temp_dir_scope.hpp"

using namespace volserve;
using namespace volserve::archive;
using volserve::test_support::TempDirScope;

namespace fs = std::filesystem;

class ArtifactSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::writeFile(tree / "readme.txt", std::string(100, 'r'));
        test::writeFile(tree / "bin/Game.exe", std::string(5000, 'g'));
        test::writeFile(tree / "data/assets.pak", std::string(9000, 'a'));
        test::writeFile(tree / "data/Config.CFG", std::string(10, 'c'));
    }

    TempDirScope tmp{TempDirScope::unique_path("volserve-selector")};
    fs::path tree{tmp.path() / "tree"};
};

TEST_F(ArtifactSelectorTest, LargestFileWinsWithoutPreference) {
    ArtifactSelector selector;
    for (int i = 0; i < 3; ++i) {
        auto selected = selector.select(tree);
        ASSERT_TRUE(selected) << selected.error().message;
        EXPECT_EQ(selected.value().relativePath.generic_string(), "data/assets.pak");
        EXPECT_EQ(selected.value().size, 9000u);
        EXPECT_EQ(selected.value().path.string(), (tree / "data/assets.pak").string());
    }
}

TEST_F(ArtifactSelectorTest, PreferredNameMatchesAnyCaseRegardlessOfSize) {
    ArtifactSelector selector({"game.EXE", config::SelectionOrder::Lexicographic});
    auto selected = selector.select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "bin/Game.exe");

    ArtifactSelector tiny({"config.cfg", config::SelectionOrder::Traversal});
    selected = tiny.select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().size, 10u);
}

TEST_F(ArtifactSelectorTest, PreferredRelativePath) {
    test::writeFile(tree / "other/Game.exe", std::string(7000, 'o'));
    ArtifactSelector selector({"BIN/game.exe", config::SelectionOrder::Lexicographic});
    auto selected = selector.select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "bin/Game.exe");
}

TEST_F(ArtifactSelectorTest, UnmatchedPreferenceFallsBackToLargest) {
    ArtifactSelector selector({"launcher.exe", config::SelectionOrder::Lexicographic});
    auto selected = selector.select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "data/assets.pak");
}

TEST_F(ArtifactSelectorTest, LexicographicOrderBreaksTiesDeterministically) {
    test::writeFile(tree / "zz/b.bin", std::string(9000, 'b'));
    test::writeFile(tree / "aa/a.bin", std::string(9000, 'a'));

    auto selected = ArtifactSelector().select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "aa/a.bin");
}

TEST_F(ArtifactSelectorTest, SymlinksAreNotCandidates) {
    std::error_code ec;
    fs::create_symlink(tmp.path() / "outside.bin", tree / "link.bin", ec);
    if (ec)
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    test::writeFile(tmp.path() / "outside.bin", std::string(50000, 'x'));

    auto selected = ArtifactSelector().select(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "data/assets.pak");
}

TEST_F(ArtifactSelectorTest, EmptyTreeIsEmptyExtraction) {
    const auto empty = tmp.path() / "empty";
    fs::create_directories(empty / "only/dirs");

    auto selected = ArtifactSelector().select(empty);
    ASSERT_FALSE(selected);
    EXPECT_EQ(selected.error().code, ErrorCode::EmptyExtraction);

    selected = ArtifactSelector().select(tmp.path() / "does-not-exist");
    ASSERT_FALSE(selected);
    EXPECT_EQ(selected.error().code, ErrorCode::EmptyExtraction);
}

TEST_F(ArtifactSelectorTest, PolicyFromPipelineSettings) {
    config::PipelineSettings pipeline;
    pipeline.preferredArtifact = "readme.txt";
    auto policy = makeSelectionPolicy(pipeline);
    auto selected = policy(tree);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected.value().relativePath.generic_string(), "readme.txt");
}
