#pragma once

#include <volserve/config/server_config.h>
#include <volserve/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace volserve::archive {

struct SelectedArtifact {
    std::filesystem::path path;         // absolute
    std::filesystem::path relativePath; // relative to the searched tree
    std::uint64_t size{0};
};

// Strategy seam: picks one file from an extracted tree
using SelectionPolicy = std::function<Result<SelectedArtifact>(const std::filesystem::path& tree)>;

/**
 * Default policy.
 * 1. preferredName, matched case-insensitively against file names (or against relative
 *    paths when it contains a '/');
 * 2. otherwise the largest regular file, first encountered wins a tie.
 * With SelectionOrder::Lexicographic the tree is visited in sorted path order so the
 * choice is reproducible across filesystems. Fails with EmptyExtraction when the tree
 * holds no regular file.
 */
class ArtifactSelector {
public:
    struct Options {
        std::string preferredName;
        config::SelectionOrder order{config::SelectionOrder::Lexicographic};
    };

    ArtifactSelector() = default;
    explicit ArtifactSelector(Options options) : options_(std::move(options)) {}

    Result<SelectedArtifact> select(const std::filesystem::path& tree) const;

    // Adapter for places that take a SelectionPolicy
    [[nodiscard]] SelectionPolicy asPolicy() const;

private:
    Options options_;
};

SelectionPolicy makeSelectionPolicy(const config::PipelineSettings& pipeline);

} // namespace volserve::archive
