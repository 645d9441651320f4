#include <volserve/archive/artifact_selector.h>
#include <volserve/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace volserve::archive {

namespace fs = std::filesystem;

namespace {

struct Candidate {
    fs::path path;
    fs::path relative;
    std::uint64_t size{0};
};

Result<std::vector<Candidate>> listRegularFiles(const fs::path& tree,
                                                config::SelectionOrder order) {
    std::vector<Candidate> files;
    std::error_code ec;
    if (!fs::is_directory(tree, ec))
        return Error{ErrorCode::EmptyExtraction, "extraction directory missing: " + tree.string()};

    fs::recursive_directory_iterator it(tree, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return Error{ErrorCode::IoError, "cannot walk " + tree.string() + ": " + ec.message()};

    const auto end = fs::recursive_directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec)
            return Error{ErrorCode::IoError, "cannot walk " + tree.string() + ": " + ec.message()};
        // symlink_status: links are never followed out of the tree
        auto st = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(st))
            continue;
        auto size = it->file_size(ec);
        if (ec)
            continue;
        files.push_back(Candidate{it->path(), it->path().lexically_relative(tree), size});
    }

    if (order == config::SelectionOrder::Lexicographic) {
        std::sort(files.begin(), files.end(), [](const Candidate& a, const Candidate& b) {
            return a.relative.generic_string() < b.relative.generic_string();
        });
    }
    return files;
}

} // namespace

Result<SelectedArtifact> ArtifactSelector::select(const fs::path& tree) const {
    auto listed = listRegularFiles(tree, options_.order);
    if (!listed)
        return listed.error();
    const auto& files = listed.value();

    if (files.empty())
        return Error{ErrorCode::EmptyExtraction, "no regular files under " + tree.string()};

    if (!options_.preferredName.empty()) {
        const auto wanted = config::to_lower(options_.preferredName);
        const bool byPath = wanted.find('/') != std::string::npos;
        for (const auto& f : files) {
            auto name = byPath ? f.relative.generic_string() : f.path.filename().string();
            if (config::to_lower(name) == wanted) {
                spdlog::debug("selected preferred artifact {}", f.relative.generic_string());
                return SelectedArtifact{f.path, f.relative, f.size};
            }
        }
        spdlog::info("preferred artifact '{}' not found; falling back to largest file",
                     options_.preferredName);
    }

    const Candidate* best = &files.front();
    for (const auto& f : files) {
        if (f.size > best->size)
            best = &f;
    }
    spdlog::debug("selected largest artifact {} ({} bytes)", best->relative.generic_string(),
                  best->size);
    return SelectedArtifact{best->path, best->relative, best->size};
}

SelectionPolicy ArtifactSelector::asPolicy() const {
    return [selector = *this](const fs::path& tree) { return selector.select(tree); };
}

SelectionPolicy makeSelectionPolicy(const config::PipelineSettings& pipeline) {
    return ArtifactSelector(ArtifactSelector::Options{pipeline.preferredArtifact,
                                                      pipeline.selectionOrder})
        .asPolicy();
}

} // namespace volserve::archive
