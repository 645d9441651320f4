#include <volserve/assembly/part_locator.h>
#include <volserve/common/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string_view>

namespace volserve::assembly {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kGitLfsSignature = "version https://git-lfs";

std::string formatOffenders(std::string_view headline, const std::vector<const PartStatus*>& list,
                            bool withReason) {
    std::ostringstream oss;
    oss << headline;
    for (const auto* st : list) {
        oss << "\n- " << st->descriptor.displayPath.generic_string();
        if (withReason && !st->reason.empty())
            oss << " (" << st->reason << ")";
    }
    return oss.str();
}

} // namespace

PlaceholderDetector gitLfsPointerDetector() {
    return [](const fs::path&, std::uint64_t, ByteSpan head) -> std::string {
        std::string_view text(reinterpret_cast<const char*>(head.data()), head.size());
        if (text.substr(0, kGitLfsSignature.size()) == kGitLfsSignature)
            return "Git LFS pointer";
        return {};
    };
}

PartLocator::PartLocator() : PartLocator(Options{}) {}

PartLocator::PartLocator(Options options) : options_(std::move(options)) {}

PartStatus PartLocator::inspectOne(const manifest::PartDescriptor& part) const {
    PartStatus st;
    st.descriptor = part;

    std::error_code ec;
    auto status = fs::status(part.path, ec);
    if (ec || !fs::is_regular_file(status)) {
        st.state = PartState::Missing;
        st.reason = ec ? ec.message() : "not a regular file";
        return st;
    }

    st.size = fs::file_size(part.path, ec);
    if (ec) {
        st.state = PartState::Missing;
        st.reason = ec.message();
        return st;
    }
    st.modified = fs::last_write_time(part.path, ec);
    if (ec) {
        st.state = PartState::Missing;
        st.reason = ec.message();
        return st;
    }

    if (st.size == 0) {
        st.state = PartState::Placeholder;
        st.reason = "empty file";
        return st;
    }

    std::vector<std::byte> head(std::min<std::uint64_t>(options_.signatureBytes, st.size));
    {
        std::ifstream in(part.path, std::ios::binary);
        if (!in) {
            st.state = PartState::Missing;
            st.reason = "cannot open for reading";
            return st;
        }
        in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
        head.resize(static_cast<size_t>(in.gcount()));
    }

    if (options_.detector) {
        if (auto reason = options_.detector(part.path, st.size, ByteSpan(head)); !reason.empty()) {
            st.state = PartState::Placeholder;
            st.reason = std::move(reason);
            return st;
        }
    }
    if (options_.minPartBytes > 0 && st.size < options_.minPartBytes) {
        st.state = PartState::Placeholder;
        st.reason = fmt_format("{} bytes, below the {} byte minimum", st.size,
                               options_.minPartBytes);
        return st;
    }

    if (part.expectedSize && *part.expectedSize != st.size) {
        st.state = PartState::SizeMismatch;
        st.reason = fmt_format("expected {} bytes, found {}", *part.expectedSize, st.size);
        return st;
    }

    st.state = PartState::Ok;
    return st;
}

std::vector<PartStatus> PartLocator::inspect(const manifest::ArtifactManifest& manifest) const {
    std::vector<PartStatus> out;
    out.reserve(manifest.parts.size());
    for (const auto& part : manifest.parts)
        out.push_back(inspectOne(part));
    return out;
}

Result<std::vector<LocatedPart>>
PartLocator::locate(const manifest::ArtifactManifest& manifest) const {
    if (manifest.parts.empty())
        return Error{ErrorCode::ManifestInvalid, "manifest declares no parts"};

    auto statuses = inspect(manifest);

    std::vector<const PartStatus*> missing, placeholders, mismatched;
    for (const auto& st : statuses) {
        switch (st.state) {
            case PartState::Missing: missing.push_back(&st); break;
            case PartState::Placeholder: placeholders.push_back(&st); break;
            case PartState::SizeMismatch: mismatched.push_back(&st); break;
            case PartState::Ok: break;
        }
    }

    if (!missing.empty()) {
        spdlog::warn("{} of {} parts missing", missing.size(), statuses.size());
        return Error{ErrorCode::MissingParts,
                     formatOffenders("Missing files:", missing, false)};
    }
    if (!placeholders.empty()) {
        spdlog::warn("{} placeholder parts detected", placeholders.size());
        return Error{ErrorCode::PlaceholderPartsDetected,
                     formatOffenders("Parts are placeholders, not binary content:", placeholders,
                                     true) +
                         "\nHint: fetch the real files (e.g. `git lfs pull`) and redeploy."};
    }
    if (!mismatched.empty()) {
        return Error{ErrorCode::PartSizeMismatch,
                     formatOffenders("Parts differ from their declared size:", mismatched, true)};
    }

    std::vector<LocatedPart> located;
    located.reserve(statuses.size());
    for (auto& st : statuses) {
        located.push_back(LocatedPart{std::move(st.descriptor), st.size, st.modified});
    }
    return located;
}

std::uint64_t totalSize(const std::vector<LocatedPart>& parts) {
    std::uint64_t total = 0;
    for (const auto& p : parts)
        total += p.size;
    return total;
}

fs::file_time_type newestModification(const std::vector<LocatedPart>& parts) {
    auto newest = fs::file_time_type::min();
    for (const auto& p : parts)
        newest = std::max(newest, p.modified);
    return newest;
}

} // namespace volserve::assembly
