#include <volserve/assembly/part_stream.h>
#include <volserve/common/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace volserve::assembly {

namespace fs = std::filesystem;

PartStream::PartStream(std::vector<LocatedPart> parts, std::size_t chunkSize)
    : parts_(std::move(parts)), chunkSize_(std::max<std::size_t>(chunkSize, 1)) {
    total_ = totalSize(parts_);
}

Result<void> PartStream::openCurrent() {
    const auto& part = parts_[current_];
    in_.open(part.descriptor.path, std::ios::binary);
    if (!in_) {
        return Error{ErrorCode::IoError,
                     "cannot open part " + part.descriptor.displayPath.generic_string()};
    }
    readFromCurrent_ = 0;
    spdlog::trace("streaming part {} ({} bytes)", part.descriptor.displayPath.generic_string(),
                  part.size);
    return Result<void>();
}

void PartStream::closeCurrent() {
    if (in_.is_open())
        in_.close();
    in_.clear();
    ++current_;
}

Result<ByteSpan> PartStream::next() {
    while (!done()) {
        const auto& part = parts_[current_];
        if (!in_.is_open()) {
            auto opened = openCurrent();
            if (!opened)
                return opened.error();
        }

        const auto remaining = part.size - readFromCurrent_;
        if (remaining == 0) {
            // The part must end exactly where the locator saw it end
            if (in_.peek() != std::char_traits<char>::eof()) {
                auto name = part.descriptor.displayPath.generic_string();
                closeCurrent();
                return Error{ErrorCode::PartChanged, "part grew while streaming: " + name};
            }
            closeCurrent();
            continue;
        }

        // Lazily sized so an empty stream never allocates
        if (buffer_.size() != chunkSize_)
            buffer_.resize(chunkSize_);

        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, chunkSize_));
        in_.read(reinterpret_cast<char*>(buffer_.data()), want);
        const auto got = in_.gcount();
        if (got <= 0) {
            auto name = part.descriptor.displayPath.generic_string();
            closeCurrent();
            return Error{ErrorCode::PartChanged,
                         fmt_format("part shrank while streaming: {} ({} of {} bytes read)", name,
                                    readFromCurrent_, part.size)};
        }

        readFromCurrent_ += static_cast<std::uint64_t>(got);
        emitted_ += static_cast<std::uint64_t>(got);
        return ByteSpan(buffer_.data(), static_cast<size_t>(got));
    }
    return ByteSpan{};
}

Result<std::uint64_t> forEachChunk(const std::vector<LocatedPart>& parts, std::size_t chunkSize,
                                   const ChunkSink& sink) {
    PartStream stream(parts, chunkSize);
    for (;;) {
        auto chunk = stream.next();
        if (!chunk)
            return chunk.error();
        if (chunk.value().empty())
            break;
        auto pushed = sink(chunk.value());
        if (!pushed)
            return pushed.error();
    }
    return stream.bytesEmitted();
}

Result<std::uint64_t> concatenateToFile(const std::vector<LocatedPart>& parts,
                                        std::size_t chunkSize, const fs::path& destination) {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::IoError, "cannot create " + destination.string()};

    auto written = forEachChunk(parts, chunkSize, [&out, &destination](ByteSpan chunk) -> Result<void> {
        out.write(reinterpret_cast<const char*>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (!out)
            return Error{ErrorCode::IoError, "write failed: " + destination.string()};
        return Result<void>();
    });
    if (!written)
        return written.error();

    out.flush();
    if (!out)
        return Error{ErrorCode::IoError, "flush failed: " + destination.string()};
    return written;
}

} // namespace volserve::assembly
