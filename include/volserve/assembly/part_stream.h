#pragma once

#include <volserve/assembly/part_locator.h>
#include <volserve/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <vector>

namespace volserve::assembly {

/**
 * Forward-only byte stream over the concatenation of located parts.
 *
 * - Holds at most one open part and one chunk buffer at a time.
 * - Chunks never span two parts; the last chunk of a part may be short.
 * - Emits exactly the sizes observed by the locator; a part that shrank or grew in the
 *   meantime fails the stream with PartChanged.
 */
class PartStream {
public:
    PartStream(std::vector<LocatedPart> parts, std::size_t chunkSize);

    PartStream(const PartStream&) = delete;
    PartStream& operator=(const PartStream&) = delete;

    // Next chunk. An empty span marks the end. The span is valid until the next call.
    Result<ByteSpan> next();

    [[nodiscard]] bool done() const noexcept { return current_ >= parts_.size(); }
    [[nodiscard]] std::uint64_t bytesEmitted() const noexcept { return emitted_; }
    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_; }

private:
    Result<void> openCurrent();
    void closeCurrent();

    std::vector<LocatedPart> parts_;
    std::size_t chunkSize_;
    std::vector<std::byte> buffer_;
    std::ifstream in_;
    std::size_t current_{0};
    std::uint64_t readFromCurrent_{0};
    std::uint64_t emitted_{0};
    std::uint64_t total_{0};
};

// Returning an error from the sink stops the stream and propagates that error
using ChunkSink = std::function<Result<void>(ByteSpan)>;

// Push every chunk into sink in order. Returns the number of bytes emitted.
Result<std::uint64_t> forEachChunk(const std::vector<LocatedPart>& parts, std::size_t chunkSize,
                                   const ChunkSink& sink);

// Write the concatenation to a file (created or truncated)
Result<std::uint64_t> concatenateToFile(const std::vector<LocatedPart>& parts,
                                        std::size_t chunkSize,
                                        const std::filesystem::path& destination);

} // namespace volserve::assembly
