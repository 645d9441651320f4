#pragma once

#include <volserve/core/types.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace volserve::http {

struct Request {
    std::string method{"GET"};
    std::string target{"/"};
    unsigned version{11};
    bool keepAlive{true};
};

struct ResponseHead {
    unsigned status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::uint64_t> contentLength;
    bool keepAlive{true};

    ResponseHead& set(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }
};

/**
 * Sink for one response. Head first, then body bytes.
 * A vanished peer is reported as ClientDisconnected; callers stop writing and do not
 * treat it as a failure.
 */
class IResponseWriter {
public:
    virtual ~IResponseWriter() = default;

    virtual Result<void> writeHead(const ResponseHead& head) = 0;
    virtual Result<void> writeBody(ByteSpan data) = 0;
    [[nodiscard]] virtual bool headersSent() const = 0;
};

inline ByteSpan asBytes(const std::string& s) {
    return ByteSpan(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

// Complete text/plain response. Returns false when the connection must not be reused.
bool sendText(IResponseWriter& writer, unsigned status, const std::string& body, bool keepAlive,
              bool headOnly = false);

// Copy exactly size bytes from in to the writer, chunkSize at a time
Result<std::uint64_t> pumpStream(std::istream& in, std::uint64_t size, std::size_t chunkSize,
                                 IResponseWriter& writer);

} // namespace volserve::http
