#include <volserve/common/format.h>
#include <volserve/http/response_writer.h>

#include <algorithm>
#include <vector>

namespace volserve::http {

bool sendText(IResponseWriter& writer, unsigned status, const std::string& body, bool keepAlive,
              bool headOnly) {
    ResponseHead head;
    head.status = status;
    head.contentLength = body.size();
    head.keepAlive = keepAlive;
    head.set("Content-Type", "text/plain; charset=utf-8");
    head.set("Cache-Control", "no-store");

    if (!writer.writeHead(head))
        return false;
    if (headOnly || body.empty())
        return keepAlive;
    return writer.writeBody(asBytes(body)).has_value() && keepAlive;
}

Result<std::uint64_t> pumpStream(std::istream& in, std::uint64_t size, std::size_t chunkSize,
                                 IResponseWriter& writer) {
    std::vector<char> buffer(static_cast<size_t>(std::min<std::uint64_t>(chunkSize, size)));
    std::uint64_t sent = 0;
    while (sent < size) {
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), size - sent));
        in.read(buffer.data(), want);
        const auto got = in.gcount();
        if (got <= 0) {
            return Error{ErrorCode::PartChanged,
                         fmt_format("source ended after {} of {} bytes", sent, size)};
        }
        auto written = writer.writeBody(
            ByteSpan(reinterpret_cast<const std::byte*>(buffer.data()), static_cast<size_t>(got)));
        if (!written)
            return written.error();
        sent += static_cast<std::uint64_t>(got);
    }
    return sent;
}

} // namespace volserve::http
