#include <volserve/http/mime_types.h>
#include <volserve/http/static_files.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace volserve::http {

namespace fs = std::filesystem;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

StaticFiles::StaticFiles(fs::path root, std::string indexDocument)
    : root_(std::move(root)), indexDocument_(std::move(indexDocument)) {}

fs::path StaticFiles::resolve(std::string_view target) const {
    auto path = target.substr(0, target.find_first_of("?#"));
    auto decoded = percentDecode(path);

    fs::path out = root_;
    size_t start = 0;
    while (start <= decoded.size()) {
        auto end = decoded.find('/', start);
        if (end == std::string::npos)
            end = decoded.size();
        auto word = decoded.substr(start, end - start);
        // Drop empty, current and parent segments, and anything carrying a separator or NUL
        if (!word.empty() && word != "." && word != ".." &&
            word.find('\\') == std::string::npos && word.find('\0') == std::string::npos) {
            out /= word;
        }
        start = end + 1;
    }
    return out;
}

bool StaticFiles::serve(const Request& req, IResponseWriter& writer, std::size_t chunkSize) const {
    const bool headOnly = req.method == "HEAD";
    if (req.method != "GET" && !headOnly)
        return sendText(writer, 405, "method not allowed", req.keepAlive);

    auto path = resolve(req.target);
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        path /= indexDocument_;
    }
    if (!fs::is_regular_file(path, ec))
        return sendText(writer, 404, "not found", req.keepAlive, headOnly);

    const auto size = fs::file_size(path, ec);
    std::ifstream in(path, std::ios::binary);
    if (ec || !in)
        return sendText(writer, 404, "not found", req.keepAlive, headOnly);

    ResponseHead head;
    head.status = 200;
    head.contentLength = size;
    head.keepAlive = req.keepAlive;
    head.set("Content-Type", mimeTypeForFilename(path.filename().string()));
    if (!writer.writeHead(head))
        return false;
    if (headOnly)
        return req.keepAlive;

    auto sent = pumpStream(in, size, chunkSize, writer);
    if (!sent) {
        if (sent.error().code != ErrorCode::ClientDisconnected)
            spdlog::warn("static file {} aborted: {}", path.string(), sent.error().message);
        return false;
    }
    return req.keepAlive;
}

} // namespace volserve::http
