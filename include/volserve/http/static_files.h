#pragma once

#include <volserve/http/response_writer.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace volserve::http {

/**
 * Plain file serving under a root directory. URL paths are percent-decoded and
 * "."/".." segments dropped, so nothing outside the root is reachable. Directories
 * serve their index document or 404; listings are never generated.
 */
class StaticFiles {
public:
    StaticFiles(std::filesystem::path root, std::string indexDocument);

    // Filesystem path for a request target (query string ignored)
    [[nodiscard]] std::filesystem::path resolve(std::string_view target) const;

    // Returns whether the connection may be kept alive
    bool serve(const Request& req, IResponseWriter& writer, std::size_t chunkSize) const;

private:
    std::filesystem::path root_;
    std::string indexDocument_;
};

std::string percentDecode(std::string_view in);

} // namespace volserve::http
