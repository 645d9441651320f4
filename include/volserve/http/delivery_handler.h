#pragma once

#include <volserve/archive/archive_extractor.h>
#include <volserve/assembly/part_locator.h>
#include <volserve/cache/rebuild_cache.h>
#include <volserve/config/server_config.h>
#include <volserve/http/response_writer.h>
#include <volserve/http/static_files.h>
#include <volserve/manifest/part_manifest.h>

#include <optional>
#include <string>
#include <string_view>

namespace volserve::http {

/**
 * Everything a request needs, owned by the entry point and shared by all
 * connection threads.
 */
struct DeliveryContext {
    const config::ServerConfig& config;
    const manifest::ArtifactManifest& manifest;
    const assembly::PartLocator& locator;
    cache::RebuildCache& cache;
    const archive::IArchiveExtractor& extractor;
};

/**
 * Routes one request by path prefix:
 *
 *   /download  artifact per pipeline mode, as an attachment
 *   /concat    raw concatenation, regardless of mode
 *   /rebuild   forced materialization (?force=0 for a freshness check only)
 *   /extract   materialization, answers with the published directory
 *   /diag      plain-text report, never fails
 *   /health    "ok"
 *
 * Everything else goes to static file serving under the root directory.
 * Headers are complete before the first body byte. After that, a failure can only be
 * appended as trailing text and the connection is closed. A peer that goes away
 * mid-stream ends the request quietly.
 */
class DeliveryHandler {
public:
    explicit DeliveryHandler(DeliveryContext ctx);

    // Returns whether the connection may serve another request
    bool handle(const Request& req, IResponseWriter& writer);

    // Text of the /diag response
    [[nodiscard]] std::string diagnosticReport() const;

    static unsigned statusFor(ErrorCode code);

    // Category line followed by the diagnostic
    static std::string errorBody(const Error& error);

private:
    bool handleDownload(const Request& req, IResponseWriter& writer);
    bool handleConcat(const Request& req, IResponseWriter& writer);
    bool handleRebuild(const Request& req, IResponseWriter& writer);
    bool handleExtract(const Request& req, IResponseWriter& writer);

    bool streamCached(const Request& req, IResponseWriter& writer);
    bool fail(const Request& req, IResponseWriter& writer, const Error& error);
    bool abortStream(IResponseWriter& writer, const std::string& what, const Error& error);

    [[nodiscard]] ResponseHead attachmentHead(const Request& req, const std::string& filename,
                                              const std::string& contentType,
                                              std::uint64_t size) const;

    DeliveryContext ctx_;
    StaticFiles static_;
};

std::optional<std::string> getQueryParam(std::string_view target, std::string_view key);

// True when the path part of target starts with prefix ("/download", "/download/x", "/download?...")
bool matchesRoute(std::string_view target, std::string_view prefix);

} // namespace volserve::http
