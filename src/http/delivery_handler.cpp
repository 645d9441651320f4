#include <volserve/assembly/part_stream.h>
#include <volserve/common/format.h>
#include <volserve/http/delivery_handler.h>
#include <volserve/http/mime_types.h>
#include <volserve/version.hpp>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include <archive.h>

#include <sstream>
#include <vector>

namespace volserve::http {


std::optional<std::string> getQueryParam(std::string_view target, std::string_view key) {
    auto pos = target.find('?');
    if (pos == std::string_view::npos)
        return std::nullopt;
    std::string q(target.substr(pos + 1));
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        auto eq = p.find('=');
        auto k = p.substr(0, eq);
        if (k == key)
            return eq == std::string::npos ? std::string{} : percentDecode(p.substr(eq + 1));
    }
    return std::nullopt;
}

bool matchesRoute(std::string_view target, std::string_view prefix) {
    auto path = target.substr(0, target.find('?'));
    return path.substr(0, prefix.size()) == prefix;
}

unsigned DeliveryHandler::statusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::MissingParts:
        case ErrorCode::PlaceholderPartsDetected:
        case ErrorCode::PartSizeMismatch:
            return 404;
        default:
            return 500;
    }
}

std::string DeliveryHandler::errorBody(const Error& error) {
    const char* category = "ERROR:";
    switch (error.code) {
        case ErrorCode::MissingParts: category = "MISSING_PARTS:"; break;
        case ErrorCode::PlaceholderPartsDetected: category = "PLACEHOLDER_PARTS:"; break;
        case ErrorCode::CorruptArchive: category = "CORRUPT_ARCHIVE:"; break;
        case ErrorCode::ToolUnavailable: category = "TOOL_UNAVAILABLE:"; break;
        case ErrorCode::EmptyExtraction: category = "EMPTY_EXTRACTION:"; break;
        default: break;
    }
    return fmt_format("{}\n{}\n", category, error.message);
}

DeliveryHandler::DeliveryHandler(DeliveryContext ctx)
    : ctx_(ctx), static_(ctx.config.rootDir(), ctx.config.server.indexDocument) {}

bool DeliveryHandler::handle(const Request& req, IResponseWriter& writer) {
    const auto& target = req.target;
    const bool core = matchesRoute(target, "/download") || matchesRoute(target, "/concat") ||
                      matchesRoute(target, "/rebuild") || matchesRoute(target, "/extract") ||
                      matchesRoute(target, "/diag") || matchesRoute(target, "/health");
    if (!core)
        return static_.serve(req, writer, ctx_.config.pipeline.chunkSizeBytes);

    if (req.method != "GET" && req.method != "HEAD")
        return sendText(writer, 405, "method not allowed", req.keepAlive);

    if (matchesRoute(target, "/health"))
        return sendText(writer, 200, "ok", req.keepAlive, req.method == "HEAD");
    if (matchesRoute(target, "/diag"))
        return sendText(writer, 200, diagnosticReport(), req.keepAlive, req.method == "HEAD");
    if (matchesRoute(target, "/download"))
        return handleDownload(req, writer);
    if (matchesRoute(target, "/concat"))
        return handleConcat(req, writer);
    if (matchesRoute(target, "/rebuild"))
        return handleRebuild(req, writer);
    return handleExtract(req, writer);
}

ResponseHead DeliveryHandler::attachmentHead(const Request& req, const std::string& filename,
                                             const std::string& contentType,
                                             std::uint64_t size) const {
    ResponseHead head;
    head.status = 200;
    head.contentLength = size;
    head.keepAlive = req.keepAlive;
    head.set("Content-Type", contentType);
    head.set("Content-Disposition", fmt_format("attachment; filename=\"{}\"", filename));
    head.set("Cache-Control", "no-store");
    head.set("X-Accel-Buffering", "no");
    return head;
}

bool DeliveryHandler::fail(const Request& req, IResponseWriter& writer, const Error& error) {
    const auto status = statusFor(error.code);
    spdlog::warn("{} {} -> {}: {}", req.method, req.target, status, errorToString(error.code));
    return sendText(writer, status, errorBody(error), req.keepAlive, req.method == "HEAD");
}

bool DeliveryHandler::abortStream(IResponseWriter& writer, const std::string& what,
                                  const Error& error) {
    if (error.code == ErrorCode::ClientDisconnected) {
        spdlog::debug("{}: client went away", what);
        return false;
    }
    spdlog::warn("{} aborted mid-stream: {}", what, error.message);
    // Status is already on the wire; all that is left is trailing text
    auto trailer = "\n" + errorBody(error);
    auto appended = writer.writeBody(asBytes(trailer));
    if (!appended)
        spdlog::debug("{}: could not append trailer: {}", what, appended.error().message);
    return false;
}

bool DeliveryHandler::handleConcat(const Request& req, IResponseWriter& writer) {
    auto located = ctx_.locator.locate(ctx_.manifest);
    if (!located)
        return fail(req, writer, located.error());

    const auto& parts = located.value();
    const auto& mime = ctx_.manifest.mimeType.empty()
                           ? mimeTypeForFilename(ctx_.manifest.outputName)
                           : ctx_.manifest.mimeType;
    auto head = attachmentHead(req, ctx_.manifest.outputName, mime, assembly::totalSize(parts));
    if (!writer.writeHead(head))
        return false;
    if (req.method == "HEAD")
        return req.keepAlive;

    auto sent = assembly::forEachChunk(parts, ctx_.config.pipeline.chunkSizeBytes,
                                       [&writer](ByteSpan chunk) { return writer.writeBody(chunk); });
    if (!sent)
        return abortStream(writer, ctx_.manifest.outputName, sent.error());
    spdlog::debug("streamed {} ({} bytes)", ctx_.manifest.outputName, sent.value());
    return req.keepAlive;
}

bool DeliveryHandler::streamCached(const Request& req, IResponseWriter& writer) {
    auto located = ctx_.locator.locate(ctx_.manifest);
    if (!located)
        return fail(req, writer, located.error());

    auto opened = ctx_.cache.acquire(located.value(), false);
    if (!opened)
        return fail(req, writer, opened.error());

    auto& artifact = opened.value();
    const auto& entry = artifact.entry;
    auto head = attachmentHead(req, entry.servedName, mimeTypeForFilename(entry.servedName),
                               entry.size);
    if (!writer.writeHead(head))
        return false;
    if (req.method == "HEAD")
        return req.keepAlive;

    auto sent = pumpStream(artifact.stream, entry.size, ctx_.config.pipeline.chunkSizeBytes, writer);
    if (!sent)
        return abortStream(writer, entry.servedName, sent.error());
    spdlog::debug("streamed {} from {} ({} bytes)", entry.servedName, entry.generation, sent.value());
    return req.keepAlive;
}

bool DeliveryHandler::handleDownload(const Request& req, IResponseWriter& writer) {
    if (ctx_.config.pipeline.mode == config::PipelineMode::Raw)
        return handleConcat(req, writer);
    return streamCached(req, writer);
}

bool DeliveryHandler::handleRebuild(const Request& req, IResponseWriter& writer) {
    bool force = true;
    if (auto f = getQueryParam(req.target, "force")) {
        auto v = boost::algorithm::to_lower_copy(*f);
        force = !(v == "0" || v == "false" || v == "no");
    }

    auto located = ctx_.locator.locate(ctx_.manifest);
    if (!located)
        return fail(req, writer, located.error());

    auto obtained = ctx_.cache.obtain(located.value(), force);
    if (!obtained)
        return fail(req, writer, obtained.error());

    const auto& entry = obtained.value().entry;
    std::ostringstream body;
    body << (obtained.value().rebuilt ? "REBUILT: " : "UP_TO_DATE: ") << entry.servedName << '\n';
    body << "SIZE: " << entry.size << '\n';
    if (!entry.mainArtifact.empty()) {
        body << "MAIN_ARTIFACT: " << entry.mainArtifact.filename().string() << '\n';
        body << "MAIN_ARTIFACT_SIZE: " << entry.mainArtifactSize << '\n';
    }
    body << "GENERATION: " << entry.generation << '\n';
    return sendText(writer, 200, body.str(), req.keepAlive, req.method == "HEAD");
}

bool DeliveryHandler::handleExtract(const Request& req, IResponseWriter& writer) {
    auto located = ctx_.locator.locate(ctx_.manifest);
    if (!located)
        return fail(req, writer, located.error());

    auto obtained = ctx_.cache.obtain(located.value(), false);
    if (!obtained)
        return fail(req, writer, obtained.error());

    const auto& entry = obtained.value().entry;
    const auto published = ctx_.cache.generationPath(entry);
    const auto& root = ctx_.config.rootDir();
    auto artifact = manifest::relativeForDisplay(published / entry.artifact, root).generic_string();

    std::string body;
    if (ctx_.config.pipeline.mode == config::PipelineMode::Repackage) {
        // Repackaging keeps only the normalized archive, never the unpacked tree
        body = "REPACKAGED_TO: /" + artifact + '\n';
    } else {
        body = "EXTRACTED_TO: /" +
               manifest::relativeForDisplay(published, root).generic_string() + '\n' +
               "ARTIFACT: /" + artifact + '\n';
    }
    return sendText(writer, 200, body, req.keepAlive, req.method == "HEAD");
}

std::string DeliveryHandler::diagnosticReport() const {
    const auto& cfg = ctx_.config;
    std::ostringstream out;
    out << "volserve " << VOLSERVE_VERSION_STRING << '\n';
    out << "mode: " << config::toString(cfg.pipeline.mode) << '\n';
    out << "extractor: " << ctx_.extractor.name() << '\n';
    out << "root: " << cfg.rootDir().string() << '\n';
    out << "parts dir: " << cfg.partsDir().string() << '\n';
    out << "cache dir: " << cfg.cacheDir().string() << '\n';
    out << "chunk size: " << cfg.pipeline.chunkSizeBytes << '\n';
    out << "preferred artifact: "
        << (cfg.pipeline.preferredArtifact.empty() ? "(none)" : cfg.pipeline.preferredArtifact)
        << '\n';
    out << "output: " << ctx_.manifest.outputName << '\n';

    out << "\nparts (" << ctx_.manifest.parts.size() << "):\n";
    std::uint64_t total = 0;
    std::size_t problems = 0;
    for (const auto& status : ctx_.locator.inspect(ctx_.manifest)) {
        out << fmt_format("  [{:>3}] {:<14} {:>12}  {}", status.descriptor.index,
                          assembly::toString(status.state), status.size,
                          status.descriptor.displayPath.generic_string());
        if (!status.reason.empty())
            out << "  (" << status.reason << ')';
        out << '\n';
        total += status.size;
        if (status.state != assembly::PartState::Ok)
            ++problems;
    }
    out << "total bytes: " << total << '\n';
    out << "problems: " << problems << '\n';

    archive::ExternalToolExtractor external(cfg.pipeline.externalTool);
    auto tool = external.resolveTool();
    out << "\nexternal tool: "
        << (tool ? "found at " + tool.value().string() : std::string("not found")) << '\n';
    out << "libarchive: " << archive_version_string() << '\n';
    out << "extractor status: " << ctx_.extractor.availability() << '\n';

    out << "\ncache: ";
    auto entry = ctx_.cache.current();
    if (!entry) {
        out << cache::toString(cache::CacheState::Absent) << '\n';
    } else {
        auto located = ctx_.locator.locate(ctx_.manifest);
        // Without a complete part set the entry cannot be compared against the sources
        auto state = located ? ctx_.cache.stateFor(located.value()) : cache::CacheState::Stale;
        out << cache::toString(state) << " (" << entry->generation << ", "
            << entry->artifact.generic_string() << ", " << entry->size << " bytes)\n";
    }
    out << "builds this run: " << ctx_.cache.buildsCompleted() << '\n';
    return out.str();
}

} // namespace volserve::http
