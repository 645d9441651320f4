#include <volserve/config/config_helpers.h>
#include <volserve/http/mime_types.h>

#include <filesystem>
#include <unordered_map>

namespace volserve::http {

namespace {

const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    // Web
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".js", "text/javascript; charset=utf-8"},
    {".json", "application/json"},
    {".txt", "text/plain; charset=utf-8"},
    {".md", "text/markdown; charset=utf-8"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},

    // Images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".ico", "image/x-icon"},

    // Audio/Video
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".ogg", "audio/ogg"},
    {".mp4", "video/mp4"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".bz2", "application/x-bzip2"},
    {".7z", "application/x-7z-compressed"},
    {".rar", "application/x-rar-compressed"},
    {".xz", "application/x-xz"},
    {".iso", "application/x-iso9660-image"},

    // Executables and packages
    {".exe", "application/x-msdownload"},
    {".dll", "application/x-msdownload"},
    {".msi", "application/x-msi"},
    {".so", "application/x-sharedlib"},
    {".jar", "application/java-archive"},
    {".apk", "application/vnd.android.package-archive"},
    {".deb", "application/vnd.debian.binary-package"},
    {".dmg", "application/x-apple-diskimage"}};

} // namespace

std::string mimeTypeForFilename(std::string_view filename) {
    auto ext = config::to_lower(std::filesystem::path(filename).extension().string());
    auto it = EXTENSION_MIME_MAP.find(ext);
    return it != EXTENSION_MIME_MAP.end() ? it->second : "application/octet-stream";
}

} // namespace volserve::http
