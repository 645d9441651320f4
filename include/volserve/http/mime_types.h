#pragma once

#include <string>
#include <string_view>

namespace volserve::http {

// MIME type for a file name by extension; application/octet-stream when unknown
std::string mimeTypeForFilename(std::string_view filename);

} // namespace volserve::http
