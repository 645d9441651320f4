#pragma once

#include <fmt/format.h>

#include <string>
#include <utility>

namespace volserve {

// String formatting for error messages and reports; spdlog formats through the same {fmt}
template <typename... Args>
inline std::string fmt_format(fmt::format_string<Args...> fmt, Args&&... args) {
    return fmt::format(fmt, std::forward<Args>(args)...);
}

} // namespace volserve
