#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace volserve {

// Type aliases
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    MissingParts,
    PlaceholderPartsDetected,
    PartSizeMismatch,
    PartChanged,
    CorruptArchive,
    ToolUnavailable,
    EmptyExtraction,
    ManifestInvalid,
    InvalidArgument,
    IoError,
    ClientDisconnected,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::MissingParts: return "Missing parts";
        case ErrorCode::PlaceholderPartsDetected: return "Placeholder parts detected";
        case ErrorCode::PartSizeMismatch: return "Part size mismatch";
        case ErrorCode::PartChanged: return "Part changed while streaming";
        case ErrorCode::CorruptArchive: return "Corrupt archive";
        case ErrorCode::ToolUnavailable: return "Tool unavailable";
        case ErrorCode::EmptyExtraction: return "Empty extraction";
        case ErrorCode::ManifestInvalid: return "Invalid manifest";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ClientDisconnected: return "Client disconnected";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace volserve

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<volserve::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(volserve::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", volserve::errorToString(error));
    }
};
#endif

namespace volserve {

inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 2 * 1024 * 1024;  // 2 MiB
inline constexpr std::size_t MIN_CHUNK_SIZE = 4 * 1024;             // 4 KiB
inline constexpr std::size_t MAX_CHUNK_SIZE = 256 * 1024 * 1024;    // 256 MiB
inline constexpr std::uint64_t DEFAULT_MIN_PART_BYTES = 200;

} // namespace volserve
