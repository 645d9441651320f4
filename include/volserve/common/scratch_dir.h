#pragma once

#include <volserve/core/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace volserve {

// RAII guard that owns a unique working directory and removes it on destruction
// unless release() was called.
class ScratchDir {
public:
    ScratchDir() = default;
    explicit ScratchDir(std::filesystem::path root) : root_(std::move(root)) {}
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept : root_(std::move(other.root_)) { other.root_.clear(); }
    ScratchDir& operator=(ScratchDir&& other) noexcept {
        if (this != &other) {
            reset();
            root_ = std::move(other.root_);
            other.root_.clear();
        }
        return *this;
    }

    ~ScratchDir() { reset(); }

    const std::filesystem::path& path() const { return root_; }

    // Stop owning the directory (it survives this guard)
    std::filesystem::path release() {
        auto p = std::move(root_);
        root_.clear();
        return p;
    }

    void reset() noexcept {
        if (root_.empty())
            return;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        root_.clear();
    }

    static Result<ScratchDir> create_under(const std::filesystem::path& parent,
                                           const std::string& prefix) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
            return Error{ErrorCode::IoError, "cannot create " + parent.string() + ": " + ec.message()};
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto dir = parent / unique_component(prefix);
            if (std::filesystem::create_directory(dir, ec))
                return ScratchDir(dir);
            if (ec)
                return Error{ErrorCode::IoError, "cannot create " + dir.string() + ": " + ec.message()};
        }
        return Error{ErrorCode::IoError, "cannot allocate a unique directory under " + parent.string()};
    }

    // prefix + pid + timestamp + thread id + counter
    static std::string unique_component(const std::string& prefix) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto counter = counter_.fetch_add(1, std::memory_order_relaxed);
        return prefix + std::to_string(::getpid()) + "-" + std::to_string(now) + "-" +
               std::to_string(tid % 100000) + "-" + std::to_string(counter);
    }

private:
    std::filesystem::path root_;
    static inline std::atomic<std::uint64_t> counter_{0};
};

} // namespace volserve
