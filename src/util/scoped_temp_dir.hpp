#pragma once

// Test helper: a fresh directory under the system temp dir that is removed
// again when the object goes out of scope.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace patchy {

class ScopedTempDir {
   public:
    ScopedTempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / fmt::format("patchy-test-{}-{}", stamp, counter++);
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir&
    operator=(const ScopedTempDir&) = delete;

    std::string
    file(const std::string& name) const {
        return (path_ / name).string();
    }

    const std::filesystem::path&
    path() const {
        return path_;
    }

   private:
    std::filesystem::path path_;
};

}  // namespace patchy
