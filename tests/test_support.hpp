#pragma once

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace memobuild::testutil {

/** @brief Fresh directory under the system temp dir, removed with its contents on destruction. */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() / std::format("memobuild-test-{}-{}", ::getpid(), counter++);
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const {
        return path_;
    }

    std::filesystem::path operator/(std::string_view rel) const {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path &path, std::string_view content) {
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace memobuild::testutil
