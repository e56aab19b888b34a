#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace memobuild {

/**
 * @brief Read-only memory mapped file.
 *
 * The mapping is released on destruction. Throws std::runtime_error when the file cannot be
 * opened, stat'ed or mapped; callers at module boundaries convert that into a FilesystemError.
 * Empty files are valid and have empty content.
 */
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path &path) {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1) {
            throw std::runtime_error("Failed to open file: " + path.string());
        }

        struct stat sb;
        if (::fstat(fd_, &sb) == -1) {
            ::close(fd_);
            throw std::runtime_error("Failed to stat file: " + path.string());
        }
        size_ = static_cast<size_t>(sb.st_size);

        if (size_ == 0) {
            return;
        }

        posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);

        void *addr = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED) {
            ::close(fd_);
            throw std::runtime_error("Failed to mmap file: " + path.string());
        }
        data_ = static_cast<char *>(addr);
    }

    ~MappedFile() {
        if (data_) {
            ::munmap(data_, size_);
        }
        if (fd_ != -1) {
            ::close(fd_);
        }
    }

    MappedFile(MappedFile &&other) noexcept
        : fd_(std::exchange(other.fd_, -1)), data_(std::exchange(other.data_, nullptr)),
          size_(std::exchange(other.size_, 0)) {
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;
    MappedFile &operator=(MappedFile &&) = delete;

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    size_t size() const {
        return size_;
    }

    /**
     * @brief Invokes `fn(std::string_view)` for each consecutive chunk of at most `chunk_size` bytes.
     */
    template <typename Fn>
    void for_each_chunk(size_t chunk_size, Fn &&fn) const {
        std::string_view all = content();
        for (size_t off = 0; off < all.size(); off += chunk_size) {
            fn(all.substr(off, chunk_size));
        }
    }

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace memobuild
