/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Owns a descriptor for the lifetime of one erasure unit. Open failures are
 * reported as util::Error so the pipeline can fold them into the unit outcome.
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <expected>
#include <string>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Provides automatic resource management for file descriptors with
 * move semantics and proper cleanup in destructor.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Construct from raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() {
        reset();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /**
     * @brief Open a path, retrying on EINTR
     * @param path Filesystem path or device node
     * @param flags open(2) flags; O_CLOEXEC is always added
     * @return Owning descriptor or IO_ERROR with the errno text
     */
    [[nodiscard]] static auto open(const std::string& path, int flags)
        -> std::expected<FileDescriptor, Error> {
        int fd = -1;
        do {
            fd = ::open(path.c_str(), flags | O_CLOEXEC);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            const int err = errno;
            return std::unexpected(
                Error{ErrorCode::IO_ERROR,
                      "Failed to open " + path + ": " + std::strerror(err)});
        }
        return FileDescriptor{fd};
    }

    /**
     * @brief Get the raw file descriptor
     */
    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the descriptor now instead of at destruction
     */
    void reset() noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = -1;
    }

private:
    int fd_ = -1;  ///< Raw file descriptor
};

}  // namespace util
