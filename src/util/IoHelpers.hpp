#pragma once

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace util {

/**
 * @brief Write the whole buffer at @p offset, retrying on EINTR/EAGAIN and short writes
 * @return Bytes written; less than @p size only when a write failed (errno is set)
 */
inline auto pwrite_all(int fd, const void* buffer, size_t size, uint64_t offset) -> size_t {
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result =
            ::pwrite(fd, bytes + done, size - done, static_cast<off_t>(offset + done));
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (result <= 0) {
            if (result == 0) {
                errno = EIO;
            }
            break;
        }
        done += static_cast<size_t>(result);
    }
    return done;
}

/**
 * @brief Read @p size bytes at @p offset, retrying on EINTR and short reads
 * @return Bytes read; less than @p size on error (errno set) or end of file (errno == 0)
 */
inline auto pread_all(int fd, void* buffer, size_t size, uint64_t offset) -> size_t {
    auto* bytes = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result =
            ::pread(fd, bytes + done, size - done, static_cast<off_t>(offset + done));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        if (result < 0) {
            break;
        }
        if (result == 0) {
            errno = 0;
            break;
        }
        done += static_cast<size_t>(result);
    }
    return done;
}

}  // namespace util
