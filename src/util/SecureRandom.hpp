#ifndef SECURE_ERASER_UTIL_SECURE_RANDOM_HPP
#define SECURE_ERASER_UTIL_SECURE_RANDOM_HPP

#include "util/Error.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace util {

/**
 * @class SecureRandom
 * @brief Cryptographically secure buffer fill backed by the OpenSSL DRBG
 *
 * Random overwrite passes must never come from a non-cryptographic
 * generator, so this is the only source of pattern bytes for them.
 */
class SecureRandom {
public:
    /**
     * @brief Fills a buffer with CSPRNG output
     * @param buffer The buffer to fill
     * @return RANDOM_SOURCE_FAILURE if the DRBG refused to produce bytes
     */
    [[nodiscard]] static auto fill(std::span<uint8_t> buffer) -> std::expected<void, Error> {
        // RAND_bytes takes an int length
        size_t offset = 0;
        while (offset < buffer.size()) {
            const auto step = std::min<size_t>(buffer.size() - offset, INT_MAX);
            if (RAND_bytes(buffer.data() + offset, static_cast<int>(step)) != 1) {
                char reason[256] = {};
                ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
                return std::unexpected(Error{ErrorCode::RANDOM_SOURCE_FAILURE,
                                             std::string{"RAND_bytes failed: "} + reason});
            }
            offset += step;
        }
        return {};
    }
};

} // namespace util

#endif // SECURE_ERASER_UTIL_SECURE_RANDOM_HPP
