/**
 * @file Sha256.hpp
 * @brief Incremental SHA-256 over OpenSSL EVP
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace util {

/**
 * @class Sha256
 * @brief Streaming SHA-256 digest
 *
 * Used for content fingerprints and for the record's chained digest.
 * Throws std::runtime_error if libcrypto cannot initialize or update a context.
 */
class Sha256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(std::span<const uint8_t> data);
    void update(std::string_view data);

    /**
     * @brief Finish the digest; the object is reset for reuse afterwards
     */
    [[nodiscard]] auto finish() -> Digest;

    [[nodiscard]] static auto hash(std::span<const uint8_t> data) -> Digest;
    [[nodiscard]] static auto hash(std::string_view data) -> Digest;

    /**
     * @brief Lowercase hex rendering of a digest
     */
    [[nodiscard]] static auto to_hex(const Digest& digest) -> std::string;

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    void init();

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

}  // namespace util
