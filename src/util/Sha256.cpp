#include "util/Sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace util {

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    init();
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::init() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256::update(std::span<const uint8_t> data) {
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void Sha256::update(std::string_view data) {
    update(std::span<const uint8_t>{reinterpret_cast<const uint8_t*>(data.data()), data.size()});
}

auto Sha256::finish() -> Digest {
    Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1 || length != DIGEST_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    init();
    return digest;
}

auto Sha256::hash(std::span<const uint8_t> data) -> Digest {
    Sha256 sha;
    sha.update(data);
    return sha.finish();
}

auto Sha256::hash(std::string_view data) -> Digest {
    Sha256 sha;
    sha.update(data);
    return sha.finish();
}

auto Sha256::to_hex(const Digest& digest) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (const auto byte : digest) {
        out.push_back(HEX[(byte >> 4) & 0x0F]);
        out.push_back(HEX[byte & 0x0F]);
    }
    return out;
}

}  // namespace util
