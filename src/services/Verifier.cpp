/**
 * @file Verifier.cpp
 * @brief Implementation of read-back verification
 */

#include "services/Verifier.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <numeric>
#include <random>
#include <ranges>
#include <span>
#include <string>
#include <vector>

namespace {

void emit_progress(const core::UnitContext& context, const WipeTarget& target, uint64_t verified,
                   uint64_t total) {
    WipeProgress progress{};
    progress.target = target.path.string();
    progress.verification_in_progress = true;
    progress.bytes_written = verified;
    progress.total_bytes = total;
    progress.percentage =
        total == 0 ? 100.0 : (static_cast<double>(verified) / static_cast<double>(total)) * 100.0;
    progress.status = "Verifying...";
    context.report(progress);
}

/**
 * @brief Window indices to read: all of them, or a sorted random subset
 */
auto select_windows(uint64_t total_windows, const VerificationPolicy& policy)
    -> std::vector<uint64_t> {
    std::vector<uint64_t> indices;
    const uint64_t wanted = std::max<uint64_t>(policy.samples, 1);

    std::vector<uint64_t> all(static_cast<size_t>(total_windows));
    std::iota(all.begin(), all.end(), uint64_t{0});
    if (policy.mode == VerificationPolicy::Mode::FULL || wanted >= total_windows) {
        return all;
    }

    // Offsets only need to be unpredictable to the data, not to an attacker
    std::mt19937_64 generator{std::random_device{}()};
    indices.reserve(static_cast<size_t>(wanted));
    std::ranges::sample(all, std::back_inserter(indices), static_cast<std::ptrdiff_t>(wanted),
                        generator);
    return indices;
}

}  // namespace

Verifier::Verifier(size_t chunk_size)
    : chunk_size_(chunk_size > 0 ? chunk_size : EngineConfig::DEFAULT_CHUNK_SIZE) {}

auto Verifier::verify(int fd, const WipeTarget& target, const PassResult& last_pass,
                      const VerificationPolicy& policy,
                      const std::optional<util::Sha256::Digest>& prewipe_fingerprint,
                      const core::UnitContext& context) const -> VerificationResult {
    if (policy.mode == VerificationPolicy::Mode::NONE) {
        return VerificationResult::skipped("verification not requested");
    }

    const uint64_t length = target.length;
    const uint64_t window = last_pass.chunk_size > 0 ? last_pass.chunk_size : chunk_size_;
    const auto expected_byte = algorithms::pattern_fill_byte(last_pass.spec.pattern);
    const bool incomplete = !last_pass.completed() || last_pass.bytes_written < length;

    // Read the medium, not what the page cache remembers of the writes
    (void)::posix_fadvise(fd, 0, static_cast<off_t>(length), POSIX_FADV_DONTNEED);

    const uint64_t total_windows = (length + window - 1) / window;
    const auto indices = select_windows(total_windows, policy);

    std::vector<uint8_t> buffer(
        static_cast<size_t>(std::min<uint64_t>(window, std::max<uint64_t>(length, 1))));
    util::Sha256 hasher;
    uint64_t verified = 0;

    for (const auto index : indices) {
        if (auto stop = context.stop_reason()) {
            return VerificationResult::skipped("verification interrupted: " + stop->message);
        }

        const uint64_t offset = index * window;
        const auto to_read = static_cast<size_t>(std::min<uint64_t>(window, length - offset));
        const auto got = util::pread_all(fd, buffer.data(), to_read, offset);

        if (got < to_read) {
            const int err = errno;
            auto result = VerificationResult::mismatch(
                offset + got, err != 0 ? std::string{"read failed: "} + std::strerror(err)
                                       : std::string{"extent shorter than expected"});
            LOG_ERROR("Verifier", target.path.string() + ": " + result.detail);
            return result;
        }

        const std::span<const uint8_t> data{buffer.data(), to_read};

        if (expected_byte) {
            const auto it = std::find_if(data.begin(), data.end(),
                                         [b = *expected_byte](uint8_t v) { return v != b; });
            if (it != data.end()) {
                const auto at = offset + static_cast<uint64_t>(std::distance(data.begin(), it));
                LOG_ERROR("Verifier", target.path.string() + ": mismatch at offset " +
                                          std::to_string(at));
                return VerificationResult::mismatch(
                    at, "byte differs from " +
                            std::string{algorithms::pattern_name(last_pass.spec.pattern)} +
                            " pattern");
            }
        } else {
            if (index >= last_pass.chunk_digests.size()) {
                return VerificationResult::mismatch(offset, "window not written by last pass");
            }
            if (util::Sha256::hash(data) != last_pass.chunk_digests[static_cast<size_t>(index)]) {
                LOG_ERROR("Verifier", target.path.string() + ": random window mismatch at offset " +
                                          std::to_string(offset));
                return VerificationResult::mismatch(offset,
                                                    "window differs from written random data");
            }
        }

        hasher.update(data);
        verified += to_read;
        emit_progress(context, target, verified, length);
    }

    if (incomplete) {
        return VerificationResult::mismatch(last_pass.bytes_written, "last pass incomplete");
    }

    const auto digest = hasher.finish();

    if (policy.mode == VerificationPolicy::Mode::FULL && prewipe_fingerprint && length > 0 &&
        digest == *prewipe_fingerprint) {
        LOG_ERROR("Verifier", target.path.string() + ": content unchanged since before the wipe");
        return VerificationResult::mismatch(0, "content identical to pre-wipe fingerprint");
    }

    VerificationResult result;
    result.outcome = VerificationOutcome::VERIFIED;
    result.fingerprint = util::Sha256::to_hex(digest);
    if (policy.mode == VerificationPolicy::Mode::FULL) {
        result.detail = "full read-back of " + std::to_string(length) + " bytes";
    } else {
        result.detail = "sampled " + std::to_string(indices.size()) + " of " +
                        std::to_string(total_windows) + " windows";
    }
    return result;
}

auto Verifier::capture_fingerprint(int fd, uint64_t length,
                                   const core::UnitContext& context) const
    -> std::expected<util::Sha256::Digest, util::Error> {
    std::vector<uint8_t> buffer(
        static_cast<size_t>(std::min<uint64_t>(chunk_size_, std::max<uint64_t>(length, 1))));
    util::Sha256 hasher;
    uint64_t offset = 0;

    while (offset < length) {
        if (auto stop = context.stop_reason()) {
            return std::unexpected(*stop);
        }
        const auto to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), length - offset));
        const auto got = util::pread_all(fd, buffer.data(), to_read, offset);
        if (got < to_read) {
            const int err = errno;
            return std::unexpected(util::Error{
                util::ErrorCode::IO_ERROR,
                "pre-wipe read failed at offset " + std::to_string(offset + got) + ": " +
                    (err != 0 ? std::strerror(err) : "unexpected end of extent")});
        }
        hasher.update(std::span<const uint8_t>{buffer.data(), to_read});
        offset += to_read;
    }
    return hasher.finish();
}
