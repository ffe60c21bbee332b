/**
 * @file Verifier.hpp
 * @brief Read-back confirmation of the last overwrite pass
 */

#pragma once

#include "core/UnitContext.hpp"
#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"
#include "util/Sha256.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>

/**
 * @class Verifier
 * @brief Confirms that a target holds exactly what its last pass wrote
 *
 * Constant patterns are compared byte by byte. Random patterns are compared
 * window by window against the SHA-256 digests the executor took of the
 * bytes it wrote, so a random pass is verified as precisely as a constant
 * one. Windows are the pass's chunks.
 *
 * A pass that did not write its whole extent can never verify: the result
 * is a Mismatch at the first differing or unwritten offset.
 */
class Verifier {
public:
    explicit Verifier(size_t chunk_size = EngineConfig::DEFAULT_CHUNK_SIZE);

    /**
     * @brief Verify @p target against @p last_pass under @p policy
     * @param fd Descriptor opened for reading
     * @param target Unit being verified
     * @param last_pass Result of the final pass applied to the unit
     * @param policy FULL, SAMPLED(n) or NONE
     * @param prewipe_fingerprint SHA-256 of the extent before the first pass, if captured
     * @param context Cancellation and progress sink
     */
    [[nodiscard]] auto verify(int fd, const WipeTarget& target, const PassResult& last_pass,
                              const VerificationPolicy& policy,
                              const std::optional<util::Sha256::Digest>& prewipe_fingerprint,
                              const core::UnitContext& context) const -> VerificationResult;

    /**
     * @brief SHA-256 of [0, length) of @p fd
     * @return Digest, or IO_ERROR / CANCELLED / TIMEOUT
     */
    [[nodiscard]] auto capture_fingerprint(int fd, uint64_t length,
                                           const core::UnitContext& context) const
        -> std::expected<util::Sha256::Digest, util::Error>;

private:
    size_t chunk_size_;
};
