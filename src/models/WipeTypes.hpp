/**
 * @file WipeTypes.hpp
 * @brief Data types for secure erasure operations
 */

#pragma once

#include "models/DeviceDescriptor.hpp"
#include "util/Sha256.hpp"
#include "util/Time.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @enum WipeMethod
 * @brief Overwrite standards offered by the engine
 */
enum class WipeMethod {
    QUICK,  ///< Single random pass
    NIST,   ///< NIST SP 800-88 Clear: single random pass, verification mandatory
    DOD     ///< DoD 5220.22-M: zeros, ones, random
};

/**
 * @enum PatternKind
 * @brief Byte source for one overwrite pass
 */
enum class PatternKind {
    ZEROS,  ///< 0x00 fill
    ONES,   ///< 0xFF fill (complement of zeros)
    RANDOM  ///< CSPRNG output
};

/**
 * @struct PassSpec
 * @brief One entry of a method's pass sequence
 */
struct PassSpec {
    PatternKind pattern = PatternKind::RANDOM;
    int index = 0;  ///< Zero-based position within the method

    auto operator==(const PassSpec&) const -> bool = default;
};

/**
 * @enum TargetKind
 * @brief What an erasure unit refers to
 */
enum class TargetKind {
    FILE,              ///< A single requested file
    DIRECTORY_MEMBER,  ///< A regular file found under a requested directory
    BLOCK_DEVICE,      ///< A whole block device extent
    DIRECTORY_ENTRY    ///< Synthetic unit removing a requested directory after its files
};

/**
 * @struct WipeTarget
 * @brief One erasure unit
 */
struct WipeTarget {
    std::filesystem::path path;
    uint64_t length = 0;  ///< Extent size in bytes
    TargetKind kind = TargetKind::FILE;
    std::filesystem::path root;  ///< Originally requested path this unit was resolved from

    auto operator==(const WipeTarget&) const -> bool = default;
};

/**
 * @enum PassOutcome
 */
enum class PassOutcome {
    COMPLETED,
    ABORTED,
    IO_ERROR
};

/**
 * @struct PassResult
 * @brief One pass applied to one target
 */
struct PassResult {
    PassSpec spec;
    uint64_t bytes_written = 0;
    util::Timestamp started_at{};
    util::Timestamp ended_at{};
    PassOutcome outcome = PassOutcome::ABORTED;
    std::string detail;

    /// SHA-256 of each chunk written by a random pass, in offset order
    std::vector<util::Sha256::Digest> chunk_digests;
    /// Chunk size the digests were taken with
    uint64_t chunk_size = 0;

    [[nodiscard]] auto completed() const -> bool { return outcome == PassOutcome::COMPLETED; }
};

/**
 * @struct VerificationPolicy
 * @brief Read-back strategy after the last pass
 */
struct VerificationPolicy {
    enum class Mode {
        NONE,
        SAMPLED,
        FULL
    };

    Mode mode = Mode::NONE;
    uint32_t samples = 0;  ///< Window count for SAMPLED

    [[nodiscard]] static auto none() -> VerificationPolicy { return {}; }
    [[nodiscard]] static auto full() -> VerificationPolicy { return {Mode::FULL, 0}; }
    [[nodiscard]] static auto sampled(uint32_t n) -> VerificationPolicy {
        return {Mode::SAMPLED, n};
    }

    auto operator==(const VerificationPolicy&) const -> bool = default;
};

enum class VerificationOutcome {
    VERIFIED,
    MISMATCH,
    SKIPPED
};

/**
 * @struct VerificationResult
 */
struct VerificationResult {
    VerificationOutcome outcome = VerificationOutcome::SKIPPED;
    std::optional<uint64_t> mismatch_offset;
    std::string detail;
    std::string fingerprint;  ///< Hex SHA-256 of the content read back, when verified

    [[nodiscard]] static auto skipped(std::string reason) -> VerificationResult {
        VerificationResult result;
        result.outcome = VerificationOutcome::SKIPPED;
        result.detail = std::move(reason);
        return result;
    }

    [[nodiscard]] static auto mismatch(uint64_t offset, std::string reason) -> VerificationResult {
        VerificationResult result;
        result.outcome = VerificationOutcome::MISMATCH;
        result.mismatch_offset = offset;
        result.detail = std::move(reason);
        return result;
    }
};

/**
 * @enum Outcome
 * @brief Status of a unit or of a whole invocation
 */
enum class Outcome {
    SUCCESS,
    PARTIAL_FAILURE,
    ABORTED
};

/**
 * @struct UnitOutcome
 * @brief Everything recorded about one erasure unit
 */
struct UnitOutcome {
    WipeTarget target;
    std::vector<PassResult> passes;
    VerificationResult verification;
    Outcome status = Outcome::ABORTED;
    std::string detail;
    bool safety_denied = false;
    std::string chain_digest;  ///< Set by RecordBuilder::append
};

/**
 * @struct WipeRecord
 * @brief Tamper-evident account of one invocation
 */
struct WipeRecord {
    std::string target;
    WipeMethod method = WipeMethod::QUICK;
    std::vector<UnitOutcome> units;
    Outcome outcome = Outcome::ABORTED;
    util::Timestamp started_at{};
    util::Timestamp ended_at{};
    std::string integrity_digest;
    bool sealed = false;
};

/**
 * @struct WipeProgress
 * @brief Progress information for one unit
 */
struct WipeProgress {
    std::string target;
    uint64_t bytes_written = 0;
    uint64_t total_bytes = 0;
    int current_pass = 0;
    int total_passes = 0;
    double percentage = 0.0;
    bool verification_in_progress = false;
    std::string status;
};

/**
 * @brief Callback type for progress reporting (invoked from worker threads)
 */
using ProgressCallback = std::function<void(const WipeProgress&)>;

/**
 * @brief A requested target: a filesystem path or a described block device
 */
using WipeRequestTarget = std::variant<std::filesystem::path, DeviceDescriptor>;
