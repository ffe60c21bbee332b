/**
 * @file RecordBuilder.hpp
 * @brief Single writer of the tamper-evident WipeRecord
 *
 * Every unit outcome is folded into a SHA-256 chain as it is appended:
 *
 *   chain_0 = SHA256(header)
 *   chain_i = SHA256(chain_{i-1} || encode(unit_i))
 *   integrity = SHA256(chain_n || outcome || ended_at)
 *
 * Fields are length-prefixed (8-byte big-endian length, then the bytes), so
 * no two distinct records encode to the same byte stream.
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Sha256.hpp"
#include "util/Time.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thrown by seal() on an already sealed record
 */
class AlreadySealedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Thrown by append() once the record is sealed
 */
class RecordSealedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @class RecordBuilder
 * @brief Appends unit outcomes in completion order and seals the record
 *
 * append() and seal() are safe to call from several threads; the chain
 * follows the order in which appends acquire the lock.
 */
class RecordBuilder {
public:
    RecordBuilder(std::string target, WipeMethod method,
                  util::Timestamp started_at = util::now_ms());

    // Non-copyable and non-movable due to mutex member
    RecordBuilder(const RecordBuilder&) = delete;
    RecordBuilder& operator=(const RecordBuilder&) = delete;
    RecordBuilder(RecordBuilder&&) = delete;
    RecordBuilder& operator=(RecordBuilder&&) = delete;

    /**
     * @brief Fold @p unit into the chain and append it
     * @return The record; read it only while no other append is in flight
     * @throws RecordSealedError if the record is sealed
     */
    auto append(UnitOutcome unit) -> const WipeRecord&;

    /**
     * @brief Compute the overall outcome, stamp ended_at and the integrity digest
     * @param cancelled Whether the invocation was cancelled
     * @throws AlreadySealedError on a second call
     */
    auto seal(bool cancelled) -> const WipeRecord&;

    /**
     * @brief Snapshot of the record
     */
    [[nodiscard]] auto snapshot() const -> WipeRecord;

    [[nodiscard]] auto unit_count() const -> size_t;

    /**
     * @brief Recompute the integrity digest of @p record from its fields
     * @return Lowercase hex SHA-256
     */
    [[nodiscard]] static auto compute_digest(const WipeRecord& record) -> std::string;

    /**
     * @brief Check every unit's chain digest and the final integrity digest
     */
    [[nodiscard]] static auto verify_integrity(const WipeRecord& record) -> bool;

    /**
     * @brief Outcome of an invocation from its units
     *
     * Aborted when cancelled or when every unit is Aborted (including none),
     * Success when every unit is Success, PartialFailure otherwise.
     */
    [[nodiscard]] static auto overall_outcome(const std::vector<UnitOutcome>& units,
                                              bool cancelled) -> Outcome;

private:
    [[nodiscard]] static auto header_digest(const WipeRecord& record) -> util::Sha256::Digest;
    [[nodiscard]] static auto chain_step(const util::Sha256::Digest& previous,
                                         const UnitOutcome& unit) -> util::Sha256::Digest;
    [[nodiscard]] static auto seal_digest(const util::Sha256::Digest& chain,
                                          const WipeRecord& record) -> util::Sha256::Digest;

    mutable std::mutex mutex_;
    WipeRecord record_;
    util::Sha256::Digest chain_{};
};
