/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared between the caller and worker threads
 */

#pragma once

#include <atomic>

namespace core {

/**
 * @enum CancelReason
 * @brief Why an invocation was cancelled
 */
enum class CancelReason {
    NONE,
    USER_REQUESTED,   ///< Caller asked to stop (signal, UI button)
    SAFETY_TRIGGERED  ///< A unit was denied under the abort-all policy
};

/**
 * @class CancellationToken
 * @brief One-shot cancellation flag checked at chunk boundaries
 *
 * The first cancel() wins the reason; later calls only keep the flag set.
 * Bytes already written are never rolled back.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    // Shared by reference with workers
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel(CancelReason reason = CancelReason::USER_REQUESTED) noexcept {
        auto expected = CancelReason::NONE;
        reason_.compare_exchange_strong(expected, reason);
        cancelled_.store(true);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load();
    }

    [[nodiscard]] auto reason() const noexcept -> CancelReason {
        return reason_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<CancelReason> reason_{CancelReason::NONE};
};

}  // namespace core
