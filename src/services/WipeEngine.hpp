/**
 * @file WipeEngine.hpp
 * @brief Entry point of the secure erasure engine
 */

#pragma once

#include "core/CancellationToken.hpp"
#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"
#include "services/DeviceLockRegistry.hpp"
#include "services/IMountTable.hpp"
#include "util/Error.hpp"

#include <expected>
#include <memory>

/**
 * @struct WipeRequest
 * @brief Parameters of one invocation
 */
struct WipeRequest {
    WipeRequestTarget target;
    WipeMethod method = WipeMethod::QUICK;
    VerificationPolicy policy = VerificationPolicy::none();
    /// 0 keeps the engine's configured limit
    unsigned concurrency_limit = 0;
    ProgressCallback progress;
};

/**
 * @class WipeEngine
 * @brief Resolves, guards, overwrites, verifies and records one request
 *
 * Each call to run_wipe builds its own invocation state; the only state
 * shared between calls is the per-device lock registry.
 */
class WipeEngine {
public:
    explicit WipeEngine(EngineConfig config = {},
                        std::shared_ptr<const IMountTable> mount_table = nullptr);

    // Non-copyable and non-movable due to the lock registry
    WipeEngine(const WipeEngine&) = delete;
    WipeEngine& operator=(const WipeEngine&) = delete;
    WipeEngine(WipeEngine&&) = delete;
    WipeEngine& operator=(WipeEngine&&) = delete;

    /**
     * @brief Run one erasure invocation
     * @return Sealed record, or INVALID_METHOD / INVALID_TARGET before anything is written
     *
     * A denial of the requested target itself is not an error: the record
     * holds one Aborted unit and no pass is executed.
     */
    [[nodiscard]] auto run_wipe(const WipeRequest& request, core::CancellationToken& token)
        -> std::expected<WipeRecord, util::Error>;

    /**
     * @brief Verification policy actually applied for @p request
     *
     * Methods that mandate verification upgrade NONE to FULL for paths and
     * to SAMPLED(default_sample_count) for devices.
     */
    [[nodiscard]] auto effective_policy(const WipeRequest& request) const -> VerificationPolicy;

    [[nodiscard]] auto config() const -> const EngineConfig& { return config_; }

    /**
     * @brief Process exit code for a sealed record
     * @return 0 success, 1 partial failure, 2 aborted, 3 when the sole unit was denied
     */
    [[nodiscard]] static auto exit_code_for(const WipeRecord& record) -> int;

private:
    EngineConfig config_;
    std::shared_ptr<const IMountTable> mount_table_;
    DeviceLockRegistry device_locks_;
};
