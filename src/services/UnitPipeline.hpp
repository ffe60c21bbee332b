/**
 * @file UnitPipeline.hpp
 * @brief Guard, overwrite, verify and remove one erasure unit
 */

#pragma once

#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"
#include "services/DeviceLockRegistry.hpp"
#include "services/IUnitRunner.hpp"
#include "services/OverwriteExecutor.hpp"
#include "services/SafetyGuard.hpp"
#include "services/Verifier.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <vector>

/**
 * @class UnitPipeline
 * @brief IUnitRunner that applies one method's passes to a unit
 *
 * Passes run strictly in order and the sequence stops at the first pass
 * that does not complete. A unit is Success only when every pass completed,
 * verification did not mismatch and, when enabled, the entry was removed.
 */
class UnitPipeline : public IUnitRunner {
public:
    /**
     * @param passes Pass sequence of the invocation's method
     * @param policy Effective verification policy
     * @param config Engine tunables (chunk size, removal, fingerprinting)
     * @param guard Safety guard consulted before the first pass
     * @param device_locks Per-device mutexes shared across invocations
     */
    UnitPipeline(std::vector<PassSpec> passes, VerificationPolicy policy, const EngineConfig& config,
                 const SafetyGuard& guard, DeviceLockRegistry& device_locks);

    [[nodiscard]] auto run(const WipeTarget& target, const core::UnitContext& context)
        -> UnitOutcome override;

private:
    [[nodiscard]] auto run_extent(const WipeTarget& target, const core::UnitContext& context,
                                  UnitOutcome outcome) -> UnitOutcome;
    [[nodiscard]] auto run_directory_entry(const WipeTarget& target, UnitOutcome outcome)
        -> UnitOutcome;

    /**
     * @brief Truncate, rename to a random name and unlink a wiped file
     */
    [[nodiscard]] static auto remove_entry(const std::filesystem::path& path)
        -> std::expected<void, util::Error>;

    /**
     * @brief Remove a directory tree that holds no regular files, bottom-up
     */
    [[nodiscard]] static auto remove_tree(const std::filesystem::path& directory)
        -> std::expected<void, util::Error>;

    std::vector<PassSpec> passes_;
    VerificationPolicy policy_;
    const EngineConfig& config_;
    const SafetyGuard& guard_;
    DeviceLockRegistry& device_locks_;
    OverwriteExecutor executor_;
    Verifier verifier_;
};
