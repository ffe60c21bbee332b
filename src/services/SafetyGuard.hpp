/**
 * @file SafetyGuard.hpp
 * @brief Refuses targets whose destruction would damage the running system
 *
 * The guard is the last check before a unit's first pass. A denial carries
 * ErrorCode::SAFETY_DENIED and a human-readable reason.
 */

#pragma once

#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"
#include "services/IMountTable.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <memory>

/**
 * @class SafetyGuard
 * @brief Applies protected-path, mount, symlink and permission rules
 */
class SafetyGuard {
public:
    SafetyGuard(SafetyPolicy policy, std::shared_ptr<const IMountTable> mount_table);

    /**
     * @brief Authorize one resolved unit
     * @return void on success, SAFETY_DENIED with the reason otherwise
     */
    [[nodiscard]] auto authorize(const WipeTarget& target) const
        -> std::expected<void, util::Error>;

    /**
     * @brief Authorize the target of an invocation before it is resolved
     *
     * Protected paths are denied even if they do not exist. Other rules apply
     * to existing paths only; a missing path is left for the resolver to reject.
     */
    [[nodiscard]] auto authorize_request(const WipeRequestTarget& request) const
        -> std::expected<void, util::Error>;

    /**
     * @brief Whether @p path is a protected path or lies in a protected tree
     * @param path Absolute, normalized path
     */
    [[nodiscard]] auto is_protected(const std::filesystem::path& path) const -> bool;

private:
    [[nodiscard]] auto check_path(const std::filesystem::path& path, TargetKind kind,
                                  const std::filesystem::path& root) const
        -> std::expected<void, util::Error>;
    [[nodiscard]] auto check_device(const std::string& device_path) const
        -> std::expected<void, util::Error>;

    SafetyPolicy policy_;
    std::shared_ptr<const IMountTable> mount_table_;
};
