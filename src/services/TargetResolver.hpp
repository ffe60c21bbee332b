/**
 * @file TargetResolver.hpp
 * @brief Expands a requested target into erasure units
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <vector>

/**
 * @class TargetResolver
 * @brief Turns a path or device descriptor into an ordered list of WipeTargets
 *
 * Directories expand depth-first with entries sorted by name, one unit per
 * regular file, followed by a DIRECTORY_ENTRY unit for the directory itself.
 * Symbolic links are never followed and never become units.
 */
class TargetResolver {
public:
    /**
     * @brief Resolve @p request
     * @return Units in dispatch order, or INVALID_TARGET
     */
    [[nodiscard]] auto resolve(const WipeRequestTarget& request) const
        -> std::expected<std::vector<WipeTarget>, util::Error>;

private:
    [[nodiscard]] auto resolve_path(const std::filesystem::path& path) const
        -> std::expected<std::vector<WipeTarget>, util::Error>;
    [[nodiscard]] auto collect_members(const std::filesystem::path& directory,
                                       const std::filesystem::path& root,
                                       std::vector<WipeTarget>& units) const
        -> std::expected<void, util::Error>;
};
