/**
 * @file OverwriteExecutor.hpp
 * @brief Streams one pass pattern over a target's extent
 */

#pragma once

#include "core/UnitContext.hpp"
#include "models/EngineConfig.hpp"
#include "models/WipeTypes.hpp"

#include <cstddef>

/**
 * @class OverwriteExecutor
 * @brief Writes a pass in fixed-size chunks and flushes it to the medium
 *
 * The chunk size only trades memory for syscall count; it never changes
 * what ends up on the medium.
 */
class OverwriteExecutor {
public:
    explicit OverwriteExecutor(size_t chunk_size = EngineConfig::DEFAULT_CHUNK_SIZE);

    /**
     * @brief Overwrite [0, target.length) of @p fd with the pass pattern
     * @param fd Descriptor opened for writing
     * @param target Unit whose extent is written
     * @param spec Pass to apply
     * @param total_passes Pass count of the method (progress only)
     * @param context Cancellation, deadline and progress sink
     * @return COMPLETED only when every byte was written and fsync succeeded;
     *         ABORTED on cancellation or timeout; IO_ERROR otherwise
     */
    [[nodiscard]] auto execute(int fd, const WipeTarget& target, const PassSpec& spec,
                               int total_passes, const core::UnitContext& context) const
        -> PassResult;

    [[nodiscard]] auto chunk_size() const -> size_t { return chunk_size_; }

private:
    size_t chunk_size_;
};
