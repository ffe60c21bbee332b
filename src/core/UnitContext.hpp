/**
 * @file UnitContext.hpp
 * @brief Per-unit execution context handed from the scheduler to the pipeline
 */

#pragma once

#include "core/CancellationToken.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <optional>

namespace core {

/**
 * @struct UnitContext
 * @brief Stop conditions and progress sink for one erasure unit
 */
struct UnitContext {
    const CancellationToken* token = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    ProgressCallback progress;

    /**
     * @brief Reason to stop before the next chunk, if any
     * @return CANCELLED or TIMEOUT error, or nullopt to keep going
     */
    [[nodiscard]] auto stop_reason() const -> std::optional<util::Error> {
        if (token != nullptr && token->is_cancelled()) {
            return util::Error{util::ErrorCode::CANCELLED, "Cancelled"};
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            return util::Error{util::ErrorCode::TIMEOUT, "Timeout"};
        }
        return std::nullopt;
    }

    void report(const WipeProgress& progress_update) const {
        if (progress) {
            progress(progress_update);
        }
    }
};

}  // namespace core
