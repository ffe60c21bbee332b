/**
 * @file PatternSource.hpp
 * @brief Per-chunk byte generator for one overwrite pass
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>

namespace algorithms {

/**
 * @class PatternSource
 * @brief Produces the bytes of a pass, one chunk at a time
 *
 * Constant patterns are memset; random chunks are drawn fresh from the
 * CSPRNG for every chunk so no two chunks repeat.
 */
class PatternSource {
public:
    explicit PatternSource(PatternKind pattern);

    /**
     * @brief Fill @p chunk with the next bytes of the pattern
     * @return RANDOM_SOURCE_FAILURE when the CSPRNG fails
     */
    [[nodiscard]] auto fill(std::span<uint8_t> chunk) const -> std::expected<void, util::Error>;

    [[nodiscard]] auto pattern() const -> PatternKind { return pattern_; }

    [[nodiscard]] auto is_random() const -> bool { return !fill_byte_.has_value(); }

private:
    PatternKind pattern_;
    std::optional<uint8_t> fill_byte_;
};

}  // namespace algorithms
