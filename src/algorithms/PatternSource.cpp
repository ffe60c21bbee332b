#include "algorithms/PatternSource.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "util/SecureRandom.hpp"

#include <cstring>

namespace algorithms {

PatternSource::PatternSource(PatternKind pattern)
    : pattern_(pattern), fill_byte_(pattern_fill_byte(pattern)) {}

auto PatternSource::fill(std::span<uint8_t> chunk) const -> std::expected<void, util::Error> {
    if (chunk.empty()) {
        return {};
    }
    if (fill_byte_) {
        std::memset(chunk.data(), *fill_byte_, chunk.size());
        return {};
    }
    return util::SecureRandom::fill(chunk);
}

}  // namespace algorithms
