/**
 * @file PatternLibrary.hpp
 * @brief Method to pass-sequence lookup
 *
 * Every WipeMethod is bound once, in a constant table, to its ordered pass
 * sequence. Adding a method means adding one table row.
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

namespace algorithms {

/**
 * @brief Ordered pass sequence of a method
 * @param method Method to look up
 * @return Pass specs in execution order, or INVALID_METHOD for values outside the enum
 *
 * Quick: random. NIST: random. DoD 5220.22-M: zeros, ones, random.
 */
[[nodiscard]] auto passes_for(WipeMethod method) -> std::expected<std::vector<PassSpec>, util::Error>;

/**
 * @brief Resolve a method identifier ("quick", "nist", "dod"; case-insensitive)
 * @return The method, or INVALID_METHOD naming the rejected identifier
 */
[[nodiscard]] auto parse_method(std::string_view name) -> std::expected<WipeMethod, util::Error>;

/**
 * @brief Wire name used in records ("quick", "nist", "dod")
 */
[[nodiscard]] auto method_name(WipeMethod method) -> std::string_view;

/**
 * @brief Human-readable standard name
 */
[[nodiscard]] auto method_display_name(WipeMethod method) -> std::string_view;

/**
 * @brief Whether the standard demands read-back confirmation
 */
[[nodiscard]] auto requires_verification(WipeMethod method) -> bool;

/**
 * @brief Wire name of a pattern ("zeros", "ones", "random")
 */
[[nodiscard]] auto pattern_name(PatternKind pattern) -> std::string_view;

/**
 * @brief Fill byte of a constant pattern, nullopt for random
 */
[[nodiscard]] auto pattern_fill_byte(PatternKind pattern) -> std::optional<uint8_t>;

}  // namespace algorithms
