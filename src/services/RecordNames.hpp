/**
 * @file RecordNames.hpp
 * @brief Stable external names of record enums
 *
 * These strings appear in serialized records and feed the integrity chain;
 * changing one invalidates every digest computed before the change.
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <string_view>

namespace record_names {

[[nodiscard]] constexpr auto outcome_name(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::SUCCESS:
            return "success";
        case Outcome::PARTIAL_FAILURE:
            return "partial_failure";
        case Outcome::ABORTED:
            return "aborted";
    }
    return "aborted";
}

[[nodiscard]] constexpr auto pass_outcome_name(PassOutcome outcome) -> std::string_view {
    switch (outcome) {
        case PassOutcome::COMPLETED:
            return "completed";
        case PassOutcome::ABORTED:
            return "aborted";
        case PassOutcome::IO_ERROR:
            return "ioerror";
    }
    return "aborted";
}

[[nodiscard]] constexpr auto verification_outcome_name(VerificationOutcome outcome)
    -> std::string_view {
    switch (outcome) {
        case VerificationOutcome::VERIFIED:
            return "verified";
        case VerificationOutcome::MISMATCH:
            return "mismatch";
        case VerificationOutcome::SKIPPED:
            return "skipped";
    }
    return "skipped";
}

// Directory members are files to the record reader
[[nodiscard]] constexpr auto target_kind_name(TargetKind kind) -> std::string_view {
    switch (kind) {
        case TargetKind::FILE:
        case TargetKind::DIRECTORY_MEMBER:
            return "file";
        case TargetKind::BLOCK_DEVICE:
            return "device";
        case TargetKind::DIRECTORY_ENTRY:
            return "dir-entry";
    }
    return "file";
}

}  // namespace record_names
