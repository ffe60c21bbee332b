/**
 * @file Error.hpp
 * @brief Error value used with std::expected across the engine
 *
 * Fallible operations return std::expected<T, util::Error>. The numeric code
 * carries an ErrorCode so callers can branch on the failure class without
 * parsing messages.
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorCode
 * @brief Failure classes reported by the erasure engine
 */
enum class ErrorCode : int {
    NONE = 0,
    INVALID_METHOD,        ///< Unknown wipe method identifier
    INVALID_TARGET,        ///< Target does not exist or has an unsupported type
    SAFETY_DENIED,         ///< Safety guard refused the target
    IO_ERROR,              ///< Read, write or flush failure
    VERIFICATION_MISMATCH, ///< Read-back content differs from the last pass
    TIMEOUT,               ///< Per-unit deadline expired
    CANCELLED,             ///< Cancellation token fired
    ALREADY_SEALED,        ///< seal() called twice on a record
    RECORD_SEALED,         ///< Mutation attempted on a sealed record
    RANDOM_SOURCE_FAILURE, ///< CSPRNG could not produce bytes
    INTERNAL_ERROR         ///< Record could not be kept for the invocation
};

/**
 * @struct Error
 * @brief Represents an error with a message and optional code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorCode err_code, std::string msg)
        : message(std::move(msg)), code(static_cast<int>(err_code)) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto error_code() const -> ErrorCode {
        return static_cast<ErrorCode>(code);
    }

    [[nodiscard]] auto is(ErrorCode err_code) const -> bool {
        return code == static_cast<int>(err_code);
    }
};

/**
 * @brief Stable lowercase name for an error code (used in record details)
 */
[[nodiscard]] constexpr auto error_code_name(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::NONE:
            return "none";
        case ErrorCode::INVALID_METHOD:
            return "InvalidMethod";
        case ErrorCode::INVALID_TARGET:
            return "InvalidTarget";
        case ErrorCode::SAFETY_DENIED:
            return "SafetyDenied";
        case ErrorCode::IO_ERROR:
            return "IOError";
        case ErrorCode::VERIFICATION_MISMATCH:
            return "VerificationMismatch";
        case ErrorCode::TIMEOUT:
            return "Timeout";
        case ErrorCode::CANCELLED:
            return "Cancelled";
        case ErrorCode::ALREADY_SEALED:
            return "AlreadySealed";
        case ErrorCode::RECORD_SEALED:
            return "RecordSealed";
        case ErrorCode::RANDOM_SOURCE_FAILURE:
            return "RandomSourceFailure";
        case ErrorCode::INTERNAL_ERROR:
            return "InternalError";
    }
    return "unknown";
}

}  // namespace util
