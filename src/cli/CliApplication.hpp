/**
 * @file CliApplication.hpp
 * @brief Command-line front end of the erasure engine
 */

#pragma once

#include "models/DeviceDescriptor.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace cli {

/// Exit code for usage errors and requests the engine rejects before writing
constexpr int EXIT_INVOCATION_ERROR = 3;

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool json_output = false;
    bool no_confirm = false;
    bool abort_on_denial = false;
    bool keep_files = false;
    std::string wipe_path;
    std::string device_path;
    std::optional<uint64_t> device_size;
    std::string method = "quick";
    std::string verify = "none";
    unsigned jobs = 0;
    unsigned timeout_seconds = 0;
    std::string record_path;
    std::string error;  ///< Set when the command line is malformed
};

/**
 * @class CliApplication
 * @brief Command-line application for secure erasure
 *
 * Provides command-line interface for:
 * - Wiping a file or a directory tree
 * - Wiping a block device
 * - Writing the sealed erasure record as JSON
 */
class CliApplication {
public:
    CliApplication() = default;

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return 0 success, 1 partial failure, 2 aborted, 3 invocation error
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options; error is non-empty for malformed input
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Parse a --verify value: none, full, sampled or sampled:N
     */
    [[nodiscard]] static auto parse_verify(const std::string& value)
        -> std::expected<VerificationPolicy, util::Error>;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

private:
    /**
     * @brief Wipe the target named by @p options
     * @return Exit code
     */
    auto cmd_wipe(const CliOptions& options) -> int;

    /**
     * @brief Describe the device at @p path, taking its size from the kernel unless given
     */
    [[nodiscard]] static auto describe_device(const std::string& path,
                                              std::optional<uint64_t> size)
        -> std::expected<DeviceDescriptor, util::Error>;

    /**
     * @brief Prompt user for confirmation
     * @param target Target to wipe
     * @param method Method display name
     * @return true if user confirms
     */
    [[nodiscard]] static auto confirm_wipe(const std::string& target, const std::string& method)
        -> bool;

    /**
     * @brief Print one line per unit of a sealed record
     */
    static void print_summary(const WipeRecord& record);
};

}  // namespace cli
