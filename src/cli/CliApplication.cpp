/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "algorithms/PatternLibrary.hpp"
#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "core/CancellationToken.hpp"
#include "services/RecordNames.hpp"
#include "services/RecordSerializer.hpp"
#include "services/WipeEngine.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <linux/fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <vector>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<core::CancellationToken*> g_active_token{nullptr};

void signal_handler(int /*signal*/) {
    if (auto* token = g_active_token.load()) {
        token->cancel(core::CancelReason::USER_REQUESTED);
    }
    constexpr std::string_view message = "\nCancellation requested...\n";
    (void)::write(STDERR_FILENO, message.data(), message.size());
}

// Application name
constexpr auto APP_NAME = "secure-eraser-cli";

// Command line options
const struct option long_options[] = {
    {           "help",       no_argument, nullptr, 'h'},
    {        "version",       no_argument, nullptr, 'V'},
    {           "wipe", required_argument, nullptr, 'w'},
    {         "device", required_argument, nullptr, 'd'},
    {    "device-size", required_argument, nullptr, 's'},
    {         "method", required_argument, nullptr, 'm'},
    {         "verify", required_argument, nullptr, 'c'},
    {           "jobs", required_argument, nullptr, 'J'},
    {        "timeout", required_argument, nullptr, 't'},
    {"abort-on-denial",       no_argument, nullptr, 'A'},
    {     "keep-files",       no_argument, nullptr, 'k'},
    {         "record", required_argument, nullptr, 'r'},
    {           "json",       no_argument, nullptr, 'j'},
    {            "yes",       no_argument, nullptr, 'y'},
    {          nullptr,                 0, nullptr,   0}
};

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "secure-eraser" / "logs";
    util::Logger::instance().initialize(log_dir, APP_NAME);

    auto options = parse_args(argc, argv);

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help for usage.\n";
        return EXIT_INVOCATION_ERROR;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.wipe_path.empty() == options.device_path.empty()) {
        std::cerr << "Error: specify exactly one of --wipe or --device\n";
        print_help();
        return EXIT_INVOCATION_ERROR;
    }

    return cmd_wipe(options);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Restart the scan so the parser can be called more than once
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVw:d:s:m:c:J:t:Akr:jy", long_options, nullptr)) !=
           -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'w':
                options.wipe_path = optarg;
                break;
            case 'd':
                options.device_path = optarg;
                break;
            case 's':
                if (auto size = parse_number<uint64_t>(optarg)) {
                    options.device_size = *size;
                } else {
                    options.error = std::string{"invalid --device-size '"} + optarg + "'";
                }
                break;
            case 'm':
                options.method = optarg;
                break;
            case 'c':
                options.verify = optarg;
                break;
            case 'J':
                if (auto jobs = parse_number<unsigned>(optarg); jobs && *jobs > 0) {
                    options.jobs = *jobs;
                } else {
                    options.error = std::string{"invalid --jobs '"} + optarg + "'";
                }
                break;
            case 't':
                if (auto seconds = parse_number<unsigned>(optarg)) {
                    options.timeout_seconds = *seconds;
                } else {
                    options.error = std::string{"invalid --timeout '"} + optarg + "'";
                }
                break;
            case 'A':
                options.abort_on_denial = true;
                break;
            case 'k':
                options.keep_files = true;
                break;
            case 'r':
                options.record_path = optarg;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            default:
                options.error = "unrecognized or incomplete option";
                break;
        }
    }

    if (options.error.empty() && optind < argc) {
        options.error = std::string{"unexpected argument '"} + argv[optind] + "'";
    }

    return options;
}

auto CliApplication::parse_verify(const std::string& value)
    -> std::expected<VerificationPolicy, util::Error> {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "none") {
        return VerificationPolicy::none();
    }
    if (lower == "full") {
        return VerificationPolicy::full();
    }
    if (lower == "sampled") {
        // Zero lets the engine apply its default sample count
        return VerificationPolicy::sampled(0);
    }
    if (lower.starts_with("sampled:")) {
        if (auto n = parse_number<uint32_t>(std::string_view{lower}.substr(8)); n && *n > 0) {
            return VerificationPolicy::sampled(*n);
        }
    }
    return std::unexpected(util::Error{"invalid --verify '" + value +
                                       "' (expected none, full, sampled or sampled:N)"});
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Secure erasure of files, directory trees and block devices\n\n"
              << "Commands:\n"
              << "  -w, --wipe <path>         Wipe a file, or a directory and everything in it\n"
              << "  -d, --device <device>     Wipe a whole block device\n\n"
              << "Options:\n"
              << "  -h, --help                Show this help message\n"
              << "  -V, --version             Show version information\n"
              << "  -m, --method <name>       quick, nist or dod (default: quick)\n"
              << "  -c, --verify <policy>     none, full, sampled or sampled:N (default: none)\n"
              << "  -s, --device-size <bytes> Device extent (default: size reported by kernel)\n"
              << "  -J, --jobs <n>            Concurrent units (default: hardware threads)\n"
              << "  -t, --timeout <seconds>   Per-unit deadline (default: none)\n"
              << "  -A, --abort-on-denial     Stop all units when one is refused\n"
              << "  -k, --keep-files          Overwrite files but keep their names\n"
              << "  -r, --record <file>       Write the sealed erasure record as JSON\n"
              << "  -j, --json                Print the erasure record as JSON\n"
              << "  -y, --yes                 Skip confirmation prompt\n\n"
              << "Methods:\n"
              << "  quick                     Single random pass\n"
              << "  nist                      NIST SP 800-88 Clear, verification mandatory\n"
              << "  dod                       DoD 5220.22-M: zeros, ones, random\n\n"
              << "Exit codes:\n"
              << "  0 success, 1 partial failure, 2 aborted, 3 invocation error or denied\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --wipe ~/old-keys --method dod --verify full\n"
              << "  " << APP_NAME << " --device /dev/sdb --method nist --record sdb.json\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of secure-eraser - auditable secure erasure\n";
}

auto CliApplication::cmd_wipe(const CliOptions& options) -> int {
    auto method = algorithms::parse_method(options.method);
    if (!method) {
        LOG_ERROR("CLI", method.error().message);
        std::cerr << "Error: " << method.error().message << "\n"
                  << "Run with --help to see available methods.\n";
        return EXIT_INVOCATION_ERROR;
    }

    auto policy = parse_verify(options.verify);
    if (!policy) {
        std::cerr << "Error: " << policy.error().message << "\n";
        return EXIT_INVOCATION_ERROR;
    }

    WipeRequest request;
    request.method = *method;
    request.policy = *policy;
    request.concurrency_limit = options.jobs;

    std::string target_label;
    if (!options.device_path.empty()) {
        auto descriptor = describe_device(options.device_path, options.device_size);
        if (!descriptor) {
            LOG_ERROR("CLI", descriptor.error().message);
            std::cerr << "Error: " << descriptor.error().message << "\n";
            return EXIT_INVOCATION_ERROR;
        }
        target_label = descriptor->path + " (" +
                       ProgressDisplay::format_bytes(descriptor->size_bytes) + ")";
        request.target = *descriptor;
    } else {
        target_label = options.wipe_path;
        request.target = std::filesystem::path{options.wipe_path};
    }

    const auto method_label = std::string{algorithms::method_display_name(*method)};

    // Confirm
    if (!options.no_confirm) {
        if (!confirm_wipe(target_label, method_label)) {
            std::cout << "Aborted.\n";
            return 2;
        }
    }

    EngineConfig config;
    config.abort_all_on_denial = options.abort_on_denial;
    config.remove_after_wipe = !options.keep_files;
    config.unit_timeout = std::chrono::seconds{options.timeout_seconds};

    const auto pass_count = algorithms::passes_for(*method).value_or(std::vector<PassSpec>{});
    ProgressDisplay progress{target_label, method_label, static_cast<int>(pass_count.size())};
    if (!options.json_output) {
        request.progress = [&progress](const WipeProgress& p) { progress.update(p); };
    }

    // Set up signal handler for graceful cancellation
    core::CancellationToken token;
    g_active_token.store(&token);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    WipeEngine engine{config};
    auto record = engine.run_wipe(request, token);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_active_token.store(nullptr);

    if (!record) {
        std::cerr << "Error: " << record.error().message << "\n";
        return EXIT_INVOCATION_ERROR;
    }

    if (!options.record_path.empty()) {
        if (auto written = RecordSerializer::write_file(*record, options.record_path); !written) {
            LOG_ERROR("CLI", written.error().message);
            std::cerr << "Warning: " << written.error().message << "\n";
        }
    }

    if (options.json_output) {
        std::cout << RecordSerializer::to_json(*record);
    } else {
        progress.complete(record->outcome == Outcome::SUCCESS,
                          "Outcome: " +
                              std::string{record_names::outcome_name(record->outcome)} +
                              "  (integrity " + record->integrity_digest.substr(0, 16) + ")");
        print_summary(*record);
    }

    return WipeEngine::exit_code_for(*record);
}

auto CliApplication::describe_device(const std::string& path, std::optional<uint64_t> size)
    -> std::expected<DeviceDescriptor, util::Error> {
    DeviceDescriptor descriptor;
    descriptor.path = path;

    if (size) {
        descriptor.size_bytes = *size;
        return descriptor;
    }

    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    if (!fd) {
        return std::unexpected(util::Error{util::ErrorCode::INVALID_TARGET, fd.error().message});
    }

    uint64_t bytes = 0;
    if (::ioctl(fd->get(), BLKGETSIZE64, &bytes) != 0) {
        return std::unexpected(util::Error{
            util::ErrorCode::INVALID_TARGET,
            "Failed to get size of " + path + ": " + std::strerror(errno)});
    }
    descriptor.size_bytes = bytes;
    return descriptor;
}

auto CliApplication::confirm_wipe(const std::string& target, const std::string& method) -> bool {
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will PERMANENTLY DESTROY all data in " << target
              << "!\033[0m\n";
    std::cout << "Method: " << method << "\n\n";
    std::cout << "Type 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

void CliApplication::print_summary(const WipeRecord& record) {
    for (const auto& unit : record.units) {
        std::cout << "  " << record_names::outcome_name(unit.status) << "  "
                  << unit.target.path.string() << "  ["
                  << record_names::verification_outcome_name(unit.verification.outcome) << "]";
        if (!unit.detail.empty()) {
            std::cout << "  " << unit.detail;
        }
        std::cout << "\n";
    }
}

}  // namespace cli
