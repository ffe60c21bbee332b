/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";

auto fixed1(double value) -> std::string {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

}  // namespace

ProgressDisplay::ProgressDisplay(std::string target, std::string method_name, int total_passes)
    : target_(std::move(target)), method_name_(std::move(method_name)),
      total_passes_(total_passes), phase_start_(std::chrono::steady_clock::now()) {

    // Disable colors if not a terminal
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    std::lock_guard lock{mutex_};
    color_enabled_ = enable;
}

void ProgressDisplay::update(const WipeProgress& progress) {
    std::lock_guard lock{mutex_};

    // Print header on first update
    if (!header_printed_) {
        std::cout << "\n";
        if (color_enabled_) {
            std::cout << BOLD;
        }
        std::cout << "Wiping " << target_ << "\n";
        std::cout << "Method: " << method_name_ << " (" << total_passes_ << " pass"
                  << (total_passes_ != 1 ? "es" : "") << ")\n";
        if (color_enabled_) {
            std::cout << RESET;
        }
        std::cout << std::flush;
        header_printed_ = true;
    }

    const auto now = std::chrono::steady_clock::now();
    if (progress.target != current_unit_ || progress.current_pass != current_pass_ ||
        progress.verification_in_progress != current_verifying_) {
        current_unit_ = progress.target;
        current_pass_ = progress.current_pass;
        current_verifying_ = progress.verification_in_progress;
        phase_start_ = now;
    }

    std::string status_line;
    if (progress.verification_in_progress) {
        status_line = "Verifying: ";
    } else {
        status_line = "Pass " + std::to_string(progress.current_pass) + "/" +
                      std::to_string(progress.total_passes) + ": ";
    }
    status_line += generate_progress_bar(progress.percentage) + " " +
                   fixed1(progress.percentage) + "%";

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - phase_start_).count();
    if (elapsed > 0 && progress.bytes_written > 0) {
        const auto bytes_per_sec = static_cast<uint64_t>(
            static_cast<double>(progress.bytes_written) * 1000.0 / static_cast<double>(elapsed));
        status_line += "  |  " + format_bytes(bytes_per_sec) + "/s";
        if (bytes_per_sec > 0 && progress.total_bytes > progress.bytes_written) {
            const auto remaining = progress.total_bytes - progress.bytes_written;
            status_line +=
                "  |  ETA: " + format_duration(static_cast<int64_t>(remaining / bytes_per_sec));
        }
    }

    status_line += "  " + progress.target;

    clear_line();
    std::cout << status_line << std::flush;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    std::lock_guard lock{mutex_};
    clear_line();
    std::cout << "\n";

    if (color_enabled_) {
        std::cout << (success ? GREEN : RED) << BOLD;
    }

    std::cout << (success ? "[OK] " : "[FAILED] ") << message;

    if (color_enabled_) {
        std::cout << RESET;
    }

    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    if (bytes >= TB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(TB)) + " TB";
    } else if (bytes >= GB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(GB)) + " GB";
    } else if (bytes >= MB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(MB)) + " MB";
    } else if (bytes >= KB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(KB)) + " KB";
    }
    return std::to_string(bytes) + " B";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const int64_t hours = seconds / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    std::ostringstream out;
    out << std::setfill('0');
    if (hours > 0) {
        out << hours << ":" << std::setw(2) << minutes << ":" << std::setw(2) << secs;
    } else {
        out << std::setw(2) << minutes << ":" << std::setw(2) << secs;
    }
    return out.str();
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";

    if (color_enabled_) {
        bar += GREEN;
    }

    for (int i = 0; i < filled; ++i) {
        bar += "\u2588";  // Full block character
    }

    if (color_enabled_) {
        bar += RESET;
    }

    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "\u2591";  // Light shade character
    }

    bar += "]";

    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        // Move cursor to beginning of line and clear
        std::cout << "\r\033[K";
    } else {
        // For non-terminals, just print newline
        std::cout << "\n";
    }
}

}  // namespace cli
