/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI wipe operations
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Displays a progress bar with percentage, speed, and ETA for the unit
 * currently reporting. Updates may arrive from several worker threads.
 */
class ProgressDisplay {
public:
    /**
     * @brief Construct a progress display
     * @param target Requested target (for display)
     * @param method_name Display name of the wipe method
     * @param total_passes Passes per unit
     */
    ProgressDisplay(std::string target, std::string method_name, int total_passes);

    /**
     * @brief Update the progress display
     * @param progress Current progress information
     */
    void update(const WipeProgress& progress);

    /**
     * @brief Mark the operation as complete
     * @param success Whether the operation succeeded
     * @param message Final status message
     */
    void complete(bool success, const std::string& message);

    /**
     * @brief Enable or disable ANSI color output
     * @param enable Whether to use colors
     */
    void set_color_enabled(bool enable);

    /**
     * @brief Check if terminal supports ANSI codes
     * @return true if terminal supports ANSI
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Format bytes as human-readable string (e.g., "245.0 MB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    /**
     * @brief Format duration as human-readable string (e.g., "12:34")
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;

    void clear_line();

    std::mutex mutex_;
    std::string target_;
    std::string method_name_;
    int total_passes_;
    bool color_enabled_ = true;
    bool header_printed_ = false;

    // Speed is measured per unit and pass
    std::string current_unit_;
    int current_pass_ = 0;
    bool current_verifying_ = false;
    std::chrono::steady_clock::time_point phase_start_;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
