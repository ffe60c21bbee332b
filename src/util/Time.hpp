/**
 * @file Time.hpp
 * @brief Wall-clock helpers shared by the logger and the erasure record
 */

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace util {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * @brief Current UTC time truncated to whole milliseconds
 *
 * Record timestamps are kept at the precision they are serialized with, so
 * a digest recomputed from the JSON form matches the one computed in memory.
 */
[[nodiscard]] inline auto now_ms() -> Timestamp {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

/**
 * @brief ISO 8601 UTC rendering, e.g. "2026-01-22T14:32:45.123Z"
 */
[[nodiscard]] inline auto format_iso8601(Timestamp ts) -> std::string {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
    const auto ms = (ts - seconds).count();
    const auto time_t_value = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm_buf{};
    gmtime_r(&time_t_value, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms << 'Z';
    return oss.str();
}

}  // namespace util
