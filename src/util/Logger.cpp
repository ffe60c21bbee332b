/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include "util/Time.hpp"

#include <iostream>
#include <string>

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    current_file_size_ = 0;
    initialized_ = false;

    std::error_code ec;
    if (!std::filesystem::exists(log_dir_, ec)) {
        if (!std::filesystem::create_directories(log_dir_, ec)) {
            std::cerr << "Logger: Failed to create log directory: " << log_dir_ << " - "
                      << ec.message() << std::endl;
            return false;
        }
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;

    const std::string line = format_iso8601(now_ms()) + " [INFO ] [Logger] Logger initialized: app=" +
                             app_name_ + " dir=" + log_dir_.string() +
                             " level=" + std::string{level_to_string(min_level_)} +
                             " max_size=" + std::to_string(policy_.max_file_size_bytes) +
                             " max_files=" + std::to_string(policy_.max_files) + "\n";
    file_ << line;
    file_.flush();
    current_file_size_ += line.size();

    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_log_file() -> bool {
    const auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: Failed to open log file: " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }

    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string log_line = format_iso8601(now_ms());
    log_line += " [";
    log_line += level_to_string(level);
    log_line += "] [";
    log_line += component;
    log_line += "] ";
    log_line += message;
    log_line += '\n';

    if (initialized_ && file_.is_open()) {
        check_and_rotate();
        file_ << log_line;
        file_.flush();
        current_file_size_ += log_line.size();
    }

    if (console_output_) {
        std::cerr << log_line;
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        file_ << format_iso8601(now_ms()) << " [INFO ] [Logger] Logger shutting down\n";
        file_.flush();
        file_.close();
    }

    initialized_ = false;
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

auto Logger::rotated_path(int index) const -> std::filesystem::path {
    return log_dir_ / (app_name_ + "." + std::to_string(index) + ".log");
}

void Logger::check_and_rotate() {
    if (current_file_size_ >= policy_.max_file_size_bytes) {
        rotate_logs();
    }
}

void Logger::rotate_logs() {
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;

    // Oldest file falls off the end
    std::filesystem::remove(rotated_path(policy_.max_files), ec);

    for (int i = policy_.max_files - 1; i >= 1; --i) {
        const auto old_path = rotated_path(i);
        if (std::filesystem::exists(old_path, ec)) {
            std::filesystem::rename(old_path, rotated_path(i + 1), ec);
        }
    }

    const auto base_path = log_dir_ / (app_name_ + ".log");
    if (std::filesystem::exists(base_path, ec)) {
        std::filesystem::rename(base_path, rotated_path(1), ec);
    }

    if (!open_log_file()) {
        initialized_ = false;
        return;
    }

    file_ << format_iso8601(now_ms()) << " [INFO ] [Logger] Log file rotated\n";
    file_.flush();
}

}  // namespace util
