/**
 * @file EngineConfig.hpp
 * @brief Tunables for the erasure engine and its safety rules
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

/**
 * @struct SafetyPolicy
 * @brief Paths the safety guard never lets the engine touch
 */
struct SafetyPolicy {
    /// Denied when the target path equals one of these
    std::vector<std::string> protected_paths{
        "/",     "/bin",  "/boot", "/dev", "/etc",  "/home", "/lib",  "/lib32", "/lib64",
        "/libx32", "/media", "/mnt", "/opt", "/proc", "/root", "/run", "/sbin",  "/srv",
        "/sys",  "/tmp",  "/usr",  "/var"};

    /// Denied when the target path equals one of these or lies beneath it
    std::vector<std::string> protected_trees{
        "/bin", "/boot", "/etc", "/lib", "/lib32", "/lib64", "/libx32", "/proc", "/sbin",
        "/sys", "/usr"};

    /// Deny paths that are the mount point of a mounted filesystem
    bool deny_mount_points = true;
};

/**
 * @struct EngineConfig
 * @brief Resource and policy parameters for one engine instance
 */
struct EngineConfig {
    static constexpr size_t DEFAULT_CHUNK_SIZE = 1'024 * 1'024;  // 1MB
    static constexpr uint32_t DEFAULT_SAMPLE_COUNT = 64;

    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    /// 0 means "one worker per hardware thread"
    unsigned concurrency_limit = 0;
    /// Zero disables the per-unit deadline
    std::chrono::milliseconds unit_timeout{0};
    bool abort_all_on_denial = false;
    /// Truncate, rename and unlink files after they are wiped and verified
    bool remove_after_wipe = true;
    /// Windows read back when NIST/DoD forces sampled verification on a device
    uint32_t default_sample_count = DEFAULT_SAMPLE_COUNT;
    /// Hash the extent before a random last pass so Full verification can rule out stale content
    bool capture_prewipe_fingerprint = true;

    SafetyPolicy safety;

    [[nodiscard]] auto effective_concurrency() const -> unsigned {
        if (concurrency_limit > 0) {
            return concurrency_limit;
        }
        const auto hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }
};
