/**
 * @file DeviceLockRegistry.hpp
 * @brief One mutex per block device path
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @class DeviceLockRegistry
 * @brief Hands out the mutex that guards all writes to a given device
 *
 * Owned by the engine so that concurrent invocations sharing it never write
 * to the same device at once.
 */
class DeviceLockRegistry {
public:
    DeviceLockRegistry() = default;

    // Non-copyable and non-movable due to mutex member
    DeviceLockRegistry(const DeviceLockRegistry&) = delete;
    DeviceLockRegistry& operator=(const DeviceLockRegistry&) = delete;
    DeviceLockRegistry(DeviceLockRegistry&&) = delete;
    DeviceLockRegistry& operator=(DeviceLockRegistry&&) = delete;

    [[nodiscard]] auto lock_for(const std::string& device_path) -> std::shared_ptr<std::mutex> {
        std::lock_guard lock{mutex_};
        auto& slot = locks_[device_path];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};
