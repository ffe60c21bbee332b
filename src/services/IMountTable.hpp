/**
 * @file IMountTable.hpp
 * @brief Interface for reading the live mount table
 */

#pragma once

#include <string>
#include <vector>

/**
 * @struct MountEntry
 * @brief Information about a mounted filesystem
 */
struct MountEntry {
    std::string device;       // e.g., "/dev/sda1"
    std::string mount_point;  // e.g., "/home"
    std::string filesystem;   // e.g., "ext4"
};

/**
 * @class IMountTable
 * @brief Source of mount information for the safety guard
 *
 * Implementations read the table fresh on every call; the guard runs
 * immediately before a unit's first pass and must see the current state.
 */
class IMountTable {
public:
    virtual ~IMountTable() = default;

    /**
     * @brief Currently mounted filesystems
     */
    [[nodiscard]] virtual auto entries() const -> std::vector<MountEntry> = 0;

    /**
     * @brief Device-mapper holders (e.g. "dm-0") stacked on a device or its partitions
     * @param device_path Device node (e.g., /dev/sdb)
     */
    [[nodiscard]] virtual auto dm_holders(const std::string& device_path) const
        -> std::vector<std::string> = 0;
};
