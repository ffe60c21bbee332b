/**
 * @file DeviceDescriptor.hpp
 * @brief Block device description handed to the engine by the device-info collaborator
 */

#pragma once

#include <cstdint>
#include <string>

/**
 * @struct DeviceDescriptor
 * @brief Contains information about a storage device
 *
 * The engine does not enumerate or probe devices. The extent length used for
 * every pass is size_bytes as reported here.
 */
struct DeviceDescriptor {
    std::string path;             ///< Device node (e.g., /dev/sdb)
    uint64_t size_bytes = 0;      ///< Capacity in bytes
    std::string model;            ///< Device model name
    std::string serial;           ///< Device serial number
    bool is_mounted = false;      ///< Mount status as seen by the collaborator
    std::string mount_point;      ///< Mount point path, if mounted
    bool hosts_system = false;    ///< Device backs the running system (root, boot, swap)

    auto operator==(const DeviceDescriptor&) const -> bool = default;
};
