/**
 * @file MountTable.hpp
 * @brief /proc/mounts backed mount table and lookups over it
 */

#pragma once

#include "services/IMountTable.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @class MountTable
 * @brief Reads mounts with getmntent and device-mapper holders from sysfs
 */
class MountTable : public IMountTable {
public:
    /**
     * @param mounts_path fstab-format file to parse
     * @param sys_block_path Root of the per-device sysfs tree
     */
    explicit MountTable(std::string mounts_path = "/proc/mounts",
                        std::string sys_block_path = "/sys/class/block");

    [[nodiscard]] auto entries() const -> std::vector<MountEntry> override;
    [[nodiscard]] auto dm_holders(const std::string& device_path) const
        -> std::vector<std::string> override;

private:
    std::string mounts_path_;
    std::string sys_block_path_;
};

namespace mounts {

/**
 * @brief Mount of a device, one of its partitions, or one of its dm holders
 * @param entries Parsed mount table
 * @param device_path Device node (e.g., /dev/nvme0n1)
 * @param dm_holders Holder names as returned by IMountTable::dm_holders
 */
[[nodiscard]] auto find_mount_for_device(const std::vector<MountEntry>& entries,
                                         const std::string& device_path,
                                         const std::vector<std::string>& dm_holders)
    -> std::optional<MountEntry>;

/**
 * @brief Whether @p path is the mount point of a mounted filesystem
 * @param path Absolute, normalized path
 */
[[nodiscard]] auto is_mount_point(const std::vector<MountEntry>& entries, const std::string& path)
    -> bool;

}  // namespace mounts
