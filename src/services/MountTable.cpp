#include "services/MountTable.hpp"

#include <mntent.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace {

auto is_partition_suffix(std::string_view suffix) noexcept -> bool {
    if (suffix.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(suffix.front());
    return std::isdigit(first) || suffix.front() == 'p';
}

}  // namespace

MountTable::MountTable(std::string mounts_path, std::string sys_block_path)
    : mounts_path_(std::move(mounts_path)), sys_block_path_(std::move(sys_block_path)) {}

auto MountTable::entries() const -> std::vector<MountEntry> {
    std::vector<MountEntry> result;

    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };

    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{::setmntent(mounts_path_.c_str(), "r"),
                                                       mtab_deleter};
    if (!mtab) {
        return result;
    }

    while (auto* entry = ::getmntent(mtab.get())) {
        result.push_back(MountEntry{
            .device = entry->mnt_fsname,
            .mount_point = entry->mnt_dir,
            .filesystem = entry->mnt_type,
        });
    }

    return result;
}

auto MountTable::dm_holders(const std::string& device_path) const -> std::vector<std::string> {
    std::vector<std::string> holders;
    const auto device_name = fs::path{device_path}.filename().string();
    if (device_name.empty()) {
        return holders;
    }

    auto collect_from_path = [&holders](const fs::path& holders_path) {
        std::error_code ec;
        if (!fs::exists(holders_path, ec)) {
            return;
        }
        for (const auto& holder : fs::directory_iterator{holders_path, ec}) {
            const auto holder_name = holder.path().filename().string();
            if (holder_name.starts_with("dm-")) {
                holders.push_back(holder_name);
            }
        }
    };

    const fs::path device_sys = fs::path{sys_block_path_} / device_name;
    collect_from_path(device_sys / "holders");

    // Partitions appear as subdirectories (e.g., sda/sda1/holders)
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator{device_sys, ec}) {
        const auto part_name = entry.path().filename().string();
        if (part_name.starts_with(device_name) && part_name != device_name) {
            collect_from_path(entry.path() / "holders");
        }
    }

    return holders;
}

namespace mounts {

auto find_mount_for_device(const std::vector<MountEntry>& entries, const std::string& device_path,
                           const std::vector<std::string>& dm_holders)
    -> std::optional<MountEntry> {
    for (const auto& entry : entries) {
        if (entry.device == device_path ||
            (entry.device.starts_with(device_path) &&
             is_partition_suffix(std::string_view{entry.device}.substr(device_path.size())))) {
            return entry;
        }
    }

    for (const auto& dm_name : dm_holders) {
        const auto dm_path = "/dev/" + dm_name;
        for (const auto& entry : entries) {
            if (entry.device == dm_path) {
                return entry;
            }
        }
    }

    // /dev/mapper/* names are symlinks to the dm-N node
    if (!dm_holders.empty()) {
        for (const auto& entry : entries) {
            if (entry.device.starts_with("/dev/mapper/")) {
                std::error_code ec;
                const auto real_path = fs::read_symlink(entry.device, ec);
                if (!ec) {
                    const auto resolved_dm_name = real_path.filename().string();
                    if (rng::find(dm_holders, resolved_dm_name) != dm_holders.end()) {
                        return entry;
                    }
                }
            }
        }
    }

    return std::nullopt;
}

auto is_mount_point(const std::vector<MountEntry>& entries, const std::string& path) -> bool {
    const auto normalized = fs::path{path}.lexically_normal();
    return rng::any_of(entries, [&normalized](const MountEntry& entry) {
        return fs::path{entry.mount_point}.lexically_normal() == normalized;
    });
}

}  // namespace mounts
