#include "services/SafetyGuard.hpp"

#include "services/MountTable.hpp"
#include "util/Logger.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace {

auto deny(const std::string& reason) -> std::unexpected<util::Error> {
    LOG_WARNING("SafetyGuard", "Denied: " + reason);
    return std::unexpected(util::Error{util::ErrorCode::SAFETY_DENIED, reason});
}

auto quote_path(const fs::path& path) -> std::string {
    return "'" + path.string() + "'";
}

// Absolute, lexically normal, without a trailing separator
auto normalize(const fs::path& path) -> fs::path {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto normal = absolute.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

auto is_within(const fs::path& path, const fs::path& tree) -> bool {
    auto it = path.begin();
    for (const auto& element : tree) {
        if (it == path.end() || *it != element) {
            return false;
        }
        ++it;
    }
    return true;
}

auto check_writable(const fs::path& path, int mode) -> std::expected<void, util::Error> {
    if (::access(path.c_str(), mode) != 0) {
        return deny("no write permission on " + quote_path(path) + ": " + std::strerror(errno));
    }
    return {};
}

}  // namespace

SafetyGuard::SafetyGuard(SafetyPolicy policy, std::shared_ptr<const IMountTable> mount_table)
    : policy_(std::move(policy)), mount_table_(std::move(mount_table)) {}

auto SafetyGuard::is_protected(const fs::path& path) const -> bool {
    const auto same = [&path](const std::string& entry) {
        return normalize(entry) == path;
    };
    const auto under = [&path](const std::string& entry) {
        return is_within(path, normalize(entry));
    };
    return rng::any_of(policy_.protected_paths, same) ||
           rng::any_of(policy_.protected_trees, under);
}

auto SafetyGuard::authorize(const WipeTarget& target) const -> std::expected<void, util::Error> {
    if (target.kind == TargetKind::BLOCK_DEVICE) {
        return check_device(target.path.string());
    }
    return check_path(target.path, target.kind, target.root);
}

auto SafetyGuard::authorize_request(const WipeRequestTarget& request) const
    -> std::expected<void, util::Error> {
    if (const auto* descriptor = std::get_if<DeviceDescriptor>(&request)) {
        if (descriptor->path.empty()) {
            return deny("device path is empty");
        }
        if (descriptor->hosts_system) {
            return deny("device " + quote_path(descriptor->path) +
                        " hosts the running system");
        }
        if (descriptor->is_mounted) {
            return deny("device " + quote_path(descriptor->path) + " is mounted" +
                        (descriptor->mount_point.empty() ? std::string{}
                                                         : " at " + descriptor->mount_point));
        }
        return check_device(descriptor->path);
    }

    const auto& requested = std::get<fs::path>(request);
    if (requested.empty()) {
        return {};
    }

    const auto normal = normalize(requested);
    if (is_protected(normal)) {
        return deny(quote_path(normal) + " is a protected system path");
    }

    std::error_code ec;
    const auto status = fs::symlink_status(normal, ec);
    if (ec || !fs::exists(status)) {
        return {};
    }
    if (fs::is_symlink(status)) {
        return deny(quote_path(normal) + " is a symbolic link");
    }
    if (fs::is_directory(status)) {
        return check_path(normal, TargetKind::DIRECTORY_ENTRY, normal);
    }
    if (fs::is_regular_file(status)) {
        return check_path(normal, TargetKind::FILE, {});
    }
    return {};
}

auto SafetyGuard::check_path(const fs::path& path, TargetKind kind, const fs::path& root) const
    -> std::expected<void, util::Error> {
    const auto normal = normalize(path);
    if (is_protected(normal)) {
        return deny(quote_path(normal) + " is a protected system path");
    }

    std::error_code ec;
    const auto status = fs::symlink_status(normal, ec);
    if (ec || !fs::exists(status)) {
        return deny(quote_path(normal) + " does not exist");
    }
    if (fs::is_symlink(status)) {
        return deny(quote_path(normal) + " is a symbolic link");
    }

    const auto canonical = fs::canonical(normal, ec);
    if (ec) {
        return deny("cannot resolve " + quote_path(normal) + ": " + ec.message());
    }
    if (is_protected(canonical)) {
        return deny(quote_path(normal) + " resolves to protected system path " +
                    quote_path(canonical));
    }

    if ((kind == TargetKind::DIRECTORY_MEMBER || kind == TargetKind::DIRECTORY_ENTRY) &&
        !root.empty()) {
        const auto canonical_root = fs::canonical(normalize(root), ec);
        if (ec) {
            return deny("cannot resolve requested root " + quote_path(root) + ": " + ec.message());
        }
        if (!is_within(canonical, canonical_root)) {
            return deny(quote_path(normal) + " escapes requested root " +
                        quote_path(canonical_root));
        }
    }

    if (policy_.deny_mount_points && mount_table_ &&
        mounts::is_mount_point(mount_table_->entries(), canonical.string())) {
        return deny(quote_path(canonical) + " is the mount point of a mounted filesystem");
    }

    switch (kind) {
        case TargetKind::FILE:
        case TargetKind::DIRECTORY_MEMBER:
            if (!fs::is_regular_file(status)) {
                return deny(quote_path(normal) + " is not a regular file");
            }
            return check_writable(canonical, W_OK);
        case TargetKind::DIRECTORY_ENTRY:
            if (!fs::is_directory(status)) {
                return deny(quote_path(normal) + " is not a directory");
            }
            if (auto writable = check_writable(canonical, W_OK | X_OK); !writable) {
                return writable;
            }
            // Removing the directory needs write access to its parent
            return check_writable(canonical.parent_path(), W_OK | X_OK);
        case TargetKind::BLOCK_DEVICE:
            break;
    }
    return check_device(normal.string());
}

auto SafetyGuard::check_device(const std::string& device_path) const
    -> std::expected<void, util::Error> {
    const auto normal = normalize(device_path);
    if (is_protected(normal)) {
        return deny(quote_path(normal) + " is a protected system path");
    }

    // /dev/disk/by-id style names are links to the real node
    std::error_code ec;
    const auto node = fs::canonical(normal, ec);
    if (ec) {
        return deny("cannot resolve device " + quote_path(normal) + ": " + ec.message());
    }

    struct stat st{};
    if (::stat(node.c_str(), &st) != 0) {
        return deny("failed to stat device " + quote_path(node) + ": " + std::strerror(errno));
    }
    if (!S_ISBLK(st.st_mode)) {
        return deny(quote_path(node) + " is not a block device");
    }

    if (mount_table_) {
        const auto holders = mount_table_->dm_holders(node.string());
        if (auto mount =
                mounts::find_mount_for_device(mount_table_->entries(), node.string(), holders)) {
            return deny("device " + quote_path(node) + " is mounted (" + mount->device + " on " +
                        mount->mount_point + ")");
        }
    }

    return check_writable(node, W_OK);
}
