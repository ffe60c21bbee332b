#include "services/TargetResolver.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <variant>

namespace fs = std::filesystem;

namespace {

auto invalid(const std::string& message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorCode::INVALID_TARGET, message});
}

}  // namespace

auto TargetResolver::resolve(const WipeRequestTarget& request) const
    -> std::expected<std::vector<WipeTarget>, util::Error> {
    if (const auto* descriptor = std::get_if<DeviceDescriptor>(&request)) {
        if (descriptor->path.empty()) {
            return invalid("Device path is empty");
        }
        // The descriptor is authoritative for the extent; the engine never probes
        return std::vector<WipeTarget>{WipeTarget{
            .path = descriptor->path,
            .length = descriptor->size_bytes,
            .kind = TargetKind::BLOCK_DEVICE,
            .root = descriptor->path,
        }};
    }
    return resolve_path(std::get<fs::path>(request));
}

auto TargetResolver::resolve_path(const fs::path& path) const
    -> std::expected<std::vector<WipeTarget>, util::Error> {
    if (path.empty()) {
        return invalid("Target path is empty");
    }

    std::error_code ec;
    auto root = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        return invalid("Cannot resolve '" + path.string() + "': " + ec.message());
    }
    if (!root.has_filename() && root.has_relative_path()) {
        root = root.parent_path();
    }

    const auto status = fs::symlink_status(root, ec);
    if (ec || !fs::exists(status)) {
        return invalid("Path does not exist: " + root.string());
    }

    if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(root, ec);
        if (ec) {
            return invalid("Cannot read size of '" + root.string() + "': " + ec.message());
        }
        return std::vector<WipeTarget>{WipeTarget{
            .path = root,
            .length = size,
            .kind = TargetKind::FILE,
            .root = root,
        }};
    }

    if (fs::is_directory(status)) {
        std::vector<WipeTarget> units;
        if (auto collected = collect_members(root, root, units); !collected) {
            return std::unexpected(collected.error());
        }
        units.push_back(WipeTarget{
            .path = root,
            .length = 0,
            .kind = TargetKind::DIRECTORY_ENTRY,
            .root = root,
        });
        LOG_DEBUG("TargetResolver", root.string() + " resolved to " +
                                        std::to_string(units.size() - 1) + " file units");
        return units;
    }

    if (fs::is_symlink(status)) {
        return invalid("Symbolic links are not wiped: " + root.string());
    }
    return invalid("Unsupported file type: " + root.string());
}

auto TargetResolver::collect_members(const fs::path& directory, const fs::path& root,
                                     std::vector<WipeTarget>& units) const
    -> std::expected<void, util::Error> {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it{directory, ec}, end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return invalid("Cannot list directory '" + directory.string() + "': " + ec.message());
    }

    std::ranges::sort(entries, {}, [](const fs::directory_entry& entry) {
        return entry.path().filename().string();
    });

    for (const auto& entry : entries) {
        const auto status = entry.symlink_status(ec);
        if (ec) {
            return invalid("Cannot stat '" + entry.path().string() + "': " + ec.message());
        }

        if (fs::is_symlink(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            if (auto nested = collect_members(entry.path(), root, units); !nested) {
                return nested;
            }
            continue;
        }
        if (!fs::is_regular_file(status)) {
            continue;
        }

        const auto size = fs::file_size(entry.path(), ec);
        if (ec) {
            return invalid("Cannot read size of '" + entry.path().string() + "': " + ec.message());
        }
        units.push_back(WipeTarget{
            .path = entry.path(),
            .length = size,
            .kind = TargetKind::DIRECTORY_MEMBER,
            .root = root,
        });
    }
    return {};
}
