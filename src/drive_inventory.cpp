/**
 * @file drive_inventory.cpp
 * @brief Pool member discovery implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "drive_inventory.hpp"
#include "balancer_filesystem.hpp"
#include "balancer_logger.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <set>
#include <sstream>
#include <glob.h>
#include <sys/statvfs.h>
#include <sys/xattr.h>

namespace poolbalancer {

namespace {

constexpr const char* CONTROL_FILE = ".mergerfs";
constexpr const char* XATTR_VERSION = "user.mergerfs.version";
constexpr const char* XATTR_SRCMOUNTS = "user.mergerfs.srcmounts";

std::vector<std::string> splitMounts(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ':')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool hasGlobChars(const std::string& path) {
    return path.find_first_of("*?[") != std::string::npos;
}

std::optional<std::string> resolvePath(const std::string& path) {
    char buf[PATH_MAX];
    if (::realpath(path.c_str(), buf) == nullptr) return std::nullopt;
    return std::string(buf);
}

std::optional<std::string> findControlFile(const std::string& start) {
    fs::Path current(start);
    while (!current.empty() && current != current.root_path()) {
        fs::Path candidate = current / CONTROL_FILE;
        std::error_code ec;
        if (fs::stdfs::exists(fs::stdfs::symlink_status(candidate, ec))) {
            return candidate.string();
        }
        current = current.parent_path();
    }
    return std::nullopt;
}

} // namespace

std::string normalizeDrivePath(const std::string& path) {
    std::string out = path;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

Result<std::optional<std::string>> readXattr(const std::string& path, const std::string& name) {
    std::vector<char> buffer(64);
    while (true) {
        ssize_t len = ::lgetxattr(path.c_str(), name.c_str(), buffer.data(), buffer.size());
        if (len >= 0) {
            return std::optional<std::string>(std::string(buffer.data(), static_cast<size_t>(len)));
        }
        int err = errno;
        if (err == ERANGE) {
            buffer.resize(buffer.size() * 2);
            continue;
        }
        if (err == ENODATA) return std::optional<std::string>{};
        return Err<std::optional<std::string>>(ErrorCode::IO_ERROR,
            "lgetxattr(" + path + ", " + name + "): " + std::strerror(err));
    }
}

Result<DriveUsage> statvfsUsage(const std::string& path) {
    struct statvfs st{};
    if (::statvfs(path.c_str(), &st) != 0) {
        return Err<DriveUsage>(ErrorCode::DRIVE_UNAVAILABLE,
                               "statvfs(" + path + "): " + std::strerror(errno));
    }
    DriveUsage usage;
    uint64_t frsize = st.f_frsize ? st.f_frsize : st.f_bsize;
    usage.total_bytes = static_cast<uint64_t>(st.f_blocks) * frsize;
    usage.used_bytes = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * frsize;
    usage.free_bytes = static_cast<uint64_t>(st.f_bavail) * frsize;
    return usage;
}

std::vector<std::string> expandGlobPaths(const std::vector<std::string>& paths) {
    std::vector<std::string> expanded;
    for (const auto& path : paths) {
        if (!hasGlobChars(path)) {
            expanded.push_back(normalizeDrivePath(path));
            continue;
        }
        glob_t g{};
        int rc = ::glob(path.c_str(), GLOB_ONLYDIR, nullptr, &g);
        if (rc == 0) {
            for (size_t i = 0; i < g.gl_pathc; ++i) {
                std::string match = g.gl_pathv[i];
                if (fs::isDirectory(match)) expanded.push_back(normalizeDrivePath(match));
            }
        } else if (rc != GLOB_NOMATCH) {
            PB_LOG_WARNING("DriveInventory", "glob failed for pattern: " + path);
        }
        ::globfree(&g);
    }
    return expanded;
}

Result<PoolMembership> MergerfsProbe::listMembers(const std::string& pool_path) {
    auto resolved = resolvePath(pool_path);
    if (!resolved) {
        return Err<PoolMembership>(ErrorCode::DISCOVERY_FAILED,
                                   "Cannot resolve pool path: " + pool_path);
    }

    auto ctrl = findControlFile(*resolved);
    if (!ctrl) {
        return Err<PoolMembership>(ErrorCode::DISCOVERY_FAILED,
                                   "Could not find .mergerfs control file for: " + *resolved);
    }

    if (auto version = readXattr(*ctrl, XATTR_VERSION); !version) {
        return Err<PoolMembership>(ErrorCode::DISCOVERY_FAILED,
                                   *resolved + " is not a mergerfs mount: " + version.error().message);
    }

    auto srcmounts = readXattr(*ctrl, XATTR_SRCMOUNTS);
    if (!srcmounts) {
        return Err<PoolMembership>(ErrorCode::DISCOVERY_FAILED, srcmounts.error().message);
    }
    if (!srcmounts.value() || srcmounts.value()->empty()) {
        return Err<PoolMembership>(ErrorCode::DISCOVERY_FAILED,
                                   "Could not read srcmounts from: " + *ctrl);
    }

    PoolMembership membership;
    membership.members = expandGlobPaths(splitMounts(*srcmounts.value()));

    fs::Path root = fs::Path(*ctrl).parent_path();
    auto rel = fs::Path(*resolved).lexically_relative(root);
    if (!rel.empty() && rel != "." && *rel.begin() != "..") {
        membership.subpath = rel.string();
    }
    PB_LOG_DEBUG("MergerfsProbe", "Control file " + *ctrl + " lists " +
                 std::to_string(membership.members.size()) + " members");
    return membership;
}

Result<DriveUsage> MergerfsProbe::queryUsage(const std::string& drive_path) {
    return statvfsUsage(drive_path);
}

Result<PoolMembership> DirectoryListProbe::listMembers(const std::string& /*pool_path*/) {
    PoolMembership membership;
    membership.members = expandGlobPaths(members_);
    return membership;
}

Result<DriveUsage> DirectoryListProbe::queryUsage(const std::string& drive_path) {
    if (!fs::isDirectory(drive_path)) {
        return Err<DriveUsage>(ErrorCode::DRIVE_UNAVAILABLE, "Not a directory: " + drive_path);
    }
    return statvfsUsage(drive_path);
}

std::string Inventory::walkPath(const Drive& drive) const {
    if (subpath.empty()) return drive.path;
    return (fs::Path(drive.path) / subpath).string();
}

Result<Inventory> DriveInventory::discover(const std::string& pool_path, uint32_t iteration) {
    auto membership = probe_.listMembers(pool_path);
    if (!membership) {
        return Err<Inventory>(ErrorCode::DISCOVERY_FAILED, membership.error().message);
    }
    if (membership->members.empty()) {
        return Err<Inventory>(ErrorCode::DISCOVERY_FAILED,
                              "Could not discover drives for mount point: " + pool_path);
    }

    std::set<std::string> sources, dests;
    for (const auto& p : expandGlobPaths(source_drives_)) sources.insert(p);
    for (const auto& p : expandGlobPaths(dest_drives_)) dests.insert(p);

    Inventory inventory;
    inventory.subpath = membership->subpath;
    std::set<std::string> seen;

    for (const auto& member : membership->members) {
        std::string path = normalizeDrivePath(member);
        if (!seen.insert(path).second) continue;

        Drive drive;
        drive.path = path;
        drive.allowed_source = source_drives_.empty() || sources.count(path) != 0;
        drive.allowed_destination = dest_drives_.empty() || dests.count(path) != 0;

        auto usage = probe_.queryUsage(path);
        if (!usage) {
            PB_LOG_WARNING("DriveInventory", "Drive unavailable, skipping: " + path +
                           " (" + usage.error().message + ")");
            if (bus_) {
                BalanceEvent ev;
                ev.type = EventType::DRIVE_UNAVAILABLE;
                ev.iteration = iteration;
                ev.drive = drive;
                ev.message = usage.error().message;
                bus_->publish(ev);
            }
            continue;
        }
        drive.total_bytes = usage->total_bytes;
        drive.used_bytes = usage->used_bytes;
        drive.free_bytes = usage->free_bytes;
        inventory.drives.push_back(std::move(drive));
    }

    if (inventory.drives.empty()) {
        return Err<Inventory>(ErrorCode::DISCOVERY_FAILED,
                              "No pool member of " + pool_path + " is readable");
    }
    return inventory;
}

} // namespace poolbalancer
