/**
 * @file drive_inventory.hpp
 * @brief Pool member discovery and per-drive capacity
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * DriveInventory asks a PoolProbe for the member drives of a pool and their
 * usage, applies the source/destination restriction lists, and returns a
 * fresh snapshot every time it is called. It never writes to any drive.
 */
#ifndef POOLBALANCER_DRIVE_INVENTORY_HPP
#define POOLBALANCER_DRIVE_INVENTORY_HPP

#include "balancer_types.hpp"
#include "balancer_events.hpp"
#include "result.hpp"
#include <string>
#include <vector>

namespace poolbalancer {

struct DriveUsage {
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
};

/**
 * @struct PoolMembership
 * @brief Member drive roots plus the path below the pool root being balanced
 */
struct PoolMembership {
    std::vector<std::string> members;
    std::string subpath;
};

/**
 * @class PoolProbe
 * @brief Source of pool membership and drive usage
 */
class PoolProbe {
public:
    virtual ~PoolProbe() = default;
    virtual Result<PoolMembership> listMembers(const std::string& pool_path) = 0;
    virtual Result<DriveUsage> queryUsage(const std::string& drive_path) = 0;
};

/**
 * @class MergerfsProbe
 * @brief Reads membership from the mergerfs control file xattrs
 *
 * Walks up from the resolved pool path to the first ".mergerfs" control
 * file, checks it answers user.mergerfs.version and splits
 * user.mergerfs.srcmounts on ':'. Glob members are expanded.
 */
class MergerfsProbe : public PoolProbe {
public:
    Result<PoolMembership> listMembers(const std::string& pool_path) override;
    Result<DriveUsage> queryUsage(const std::string& drive_path) override;
};

/**
 * @class DirectoryListProbe
 * @brief Treats an explicit list of directories as the pool
 */
class DirectoryListProbe : public PoolProbe {
public:
    explicit DirectoryListProbe(std::vector<std::string> members) : members_(std::move(members)) {}
    Result<PoolMembership> listMembers(const std::string& pool_path) override;
    Result<DriveUsage> queryUsage(const std::string& drive_path) override;

private:
    std::vector<std::string> members_;
};

/**
 * @brief Filesystem usage of the filesystem holding @p path
 *
 * total = blocks * frsize, used = (blocks - bfree) * frsize,
 * free = bavail * frsize.
 */
[[nodiscard]] Result<DriveUsage> statvfsUsage(const std::string& path);

/**
 * @brief Read an extended attribute without following symlinks
 * @return Value, empty optional when the attribute is absent, or IO_ERROR
 */
[[nodiscard]] Result<std::optional<std::string>> readXattr(const std::string& path,
                                                           const std::string& name);

/**
 * @brief Expand entries containing *, ? or [ to the matching directories
 *
 * Literal entries pass through unchanged. Matches are sorted.
 */
[[nodiscard]] std::vector<std::string> expandGlobPaths(const std::vector<std::string>& paths);

/**
 * @brief Strip trailing slashes (the root "/" stays)
 */
[[nodiscard]] std::string normalizeDrivePath(const std::string& path);

/**
 * @struct Inventory
 * @brief One discovery snapshot
 */
struct Inventory {
    std::vector<Drive> drives;
    std::string subpath;

    /// Directory to enumerate on a drive: its root joined with the subpath
    [[nodiscard]] std::string walkPath(const Drive& drive) const;
};

class DriveInventory {
public:
    DriveInventory(PoolProbe& probe, EventBus* bus = nullptr) : probe_(probe), bus_(bus) {}

    /**
     * @brief Restrict roles; empty lists allow every member
     */
    void setRestrictions(std::vector<std::string> source_drives,
                         std::vector<std::string> dest_drives) {
        source_drives_ = std::move(source_drives);
        dest_drives_ = std::move(dest_drives);
    }

    /**
     * @brief Discover members and their usage
     *
     * Members whose usage cannot be read are dropped with a warning.
     * Fails with DISCOVERY_FAILED when membership cannot be read or no
     * member remains.
     */
    [[nodiscard]] Result<Inventory> discover(const std::string& pool_path, uint32_t iteration = 0);

private:
    PoolProbe& probe_;
    EventBus* bus_;
    std::vector<std::string> source_drives_;
    std::vector<std::string> dest_drives_;
};

} // namespace poolbalancer
#endif
