/**
 * @file transfersafety.cpp
 * @brief Implementation of the checks that guard copy/move requests
 *
 * A request is refused when it would copy or move something onto or into
 * itself, when it would move a directory the system depends on, or when a
 * source lives on a kernel virtual filesystem. Removable media only yields
 * a warning.
 */

#include "transfersafety.hpp"
#include "pathutils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/vfs.h>

namespace fs = std::filesystem;

/**
 * @brief Directories that must never be moved away
 */
const std::unordered_set<std::string> TransferSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp", "/home"
};

/**
 * @brief Checks a whole request
 *
 * Sources are checked in order; the first blocking status is returned with
 * the offending source. A removable-media warning on the destination is
 * only reported when nothing blocks.
 *
 * @param sources Paths to transfer
 * @param destination Directory receiving them
 * @param mode Copy or move
 *
 * @return TransferCheck with status and the path it concerns
 */
TransferSafety::TransferCheck TransferSafety::checkTransfer(
        const std::vector<std::string>& sources,
        const std::string& destination,
        TransferMode mode) {
    for (const auto& source : sources) {
        TransferStatus status = checkSource(source, destination, mode);
        if (status != TransferStatus::Allowed) {
            return {status, source};
        }
    }

    if (isRemovableMedia(resolvePath(destination))) {
        return {TransferStatus::WarningRemovableMedia, destination};
    }

    return {TransferStatus::Allowed, ""};
}

/**
 * @brief Checks one source against the destination
 *
 * Checks in order of severity:
 * 1. Source vanished
 * 2. Destination is the source, or the item would land on itself
 *    (destination is the source's own parent)
 * 3. Destination lies inside the source
 * 4. Source on a virtual filesystem
 * 5. For moves: system paths, home directory, mount points
 *
 * Paths are compared after resolving symlinks so a link into the source
 * cannot sneak past the self-transfer check.
 */
TransferSafety::TransferStatus TransferSafety::checkSource(
        const std::string& source,
        const std::string& destination,
        TransferMode mode) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(source, ec))) {
        return TransferStatus::SourceMissing;
    }

    const std::string src = resolvePath(source);
    const std::string dst = resolvePath(destination);

    if (src == dst || resolvePath(itemTarget(source, destination)) == src) {
        return TransferStatus::TargetIsSource;
    }

    if (isSameOrDescendant(fs::path(dst), fs::path(src))) {
        return TransferStatus::TargetInsideSource;
    }

    if (isVirtualFilesystem(src)) {
        return TransferStatus::BlockedVirtualFS;
    }

    if (mode == TransferMode::Move) {
        if (isSystemPath(src)) {
            return TransferStatus::BlockedSystemPath;
        }
        if (isUserHome(src)) {
            return TransferStatus::BlockedHome;
        }
        if (isMountPoint(src)) {
            return TransferStatus::BlockedMountPoint;
        }
    }

    return TransferStatus::Allowed;
}

std::string TransferSafety::itemTarget(const std::string& source,
                                       const std::string& destination) {
    fs::path name = fs::path(normalizePath(source)).filename();
    return normalizePath(fs::path(destination) / name);
}

/**
 * @brief Converts a status to a human-readable message
 *
 * @param status The status to convert
 * @param path The path the status concerns (included in the message)
 */
std::string TransferSafety::getStatusMessage(TransferStatus status, const std::string& path) {
    switch (status) {
        case TransferStatus::Allowed:
            return "Transfer allowed";
        case TransferStatus::SourceMissing:
            return "Source no longer exists: " + path;
        case TransferStatus::TargetIsSource:
            return "Destination is the source itself: " + path;
        case TransferStatus::TargetInsideSource:
            return "Destination lies inside the source: " + path;
        case TransferStatus::BlockedSystemPath:
            return "Cannot move system directory: " + path;
        case TransferStatus::BlockedHome:
            return "Cannot move your home directory: " + path;
        case TransferStatus::BlockedMountPoint:
            return "Cannot move mount point: " + path;
        case TransferStatus::BlockedVirtualFS:
            return "Cannot transfer from virtual/system filesystem: " + path;
        case TransferStatus::WarningRemovableMedia:
            return "Destination is on removable media: " + path;
        default:
            return "Unknown status";
    }
}

bool TransferSafety::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

/**
 * @brief Checks if a path is the user's home directory
 *
 * @note Returns false if the HOME environment variable is not set
 */
bool TransferSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && path == normalizePath(home);
}

bool TransferSafety::isMountPoint(const std::string& path) {
    auto mounts = getMountPoints();

    for (const auto& mount : mounts) {
        if (mount.mountpoint == path) {
            return true;
        }
    }

    return false;
}

/**
 * @brief Checks if a path resides on a kernel virtual filesystem
 *
 * Uses statfs() and compares the filesystem magic against procfs, sysfs,
 * devpts, securityfs and the cgroup filesystems. Memory-backed filesystems
 * such as tmpfs hold real files and are allowed.
 *
 * @param path The filesystem path to check
 *
 * @return true if the path is on a virtual filesystem or if statfs() fails
 *
 * @note Returns true on error (fail-safe behavior)
 */
bool TransferSafety::isVirtualFilesystem(const std::string& path) {
    struct statfs fs_info;

    if (statfs(path.c_str(), &fs_info) != 0) {
        return true;  // On error, assume virtual
    }

    // See: /usr/include/linux/magic.h
    const long VIRTUAL_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC (procfs)
        0x62656572,   // SYSFS_MAGIC (sysfs)
        0x1cd1,       // DEVPTS_SUPER_MAGIC (devpts)
        0x73636673,   // SECURITYFS_MAGIC (securityfs)
        0x27e0eb,     // CGROUP_SUPER_MAGIC (cgroup)
        0x63677270,   // CGROUP2_SUPER_MAGIC (cgroup2)
    };

    for (auto magic : VIRTUAL_FS) {
        if (static_cast<long>(fs_info.f_type) == magic) {
            return true;
        }
    }

    return false;
}

/**
 * @brief Checks if a path is on removable media
 *
 * Finds the mount the path lives on (the longest matching mount point) and
 * reports removable if that mount point is under /media, /mnt or /run/media,
 * or if its /dev/sdX device carries the removable flag in sysfs.
 */
bool TransferSafety::isRemovableMedia(const std::string& path) {
    auto mounts = getMountPoints();

    const MountInfo* best = nullptr;
    for (const auto& mount : mounts) {
        if (isSameOrDescendant(fs::path(path), fs::path(mount.mountpoint))) {
            if (!best || mount.mountpoint.size() > best->mountpoint.size()) {
                best = &mount;
            }
        }
    }

    if (!best) {
        return false;
    }
    if (best->is_removable) {
        return true;
    }

    if (best->device.find("/dev/sd") == 0 && best->device.size() >= 8) {
        // e.g. /dev/sda1 → /sys/block/sda/removable
        std::string device_name = best->device.substr(5, 3);
        std::ifstream removable_file("/sys/block/" + device_name + "/removable");
        int removable = 0;
        if (removable_file >> removable && removable == 1) {
            return true;
        }
    }

    return false;
}

/**
 * @brief Retrieves information about all currently mounted filesystems
 *
 * Parses /proc/mounts. Mount points under /media, /mnt or /run/media are
 * flagged as removable.
 *
 * @return Mounts, or an empty vector if /proc/mounts cannot be opened
 */
std::vector<TransferSafety::MountInfo> TransferSafety::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return mounts;
    }

    std::string line;
    while (std::getline(mounts_file, line)) {
        std::istringstream iss(line);
        MountInfo info;
        std::string options, dump, pass;

        iss >> info.device >> info.mountpoint >> info.fstype >> options >> dump >> pass;
        if (info.mountpoint.empty()) {
            continue;
        }

        info.is_root = (info.mountpoint == "/");
        info.is_removable = (info.mountpoint.find("/media") == 0 ||
                             info.mountpoint.find("/mnt") == 0 ||
                             info.mountpoint.find("/run/media") == 0);

        mounts.push_back(info);
    }

    return mounts;
}
