#ifndef TRANSFERSAFETY_HPP
#define TRANSFERSAFETY_HPP

#include <string>
#include <unordered_set>
#include <vector>

#include "transfertypes.hpp"

/**
 * @brief Safety checks run before a copy/move job is launched
 */
class TransferSafety {
public:
    enum class TransferStatus {
        Allowed,
        SourceMissing,
        TargetIsSource,
        TargetInsideSource,
        BlockedSystemPath,
        BlockedHome,
        BlockedMountPoint,
        BlockedVirtualFS,
        WarningRemovableMedia
    };

    /**
     * @brief Result of a check: the status and the path it concerns
     */
    struct TransferCheck {
        TransferStatus status = TransferStatus::Allowed;
        std::string path;

        bool blocked() const {
            return status != TransferStatus::Allowed &&
                   status != TransferStatus::WarningRemovableMedia;
        }
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
        bool is_removable;
        bool is_root;
    };

    /**
     * @brief Check a whole request; the first blocking finding wins
     * @param sources Paths to transfer
     * @param destination Directory receiving them
     * @param mode Copy or move (moves are checked more strictly)
     */
    static TransferCheck checkTransfer(const std::vector<std::string>& sources,
                                       const std::string& destination,
                                       TransferMode mode);

    /**
     * @brief Check one source against the destination
     */
    static TransferStatus checkSource(const std::string& source,
                                      const std::string& destination,
                                      TransferMode mode);

    /**
     * @brief Where a source ends up: destination/basename(source)
     */
    static std::string itemTarget(const std::string& source,
                                  const std::string& destination);

    /**
     * @brief Get human-readable message for a check result
     */
    static std::string getStatusMessage(TransferStatus status, const std::string& path);

    /**
     * @brief Check if path is a system directory
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief Check if path is user's home directory
     */
    static bool isUserHome(const std::string& path);

    /**
     * @brief Check if path is a mount point
     */
    static bool isMountPoint(const std::string& path);

    /**
     * @brief Check if path is on a kernel virtual filesystem (procfs, sysfs...)
     */
    static bool isVirtualFilesystem(const std::string& path);

    /**
     * @brief Check if path is on removable media (USB, etc.)
     */
    static bool isRemovableMedia(const std::string& path);

    /**
     * @brief Get all mount points from /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // TRANSFERSAFETY_HPP
