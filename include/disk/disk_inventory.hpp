#pragma once

#include "disk/disk_device.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace piprov {

// Platform view of attached storage. One implementation per OS, picked once at startup.
class DiskInventory {
public:
    virtual ~DiskInventory() = default;

    virtual const char* PlatformName() const = 0;

    // Whole disks, the root-filesystem disk excluded.
    virtual Result ListDisks(std::vector<DiskDevice>& out) = 0;
    // Fresh, authoritative description; DiskNotFound when the identifier is unknown.
    virtual Result Describe(const std::string& identifier, DiskDevice& out) = 0;
    // Every whole disk backing "/". More than one for RAID, LVM, btrfs or an APFS container.
    virtual Result RootDisks(std::vector<std::string>& out_identifiers) = 0;

    virtual Result UnmountDisk(const DiskDevice& disk) = 0;
    // Unbuffered handle for bulk writes; the block path where the OS has no such thing.
    virtual std::string RawDevicePath(const DiskDevice& disk) const = 0;
    virtual Result RescanPartitions(const std::string& device_path) = 0;
    // Mounts `partition_identifier` somewhere the invoking user can read it.
    virtual Result MountPartition(const std::string& partition_identifier,
                                  std::string& out_mount_point) = 0;

    // Regex of whole-disk paths that are SD slots by naming convention; empty when none.
    virtual std::string SdPathPattern() const = 0;
    // Partition `index` (1-based) of `disk` by the platform naming convention.
    virtual std::string PartitionIdentifier(const DiskDevice& disk, int index) const = 0;

    virtual bool IsBlockDevice(const std::string& path) const;

    // RootDisks() membership test on a normalised identifier.
    Result IsRootDisk(const std::string& identifier, bool& out_is_root);

    // Accepts "sdb", "/dev/sdb", "disk4", "/dev/disk4", "/dev/rdisk4".
    virtual std::string NormalizeIdentifier(const std::string& name_or_path) const;
};

// `mount_base_dir` is where manual mounts are created on platforms that need one.
std::unique_ptr<DiskInventory> CreatePlatformDiskInventory(const std::string& mount_base_dir);

} // namespace piprov
