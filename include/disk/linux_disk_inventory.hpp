#pragma once

#include "disk/command_runner.hpp"
#include "disk/disk_inventory.hpp"
#include "disk/mount_session.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piprov {

// lsblk(8) for discovery, umount(8) for release, BLKRRPART for rescans.
class LinuxDiskInventory final : public DiskInventory {
public:
    struct Options {
        std::string mount_base_dir = "/mnt";
        std::shared_ptr<const ICommandRunner> runner;
        std::shared_ptr<const MountSession::ISystemOps> mount_ops;
    };

    LinuxDiskInventory();
    explicit LinuxDiskInventory(Options opt);

    const char* PlatformName() const override { return "linux"; }

    Result ListDisks(std::vector<DiskDevice>& out) override;
    Result Describe(const std::string& identifier, DiskDevice& out) override;
    Result RootDisks(std::vector<std::string>& out_identifiers) override;

    Result UnmountDisk(const DiskDevice& disk) override;
    std::string RawDevicePath(const DiskDevice& disk) const override;
    Result RescanPartitions(const std::string& device_path) override;
    Result MountPartition(const std::string& partition_identifier,
                          std::string& out_mount_point) override;

    std::string SdPathPattern() const override { return "^/dev/mmcblk[0-9]+$"; }
    std::string PartitionIdentifier(const DiskDevice& disk, int index) const override;

    // Whole disks of `lsblk -J -b` output plus every disk whose tree mounts "/".
    static Result ParseLsblkJson(std::string_view json,
                                 std::vector<DiskDevice>& out_disks,
                                 std::vector<std::string>& out_root_identifiers);

private:
    Result Snapshot(std::vector<DiskDevice>& disks, std::vector<std::string>& root_identifiers);

    Options opt_;
};

} // namespace piprov
