#pragma once

#include "disk/command_runner.hpp"
#include "disk/disk_inventory.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piprov {

// diskutil(8) for discovery, unmounting and mounting; /dev/rdiskN for bulk writes.
class MacDiskInventory final : public DiskInventory {
public:
    struct ListedDisk {
        std::string identifier;
        bool external = false;
        bool synthesized = false;
        bool disk_image = false;
        std::vector<std::string> partitions;
    };

    using InfoMap = std::map<std::string, std::string>;

    MacDiskInventory();
    explicit MacDiskInventory(std::shared_ptr<const ICommandRunner> runner);

    const char* PlatformName() const override { return "macos"; }

    Result ListDisks(std::vector<DiskDevice>& out) override;
    Result Describe(const std::string& identifier, DiskDevice& out) override;
    Result RootDisks(std::vector<std::string>& out_identifiers) override;

    Result UnmountDisk(const DiskDevice& disk) override;
    std::string RawDevicePath(const DiskDevice& disk) const override;
    Result RescanPartitions(const std::string& device_path) override;
    Result MountPartition(const std::string& partition_identifier,
                          std::string& out_mount_point) override;

    std::string SdPathPattern() const override { return {}; }
    std::string PartitionIdentifier(const DiskDevice& disk, int index) const override;

    // `diskutil list` text -> whole disks with their partition identifiers.
    static std::vector<ListedDisk> ParseDiskutilList(std::string_view text);
    // `diskutil info` "Key: Value" lines.
    static InfoMap ParseDiskutilInfo(std::string_view text);
    static void ApplyInfo(const InfoMap& info, DiskDevice& disk);
    // Whole-disk identifiers backing "/": the container and its APFS physical store.
    static std::vector<std::string> RootDisksFromInfo(const InfoMap& root_info);

private:
    Result Info(const std::string& target, InfoMap& out) const;
    Result List(std::vector<ListedDisk>& out) const;
    Result DescribeListed(const ListedDisk& listed, DiskDevice& out) const;

    std::shared_ptr<const ICommandRunner> runner_;
};

} // namespace piprov
