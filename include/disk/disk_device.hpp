#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace piprov {

inline constexpr std::uint64_t kGiB = 1024ull * 1024 * 1024;
inline constexpr std::uint64_t kMinTargetBytes = 1 * kGiB;
inline constexpr std::uint64_t kMaxTargetBytes = 512 * kGiB;

enum class Removable {
    Yes,
    No,
    Unknown,
};

const char* RemovableName(Removable r);

struct PartitionInfo {
    std::string identifier; // "sdb1", "mmcblk0p1", "disk4s1"
    std::string label;
    std::string fs_type;
    std::string mount_point;
};

struct DiskDevice {
    std::string identifier;  // "sdb", "mmcblk0", "disk4"
    std::string path;        // "/dev/sdb"
    std::uint64_t size_bytes = 0;
    Removable removable = Removable::Unknown;
    bool builtin_card_reader = false;
    bool whole_disk = true;
    std::string protocol;    // "USB", "Secure Digital", "Disk Image", "loop"
    std::string transport;   // "usb", "mmc", "sata", "nvme", "external", "internal"
    std::string model;
    std::string vendor;
    std::string serial;
    std::vector<std::string> mount_points;
    std::vector<PartitionInfo> partitions;

    bool IsVirtual() const;
    // "<vendor> <model>", or the identifier when neither is known.
    std::string DisplayName() const;
};

// Label/mount point convention of a Raspberry Pi OS boot partition.
bool IsBootPartitionName(std::string_view label_or_mount);
bool LooksPreviouslyProvisioned(const DiskDevice& disk);

} // namespace piprov
