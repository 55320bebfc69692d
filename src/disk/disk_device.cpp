#include "disk/disk_device.hpp"

#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

namespace piprov {

const char* RemovableName(Removable r) {
    switch (r) {
    case Removable::Yes:
        return "yes";
    case Removable::No:
        return "no";
    case Removable::Unknown:
        return "unknown";
    }
    return "unknown";
}

bool DiskDevice::IsVirtual() const {
    const std::string p = ToLower(protocol);
    return p == "virtual" || p == "disk image" || p == "loop" || p == "ram" || p == "zram" ||
           p == "nbd";
}

std::string DiskDevice::DisplayName() const {
    std::string name = Trim(vendor);
    const std::string m = Trim(model);
    if (!m.empty()) {
        if (!name.empty()) name += ' ';
        name += m;
    }
    return name.empty() ? identifier : name;
}

bool IsBootPartitionName(std::string_view label_or_mount) {
    const std::string leaf = ToLower(LastPathComponent(label_or_mount));
    return leaf == "boot" || leaf == "bootfs";
}

bool LooksPreviouslyProvisioned(const DiskDevice& disk) {
    for (const auto& p : disk.partitions) {
        if (IsBootPartitionName(p.label)) return true;
        if (!p.mount_point.empty() && IsBootPartitionName(p.mount_point)) return true;
    }
    return false;
}

} // namespace piprov
