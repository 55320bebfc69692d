#include "disk/disk_inventory.hpp"

#if defined(__APPLE__)
#include "disk/mac_disk_inventory.hpp"
#else
#include "disk/linux_disk_inventory.hpp"
#endif

namespace piprov {

std::unique_ptr<DiskInventory> CreatePlatformDiskInventory(const std::string& mount_base_dir) {
#if defined(__APPLE__)
    (void)mount_base_dir;
    return std::make_unique<MacDiskInventory>();
#else
    LinuxDiskInventory::Options opt;
    opt.mount_base_dir = mount_base_dir;
    return std::make_unique<LinuxDiskInventory>(std::move(opt));
#endif
}

} // namespace piprov
