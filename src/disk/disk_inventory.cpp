#include "disk/disk_inventory.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <sys/stat.h>

namespace piprov {

bool DiskInventory::IsBlockDevice(const std::string& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISBLK(st.st_mode);
}

Result DiskInventory::IsRootDisk(const std::string& identifier, bool& out_is_root) {
    out_is_root = false;
    std::vector<std::string> roots;
    auto r = RootDisks(roots);
    if (!r.ok) return r;
    const std::string id = NormalizeIdentifier(identifier);
    out_is_root = std::find(roots.begin(), roots.end(), id) != roots.end();
    return Result::Ok();
}

std::string DiskInventory::NormalizeIdentifier(const std::string& name_or_path) const {
    std::string id = LastPathComponent(name_or_path);
    if (id.rfind("rdisk", 0) == 0) id.erase(0, 1);
    return id;
}

} // namespace piprov
