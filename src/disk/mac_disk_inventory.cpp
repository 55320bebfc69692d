#include "disk/mac_disk_inventory.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <regex>

namespace piprov {

namespace {

// "disk4s1" -> "disk4"
std::string WholeDiskOf(std::string_view id) {
    static const std::regex kWhole(R"(^(disk[0-9]+))");
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(id.begin(), id.end(), m, kWhole)) return m[1].str();
    return std::string(id);
}

std::string Get(const MacDiskInventory::InfoMap& info, const char* key) {
    auto it = info.find(key);
    return it == info.end() ? std::string{} : it->second;
}

// "31.9 GB (31914983424 Bytes) (exactly ...)" -> 31914983424
std::uint64_t ParseByteCount(std::string_view text) {
    static const std::regex kBytes(R"(\(([0-9]+) Bytes\))");
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(text.begin(), text.end(), m, kBytes)) {
        return std::strtoull(m[1].str().c_str(), nullptr, 10);
    }
    return 0;
}

} // namespace

MacDiskInventory::MacDiskInventory() : MacDiskInventory(nullptr) {}

MacDiskInventory::MacDiskInventory(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>()) {}

std::vector<MacDiskInventory::ListedDisk> MacDiskInventory::ParseDiskutilList(std::string_view text) {
    static const std::regex kHeader(R"(^/dev/(disk[0-9]+)\s*\(([^)]*)\):?)");
    static const std::regex kRow(R"(^\s*[0-9]+:.*\s(disk[0-9]+s[0-9]+)\s*$)");

    std::vector<ListedDisk> disks;
    for (const auto& line : SplitLines(text)) {
        std::smatch m;
        if (std::regex_search(line, m, kHeader)) {
            ListedDisk d;
            d.identifier = m[1].str();
            const std::string attrs = ToLower(m[2].str());
            d.external = attrs.find("external") != std::string::npos;
            d.synthesized = attrs.find("synthesized") != std::string::npos;
            d.disk_image = attrs.find("disk image") != std::string::npos;
            disks.push_back(std::move(d));
            continue;
        }
        if (!disks.empty() && std::regex_search(line, m, kRow)) {
            disks.back().partitions.push_back(m[1].str());
        }
    }
    return disks;
}

MacDiskInventory::InfoMap MacDiskInventory::ParseDiskutilInfo(std::string_view text) {
    InfoMap info;
    for (const auto& line : SplitLines(text)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = Trim(std::string_view(line).substr(0, colon));
        std::string value = Trim(std::string_view(line).substr(colon + 1));
        if (key.empty()) continue;
        info.emplace(std::move(key), std::move(value));
    }
    return info;
}

void MacDiskInventory::ApplyInfo(const InfoMap& info, DiskDevice& disk) {
    const std::string id = Get(info, "Device Identifier");
    if (!id.empty()) disk.identifier = id;
    const std::string node = Get(info, "Device Node");
    disk.path = node.empty() ? "/dev/" + disk.identifier : node;

    std::uint64_t size = ParseByteCount(Get(info, "Disk Size"));
    if (size == 0) size = ParseByteCount(Get(info, "Total Size"));
    disk.size_bytes = size;

    disk.protocol = Get(info, "Protocol");
    if (ToLower(Get(info, "Virtual")) == "yes" && disk.protocol.empty()) disk.protocol = "virtual";
    disk.model = Get(info, "Device / Media Name");
    disk.whole_disk = ToLower(Get(info, "Whole")) != "no";

    const std::string location = ToLower(Get(info, "Device Location"));
    if (!location.empty()) disk.transport = location;

    const std::string removable = ToLower(Get(info, "Removable Media"));
    if (removable == "removable" || removable == "yes") {
        disk.removable = Removable::Yes;
    } else if (removable == "fixed" || removable == "no") {
        disk.removable = Removable::No;
    } else {
        disk.removable = Removable::Unknown;
    }

    disk.builtin_card_reader =
        location == "internal" && ContainsIgnoreCase(disk.protocol, "secure digital");
}

std::vector<std::string> MacDiskInventory::RootDisksFromInfo(const InfoMap& root_info) {
    std::vector<std::string> out;
    const std::string whole = Get(root_info, "Part of Whole");
    if (!whole.empty()) out.push_back(WholeDiskOf(whole));
    const std::string store = Get(root_info, "APFS Physical Store");
    if (!store.empty()) {
        const std::string store_whole = WholeDiskOf(store);
        if (std::find(out.begin(), out.end(), store_whole) == out.end()) out.push_back(store_whole);
    }
    return out;
}

Result MacDiskInventory::Info(const std::string& target, InfoMap& out) const {
    std::string text;
    auto r = RunChecked(*runner_, {"diskutil", "info", target}, &text);
    if (!r.ok) return r.As(ErrorKind::DiskNotFound);
    out = ParseDiskutilInfo(text);
    return Result::Ok();
}

Result MacDiskInventory::List(std::vector<ListedDisk>& out) const {
    std::string text;
    auto r = RunChecked(*runner_, {"diskutil", "list"}, &text);
    if (!r.ok) return r.As(ErrorKind::DiskNotFound);
    out = ParseDiskutilList(text);
    return Result::Ok();
}

Result MacDiskInventory::RootDisks(std::vector<std::string>& out_identifiers) {
    InfoMap info;
    auto r = Info("/", info);
    if (!r.ok) return r;
    out_identifiers = RootDisksFromInfo(info);
    if (out_identifiers.empty()) {
        return Result::Fail(ErrorKind::DiskNotFound, "cannot determine the root filesystem disk");
    }
    return Result::Ok();
}

Result MacDiskInventory::DescribeListed(const ListedDisk& listed, DiskDevice& out) const {
    InfoMap info;
    auto r = Info(listed.identifier, info);
    if (!r.ok) return r;

    out = DiskDevice{};
    out.identifier = listed.identifier;
    ApplyInfo(info, out);
    if (listed.disk_image) out.protocol = "Disk Image";
    if (listed.synthesized) out.protocol = "virtual";
    if (out.transport.empty()) out.transport = listed.external ? "external" : "internal";

    for (const auto& part_id : listed.partitions) {
        PartitionInfo p;
        p.identifier = part_id;
        InfoMap pinfo;
        if (Info(part_id, pinfo).ok) {
            p.label = Get(pinfo, "Volume Name");
            p.fs_type = Get(pinfo, "File System Personality");
            p.mount_point = Get(pinfo, "Mount Point");
        }
        if (!p.mount_point.empty()) out.mount_points.push_back(p.mount_point);
        out.partitions.push_back(std::move(p));
    }
    return Result::Ok();
}

Result MacDiskInventory::ListDisks(std::vector<DiskDevice>& out) {
    std::vector<std::string> roots;
    auto r = RootDisks(roots);
    if (!r.ok) return r;

    std::vector<ListedDisk> listed;
    r = List(listed);
    if (!r.ok) return r;

    out.clear();
    for (const auto& l : listed) {
        if (std::find(roots.begin(), roots.end(), l.identifier) != roots.end()) {
            LogDebug("Skipping %s: holds the root filesystem", l.identifier.c_str());
            continue;
        }
        DiskDevice d;
        r = DescribeListed(l, d);
        if (!r.ok) {
            LogWarn("Skipping %s: %s", l.identifier.c_str(), r.msg.c_str());
            continue;
        }
        out.push_back(std::move(d));
    }
    return Result::Ok();
}

Result MacDiskInventory::Describe(const std::string& identifier, DiskDevice& out) {
    const std::string id = NormalizeIdentifier(identifier);

    std::vector<ListedDisk> listed;
    auto r = List(listed);
    if (!r.ok) return r;

    for (const auto& l : listed) {
        if (l.identifier == id) return DescribeListed(l, out);
    }

    // A partition or an unlisted node: describe it alone so the validator can reject it.
    InfoMap info;
    r = Info(id, info);
    if (!r.ok) {
        return Result::Fail(ErrorKind::DiskNotFound, ENODEV, "no such disk: " + identifier);
    }
    out = DiskDevice{};
    out.identifier = id;
    ApplyInfo(info, out);
    return Result::Ok();
}

Result MacDiskInventory::UnmountDisk(const DiskDevice& disk) {
    LogInfo("Unmounting %s", disk.path.c_str());
    auto r = RunChecked(*runner_, {"diskutil", "unmountDisk", disk.path});
    if (!r.ok) return r.As(ErrorKind::Flash);
    return Result::Ok();
}

std::string MacDiskInventory::RawDevicePath(const DiskDevice& disk) const {
    return "/dev/r" + NormalizeIdentifier(disk.identifier);
}

Result MacDiskInventory::RescanPartitions(const std::string& device_path) {
    // diskarbitrationd re-reads the table itself once the raw device is closed.
    LogDebug("No explicit partition rescan for %s", device_path.c_str());
    return Result::Ok();
}

Result MacDiskInventory::MountPartition(const std::string& partition_identifier,
                                        std::string& out_mount_point) {
    const std::string id = NormalizeIdentifier(partition_identifier);
    auto r = RunChecked(*runner_, {"diskutil", "mount", id});
    if (!r.ok) return r.As(ErrorKind::MountTimeout);

    InfoMap info;
    r = Info(id, info);
    if (!r.ok) return r.As(ErrorKind::MountTimeout);
    out_mount_point = Get(info, "Mount Point");
    if (out_mount_point.empty()) {
        return Result::Fail(ErrorKind::MountTimeout, id + " reported no mount point after mounting");
    }
    return Result::Ok();
}

std::string MacDiskInventory::PartitionIdentifier(const DiskDevice& disk, int index) const {
    return NormalizeIdentifier(disk.identifier) + "s" + std::to_string(index);
}

} // namespace piprov
