#include "disk/linux_disk_inventory.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <unistd.h>

namespace piprov {

namespace {

using json = nlohmann::json;

const std::vector<std::string> kLsblkArgv = {
    "lsblk", "-J", "-b", "-o",
    "NAME,PATH,SIZE,TYPE,RM,TRAN,MODEL,VENDOR,SERIAL,LABEL,FSTYPE,MOUNTPOINTS",
};

// util-linux before 2.37 has no MOUNTPOINTS column.
const std::vector<std::string> kLegacyLsblkArgv = {
    "lsblk", "-J", "-b", "-o",
    "NAME,PATH,SIZE,TYPE,RM,TRAN,MODEL,VENDOR,SERIAL,LABEL,FSTYPE,MOUNTPOINT",
};

std::string StringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return Trim(it->get<std::string>());
}

// Older lsblk releases print numbers and booleans as strings.
std::uint64_t SizeField(const json& j) {
    auto it = j.find("size");
    if (it == j.end()) return 0;
    if (it->is_number_unsigned() || it->is_number_integer()) return it->get<std::uint64_t>();
    if (it->is_string()) return std::strtoull(it->get<std::string>().c_str(), nullptr, 10);
    return 0;
}

Removable RemovableField(const json& j) {
    auto it = j.find("rm");
    if (it == j.end() || it->is_null()) return Removable::Unknown;
    if (it->is_boolean()) return it->get<bool>() ? Removable::Yes : Removable::No;
    if (it->is_number()) return it->get<int>() != 0 ? Removable::Yes : Removable::No;
    if (it->is_string()) {
        const std::string v = ToLower(Trim(it->get<std::string>()));
        if (v == "1" || v == "true") return Removable::Yes;
        if (v == "0" || v == "false") return Removable::No;
    }
    return Removable::Unknown;
}

// "mountpoints" array (every bind and subvolume mount) or the legacy single "mountpoint".
std::vector<std::string> MountPointsField(const json& j) {
    std::vector<std::string> out;
    auto it = j.find("mountpoints");
    if (it != j.end() && it->is_array()) {
        for (const auto& m : *it) {
            if (m.is_string() && !m.get<std::string>().empty()) out.push_back(m.get<std::string>());
        }
    }
    const std::string mp = StringField(j, "mountpoint");
    if (!mp.empty() && std::find(out.begin(), out.end(), mp) == out.end()) out.push_back(mp);
    return out;
}

void AppendUnique(std::vector<std::string>& to, const std::vector<std::string>& from) {
    for (const auto& s : from) {
        if (std::find(to.begin(), to.end(), s) == to.end()) to.push_back(s);
    }
}

bool SubtreeMountsRoot(const json& node) {
    const auto mps = MountPointsField(node);
    if (std::find(mps.begin(), mps.end(), "/") != mps.end()) return true;
    auto it = node.find("children");
    if (it == node.end() || !it->is_array()) return false;
    for (const auto& child : *it) {
        if (SubtreeMountsRoot(child)) return true;
    }
    return false;
}

bool IsVirtualName(std::string_view name) {
    for (std::string_view prefix : {"loop", "ram", "zram", "nbd"}) {
        if (name.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

std::string ProtocolFor(std::string_view name, std::string_view type, std::string_view tran) {
    if (type == "loop" || IsVirtualName(name)) return "virtual";
    const std::string t = ToLower(tran);
    if (t == "usb") return "USB";
    if (t == "mmc") return "Secure Digital";
    if (t == "sata" || t == "ata") return "SATA";
    if (t == "nvme") return "PCI-Express";
    if (t == "scsi" || t == "sas") return "SCSI";
    return std::string(tran);
}

void CollectPartitions(const json& node, DiskDevice& disk) {
    auto it = node.find("children");
    if (it == node.end() || !it->is_array()) return;
    for (const auto& child : *it) {
        if (StringField(child, "type") == "part") {
            PartitionInfo p;
            p.identifier = StringField(child, "name");
            p.label = StringField(child, "label");
            p.fs_type = StringField(child, "fstype");
            const auto mps = MountPointsField(child);
            if (!mps.empty()) p.mount_point = mps.front();
            AppendUnique(disk.mount_points, mps);
            disk.partitions.push_back(std::move(p));
        }
        // Mounts further down (crypt, lvm) still pin the disk.
        auto grand = child.find("children");
        if (grand != child.end() && grand->is_array()) {
            for (const auto& g : *grand) AppendUnique(disk.mount_points, MountPointsField(g));
        }
    }
}

DiskDevice DiskFromNode(const json& node) {
    DiskDevice d;
    d.identifier = StringField(node, "name");
    d.path = StringField(node, "path");
    if (d.path.empty()) d.path = "/dev/" + d.identifier;
    d.size_bytes = SizeField(node);
    d.removable = RemovableField(node);
    d.transport = StringField(node, "tran");
    d.protocol = ProtocolFor(d.identifier, StringField(node, "type"), d.transport);
    d.model = StringField(node, "model");
    d.vendor = StringField(node, "vendor");
    d.serial = StringField(node, "serial");
    d.whole_disk = true;
    AppendUnique(d.mount_points, MountPointsField(node));
    CollectPartitions(node, d);
    return d;
}

// "uid=1000,gid=1000,umask=022" for the user who ran sudo, so the boot files stay editable.
std::string VfatOwnerOptions() {
    const char* uid = std::getenv("SUDO_UID");
    const char* gid = std::getenv("SUDO_GID");
    const std::string u = uid && *uid ? uid : std::to_string(::getuid());
    const std::string g = gid && *gid ? gid : std::to_string(::getgid());
    return "uid=" + u + ",gid=" + g + ",umask=022";
}

} // namespace

LinuxDiskInventory::LinuxDiskInventory() : LinuxDiskInventory(Options{}) {}

LinuxDiskInventory::LinuxDiskInventory(Options opt) : opt_(std::move(opt)) {
    if (!opt_.runner) opt_.runner = std::make_shared<ProcessRunner>();
}

Result LinuxDiskInventory::ParseLsblkJson(std::string_view text,
                                          std::vector<DiskDevice>& out_disks,
                                          std::vector<std::string>& out_root_identifiers) {
    out_disks.clear();
    out_root_identifiers.clear();

    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::DiskNotFound, std::string("cannot parse lsblk output: ") + e.what());
    }

    auto devs = j.find("blockdevices");
    if (devs == j.end() || !devs->is_array()) {
        return Result::Fail(ErrorKind::DiskNotFound, "lsblk output has no \"blockdevices\" array");
    }

    for (const auto& node : *devs) {
        if (!node.is_object()) continue;
        const std::string type = StringField(node, "type");
        if (type != "disk" && type != "loop") continue;
        DiskDevice d = DiskFromNode(node);
        if (d.identifier.empty()) continue;
        if (SubtreeMountsRoot(node)) out_root_identifiers.push_back(d.identifier);
        out_disks.push_back(std::move(d));
    }
    return Result::Ok();
}

Result LinuxDiskInventory::Snapshot(std::vector<DiskDevice>& disks,
                                    std::vector<std::string>& root_identifiers) {
    std::string out;
    auto r = RunChecked(*opt_.runner, kLsblkArgv, &out);
    if (!r.ok) {
        LogDebug("lsblk rejected MOUNTPOINTS, retrying with MOUNTPOINT: %s", r.msg.c_str());
        r = RunChecked(*opt_.runner, kLegacyLsblkArgv, &out);
    }
    if (!r.ok) return r.As(ErrorKind::DiskNotFound);
    return ParseLsblkJson(out, disks, root_identifiers);
}

Result LinuxDiskInventory::ListDisks(std::vector<DiskDevice>& out) {
    std::vector<DiskDevice> all;
    std::vector<std::string> roots;
    auto r = Snapshot(all, roots);
    if (!r.ok) return r;

    out.clear();
    for (auto& d : all) {
        if (std::find(roots.begin(), roots.end(), d.identifier) != roots.end()) {
            LogDebug("Skipping %s: holds the root filesystem", d.identifier.c_str());
            continue;
        }
        out.push_back(std::move(d));
    }
    return Result::Ok();
}

Result LinuxDiskInventory::Describe(const std::string& identifier, DiskDevice& out) {
    std::vector<DiskDevice> all;
    std::vector<std::string> roots;
    auto r = Snapshot(all, roots);
    if (!r.ok) return r;

    const std::string id = NormalizeIdentifier(identifier);
    for (auto& d : all) {
        if (d.identifier == id) {
            out = std::move(d);
            return Result::Ok();
        }
        for (const auto& p : d.partitions) {
            if (p.identifier != id) continue;
            out = DiskDevice{};
            out.identifier = p.identifier;
            out.path = "/dev/" + p.identifier;
            out.whole_disk = false;
            out.protocol = d.protocol;
            out.transport = d.transport;
            out.removable = d.removable;
            if (!p.mount_point.empty()) out.mount_points.push_back(p.mount_point);
            return Result::Ok();
        }
    }
    return Result::Fail(ErrorKind::DiskNotFound, ENODEV, "no such disk: " + identifier);
}

Result LinuxDiskInventory::RootDisks(std::vector<std::string>& out_identifiers) {
    std::vector<DiskDevice> all;
    auto r = Snapshot(all, out_identifiers);
    if (!r.ok) return r;
    if (out_identifiers.empty()) {
        return Result::Fail(ErrorKind::DiskNotFound, "cannot determine the root filesystem disk");
    }
    return Result::Ok();
}

Result LinuxDiskInventory::UnmountDisk(const DiskDevice& disk) {
    for (const auto& mp : disk.mount_points) {
        LogInfo("Unmounting %s", mp.c_str());
        auto r = RunChecked(*opt_.runner, {"umount", mp});
        if (!r.ok) return r.As(ErrorKind::Flash);
    }
    return Result::Ok();
}

std::string LinuxDiskInventory::RawDevicePath(const DiskDevice& disk) const {
    return disk.path.empty() ? "/dev/" + disk.identifier : disk.path;
}

Result LinuxDiskInventory::RescanPartitions(const std::string& device_path) {
    Fd fd(::open(device_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(err, "open " + device_path + " failed (" + std::strerror(err) + ")");
    }
    if (::ioctl(fd.Get(), BLKRRPART) != 0) {
        const int err = errno;
        return Result::Fail(err, "BLKRRPART on " + device_path + " failed (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result LinuxDiskInventory::MountPartition(const std::string& partition_identifier,
                                          std::string& out_mount_point) {
    const std::string dev = "/dev/" + NormalizeIdentifier(partition_identifier);
    MountSession session(opt_.mount_ops);
    auto r = MountSession::MountDevice(dev, opt_.mount_base_dir, "piprov-boot-", "vfat",
                                       MS_NOATIME, VfatOwnerOptions(), session);
    if (!r.ok) return r.As(ErrorKind::MountTimeout);
    out_mount_point = session.Release();
    return Result::Ok();
}

std::string LinuxDiskInventory::PartitionIdentifier(const DiskDevice& disk, int index) const {
    const std::string& id = disk.identifier;
    const bool digit_suffix = !id.empty() && std::isdigit(static_cast<unsigned char>(id.back()));
    return id + (digit_suffix ? "p" : "") + std::to_string(index);
}

} // namespace piprov
