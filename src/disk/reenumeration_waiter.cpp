#include "disk/reenumeration_waiter.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <thread>

namespace piprov {

std::chrono::steady_clock::time_point SystemClock::Now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }

const char* WaitStateName(WaitState s) {
    switch (s) {
    case WaitState::WaitingForEnumeration:
        return "waiting-for-enumeration";
    case WaitState::WaitingForMount:
        return "waiting-for-mount";
    case WaitState::Mounted:
        return "mounted";
    case WaitState::Failed:
        return "failed";
    }
    return "unknown";
}

ReenumerationWaiter::ReenumerationWaiter(DiskInventory& inventory, IClock& clock, Options opt)
    : inventory_(inventory), clock_(clock), opt_(opt) {}

void ReenumerationWaiter::Enter(WaitState s) {
    if (!history_.empty() && state_ == s) return;
    LogDebug("mount wait: %s", WaitStateName(s));
    state_ = s;
    history_.push_back(s);
}

ReenumerationWaiter::Observation ReenumerationWaiter::Observe(const std::string& disk_identifier) {
    Observation obs;
    DiskDevice disk;
    if (!inventory_.Describe(disk_identifier, disk).ok) return obs;
    obs.disk_present = true;

    const PartitionInfo* boot = nullptr;
    for (const auto& p : disk.partitions) {
        if (IsBootPartitionName(p.label)) {
            boot = &p;
            break;
        }
    }
    if (!boot) {
        const std::string first = inventory_.PartitionIdentifier(disk, 1);
        for (const auto& p : disk.partitions) {
            if (p.identifier == first) {
                boot = &p;
                break;
            }
        }
    }
    if (boot) {
        obs.partition_identifier = boot->identifier;
        obs.mount_point = boot->mount_point;
    }
    return obs;
}

Result ReenumerationWaiter::Wait(const std::string& disk_identifier, BootPartitionHandle& out) {
    history_.clear();
    Enter(WaitState::WaitingForEnumeration);

    const auto start = clock_.Now();
    const auto deadline = start + opt_.budget;

    LogInfo("Waiting for the boot partition to appear...");
    clock_.SleepFor(std::min(opt_.settle, opt_.budget));

    std::string boot_partition;
    for (;;) {
        const Observation obs = Observe(disk_identifier);
        if (!obs.partition_identifier.empty()) {
            boot_partition = obs.partition_identifier;
            if (!obs.mount_point.empty()) {
                Enter(WaitState::Mounted);
                out.partition_identifier = obs.partition_identifier;
                out.mount_point = obs.mount_point;
                LogInfo("Boot partition mounted at %s", out.mount_point.c_str());
                return Result::Ok();
            }
            Enter(WaitState::WaitingForMount);
        }

        const auto now = clock_.Now();
        if (now >= deadline) break;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        clock_.SleepFor(std::min(opt_.poll, remaining));
    }

    if (boot_partition.empty()) {
        DiskDevice guess;
        guess.identifier = inventory_.NormalizeIdentifier(disk_identifier);
        boot_partition = inventory_.PartitionIdentifier(guess, 1);
    }
    LogWarn("Boot partition did not auto-mount, mounting %s manually", boot_partition.c_str());

    std::string mount_point;
    auto r = inventory_.MountPartition(boot_partition, mount_point);
    if (!r.ok || mount_point.empty()) {
        Enter(WaitState::Failed);
        return Result::Fail(ErrorKind::MountTimeout, r.err,
                            "boot partition " + boot_partition + " was not mounted within " +
                                std::to_string(opt_.budget.count() / 1000) + "s" +
                                (r.ok ? std::string{} : ": " + r.msg));
    }

    Enter(WaitState::Mounted);
    out.partition_identifier = boot_partition;
    out.mount_point = mount_point;
    LogInfo("Boot partition mounted at %s", out.mount_point.c_str());
    return Result::Ok();
}

} // namespace piprov
