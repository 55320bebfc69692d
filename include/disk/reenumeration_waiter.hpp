#pragma once

#include "disk/disk_inventory.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace piprov {

class IClock {
public:
    virtual ~IClock() = default;
    virtual std::chrono::steady_clock::time_point Now() const = 0;
    virtual void SleepFor(std::chrono::milliseconds d) = 0;
};

class SystemClock final : public IClock {
public:
    std::chrono::steady_clock::time_point Now() const override;
    void SleepFor(std::chrono::milliseconds d) override;
};

enum class WaitState {
    WaitingForEnumeration,
    WaitingForMount,
    Mounted,
    Failed,
};

const char* WaitStateName(WaitState s);

struct BootPartitionHandle {
    std::string mount_point;
    std::string partition_identifier;
    std::vector<std::string> required_markers{"config.txt", "cmdline.txt"};
};

// After a flash the OS drops and re-reads the card. Polls until the boot
// partition is mounted, then falls back to mounting it once by hand.
class ReenumerationWaiter {
public:
    struct Options {
        std::chrono::milliseconds settle{3000};
        std::chrono::milliseconds budget{30000};
        std::chrono::milliseconds poll{1000};
    };

    ReenumerationWaiter(DiskInventory& inventory, IClock& clock, Options opt);

    // MountTimeout when neither polling nor the manual mount produced a mount point.
    Result Wait(const std::string& disk_identifier, BootPartitionHandle& out);

    WaitState State() const { return state_; }
    // Every state entered, in order, starting with WaitingForEnumeration.
    const std::vector<WaitState>& History() const { return history_; }

private:
    struct Observation {
        bool disk_present = false;
        std::string partition_identifier;
        std::string mount_point;
    };

    Observation Observe(const std::string& disk_identifier);
    void Enter(WaitState s);

    DiskInventory& inventory_;
    IClock& clock_;
    Options opt_;
    WaitState state_ = WaitState::WaitingForEnumeration;
    std::vector<WaitState> history_;
};

} // namespace piprov
