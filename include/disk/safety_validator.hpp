#pragma once

#include "disk/candidate_classifier.hpp"
#include "disk/disk_device.hpp"
#include "disk/disk_inventory.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace piprov {

// Proof that a disk passed SafetyValidator::Validate. Only the validator can make one.
class ValidatedTarget {
public:
    const DiskDevice& Disk() const { return disk_; }

private:
    friend class SafetyValidator;
    explicit ValidatedTarget(DiskDevice disk) : disk_(std::move(disk)) {}

    DiskDevice disk_;
};

struct FlashJob {
    FlashJob(std::string image, ValidatedTarget validated)
        : image_path(std::move(image)),
          target(std::move(validated)),
          start_time(std::chrono::system_clock::now()) {}

    std::string image_path;
    ValidatedTarget target;
    std::string device_path; // raw handle chosen by the flasher
    std::chrono::system_clock::time_point start_time;
};

class SafetyValidator {
public:
    struct Options {
        std::uint64_t min_bytes = kMinTargetBytes;
        std::uint64_t max_bytes = kMaxTargetBytes;
        // Set when nobody will confirm the write: fixed disks are then refused
        // unless they are a built-in reader or sit on the platform's SD path.
        bool require_removable = false;
    };

    explicit SafetyValidator(DiskInventory& inventory);
    SafetyValidator(DiskInventory& inventory, Options opt);

    // Re-describes `identifier` and checks it is a whole block device in the size
    // window that does not hold the root filesystem. DiskNotFound or UnsafeTarget otherwise.
    Result Validate(const std::string& identifier, std::optional<ValidatedTarget>& out) const;

private:
    DiskInventory& inventory_;
    Options opt_;
};

// Picks the disk to provision: the configured one, else the single candidate.
class TargetSelector {
public:
    static Result Select(const std::string& configured_target,
                         bool auto_detect,
                         const std::vector<ScoredDisk>& scored,
                         std::string& out_identifier);
};

} // namespace piprov
