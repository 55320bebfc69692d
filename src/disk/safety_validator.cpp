#include "disk/safety_validator.hpp"

#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <regex>

namespace piprov {

SafetyValidator::SafetyValidator(DiskInventory& inventory) : SafetyValidator(inventory, Options{}) {}

SafetyValidator::SafetyValidator(DiskInventory& inventory, Options opt)
    : inventory_(inventory), opt_(opt) {}

Result SafetyValidator::Validate(const std::string& identifier,
                                 std::optional<ValidatedTarget>& out) const {
    out.reset();

    DiskDevice disk;
    auto r = inventory_.Describe(identifier, disk);
    if (!r.ok) {
        if (r.kind == ErrorKind::DiskNotFound) return r;
        return Result::Fail(ErrorKind::DiskNotFound, r.err, "cannot describe " + identifier + ": " + r.msg);
    }

    if (!disk.whole_disk) {
        return Result::Fail(ErrorKind::UnsafeTarget,
                            disk.identifier + " is a partition, not a whole disk");
    }
    bool is_root = true;
    r = inventory_.IsRootDisk(disk.identifier, is_root);
    if (!r.ok) {
        return Result::Fail(ErrorKind::UnsafeTarget,
                            "cannot rule out the root filesystem disk: " + r.msg);
    }
    if (is_root) {
        return Result::Fail(ErrorKind::UnsafeTarget,
                            disk.identifier + " holds the root filesystem");
    }
    if (!inventory_.IsBlockDevice(disk.path)) {
        return Result::Fail(ErrorKind::UnsafeTarget, disk.path + " is not a block device");
    }

    if (disk.size_bytes < opt_.min_bytes) {
        return Result::Fail(ErrorKind::UnsafeTarget,
                            disk.identifier + " is too small (" + HumanSize(disk.size_bytes) + ")");
    }
    if (disk.size_bytes > opt_.max_bytes) {
        return Result::Fail(ErrorKind::UnsafeTarget,
                            disk.identifier + " is too large (" + HumanSize(disk.size_bytes) +
                                "), refusing to treat it as an SD card");
    }

    if (opt_.require_removable && disk.removable != Removable::Yes && !disk.builtin_card_reader) {
        const std::string pattern = inventory_.SdPathPattern();
        if (pattern.empty() || !std::regex_match(disk.path, std::regex(pattern))) {
            LogWarn("%s does not appear to be removable; it may not be an SD card", disk.path.c_str());
            return Result::Fail(ErrorKind::UnsafeTarget,
                                disk.identifier + " is not removable (" +
                                    RemovableName(disk.removable) +
                                    "); refusing to write it without confirmation");
        }
    }

    LogDebug("Target %s passed safety checks", disk.identifier.c_str());
    out.emplace(ValidatedTarget(std::move(disk)));
    return Result::Ok();
}

Result TargetSelector::Select(const std::string& configured_target,
                              bool auto_detect,
                              const std::vector<ScoredDisk>& scored,
                              std::string& out_identifier) {
    if (!configured_target.empty()) {
        out_identifier = configured_target;
        return Result::Ok();
    }
    if (!auto_detect) {
        return Result::Fail(ErrorKind::DiskNotFound,
                            "automatic detection is disabled and no target disk is configured");
    }

    std::vector<const ScoredDisk*> candidates;
    for (const auto& s : scored) {
        if (s.score.candidate) candidates.push_back(&s);
    }

    if (candidates.empty()) {
        return Result::Fail(ErrorKind::DiskNotFound, "no SD card detected; insert a card or pass --target");
    }
    if (candidates.size() > 1) {
        std::string names;
        for (const auto* c : candidates) {
            if (!names.empty()) names += ", ";
            names += c->disk.path + " (" + HumanSize(c->disk.size_bytes) + ")";
        }
        return Result::Fail(ErrorKind::DiskNotFound,
                            "multiple SD card candidates: " + names + "; choose one with --target");
    }

    out_identifier = candidates.front()->disk.identifier;
    LogInfo("Detected SD card: %s (%s)", candidates.front()->disk.path.c_str(),
            candidates.front()->score.reason.c_str());
    return Result::Ok();
}

} // namespace piprov
