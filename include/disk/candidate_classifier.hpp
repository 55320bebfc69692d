#pragma once

#include "disk/disk_device.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace piprov {

// Checked in declaration order; the first rule that applies decides.
enum class ClassifierRule {
    VirtualDevice,  // reject
    SizeOutOfRange, // reject
    Removable,      // accept
    SdDevicePath,   // accept
    CardReaderModel,// accept
    UsbCardReader,  // accept
    NoMatch,        // reject
};

const char* ClassifierRuleName(ClassifierRule rule);

struct CandidateScore {
    bool candidate = false;
    ClassifierRule rule = ClassifierRule::NoMatch;
    std::string reason;
};

struct ScoredDisk {
    DiskDevice disk;
    CandidateScore score;
};

class CandidateClassifier {
public:
    struct Options {
        std::uint64_t min_bytes = kMinTargetBytes;
        std::uint64_t max_bytes = kMaxTargetBytes;
        // Whole-disk path regex for SD slots; empty disables the rule.
        std::string sd_path_pattern;
    };

    explicit CandidateClassifier(Options opt);

    // Pure function of `disk`.
    CandidateScore Classify(const DiskDevice& disk) const;
    std::vector<ScoredDisk> ClassifyAll(const std::vector<DiskDevice>& disks) const;

    static bool HasCardReaderKeyword(std::string_view text);

private:
    Options opt_;
};

} // namespace piprov
