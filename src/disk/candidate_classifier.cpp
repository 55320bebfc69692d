#include "disk/candidate_classifier.hpp"

#include "util/string_utils.hpp"

#include <regex>

namespace piprov {

const char* ClassifierRuleName(ClassifierRule rule) {
    switch (rule) {
    case ClassifierRule::VirtualDevice:
        return "virtual-device";
    case ClassifierRule::SizeOutOfRange:
        return "size-out-of-range";
    case ClassifierRule::Removable:
        return "removable";
    case ClassifierRule::SdDevicePath:
        return "sd-device-path";
    case ClassifierRule::CardReaderModel:
        return "card-reader-model";
    case ClassifierRule::UsbCardReader:
        return "usb-card-reader";
    case ClassifierRule::NoMatch:
        return "no-match";
    }
    return "unknown";
}

CandidateClassifier::CandidateClassifier(Options opt) : opt_(std::move(opt)) {}

// Substring match: "sd" also hits "SSD" model strings, which the size and
// removable rules usually settle first.
bool CandidateClassifier::HasCardReaderKeyword(std::string_view text) {
    for (std::string_view kw : {"reader", "card", "sdxc", "sdhc", "sd", "mmc"}) {
        if (ContainsIgnoreCase(text, kw)) return true;
    }
    return false;
}

CandidateScore CandidateClassifier::Classify(const DiskDevice& disk) const {
    if (disk.IsVirtual()) {
        return {false, ClassifierRule::VirtualDevice, "virtual device (" + disk.protocol + ")"};
    }
    if (disk.size_bytes < opt_.min_bytes || disk.size_bytes > opt_.max_bytes) {
        return {false, ClassifierRule::SizeOutOfRange,
                "size " + HumanSize(disk.size_bytes) + " outside " + HumanSize(opt_.min_bytes) +
                    ".." + HumanSize(opt_.max_bytes)};
    }
    if (disk.removable == Removable::Yes) {
        return {true, ClassifierRule::Removable, "removable media"};
    }
    if (disk.builtin_card_reader) {
        return {true, ClassifierRule::Removable, "built-in SD card reader"};
    }
    if (!opt_.sd_path_pattern.empty()) {
        const std::regex re(opt_.sd_path_pattern);
        if (std::regex_match(disk.path, re)) {
            return {true, ClassifierRule::SdDevicePath, "SD device path " + disk.path};
        }
    }
    if (HasCardReaderKeyword(disk.model) || HasCardReaderKeyword(disk.vendor)) {
        return {true, ClassifierRule::CardReaderModel, "card reader model '" + disk.DisplayName() + "'"};
    }
    if (ContainsIgnoreCase(disk.transport, "usb") || ContainsIgnoreCase(disk.protocol, "usb")) {
        if (ContainsIgnoreCase(disk.model, "card") || ContainsIgnoreCase(disk.model, "reader")) {
            return {true, ClassifierRule::UsbCardReader, "USB card reader"};
        }
    }
    return {false, ClassifierRule::NoMatch, "no SD card indicators"};
}

std::vector<ScoredDisk> CandidateClassifier::ClassifyAll(const std::vector<DiskDevice>& disks) const {
    std::vector<ScoredDisk> out;
    out.reserve(disks.size());
    for (const auto& d : disks) {
        out.push_back({d, Classify(d)});
    }
    return out;
}

} // namespace piprov
