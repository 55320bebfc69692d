#include "disk/confirmation_gate.hpp"

#include "util/logger.hpp"
#include "util/progress_sinks.hpp"
#include "util/string_utils.hpp"

namespace piprov {

namespace {

const char* OrUnknown(const std::string& s) { return s.empty() ? "unknown" : s.c_str(); }

} // namespace

ConfirmationGate::ConfirmationGate(std::istream& in, std::ostream& out, Options opt)
    : in_(in), out_(out), opt_(std::move(opt)) {}

void ConfirmationGate::Render(const DiskDevice& disk,
                              const CandidateScore* score,
                              const std::string& image_path) {
    ClearProgressLine();
    out_ << "\n";
    out_ << "WARNING: ALL DATA ON THIS DEVICE WILL BE ERASED\n";
    out_ << "  Image:      " << image_path << "\n";
    out_ << "  Device:     " << disk.path << "\n";
    out_ << "  Name:       " << disk.DisplayName() << "\n";
    out_ << "  Size:       " << HumanSize(disk.size_bytes) << " (" << disk.size_bytes << " bytes)\n";
    out_ << "  Protocol:   " << OrUnknown(disk.protocol) << "\n";
    out_ << "  Transport:  " << OrUnknown(disk.transport) << "\n";
    out_ << "  Removable:  " << RemovableName(disk.removable) << "\n";
    out_ << "  Serial:     " << OrUnknown(disk.serial) << "\n";
    if (score) {
        out_ << "  Detected:   " << ClassifierRuleName(score->rule) << " (" << score->reason << ")\n";
    }
    if (disk.partitions.empty()) {
        out_ << "  Partitions: none\n";
    } else {
        out_ << "  Partitions:\n";
        for (const auto& p : disk.partitions) {
            out_ << "    " << p.identifier;
            if (!p.label.empty()) out_ << "  label=" << p.label;
            if (!p.fs_type.empty()) out_ << "  fs=" << p.fs_type;
            if (!p.mount_point.empty()) out_ << "  mounted at " << p.mount_point;
            out_ << "\n";
        }
    }
    if (disk.removable != Removable::Yes && !disk.builtin_card_reader) {
        out_ << "  Note: this disk does not report removable media; it may not be an SD card.\n";
    }
    if (LooksPreviouslyProvisioned(disk)) {
        out_ << "  Note: this card already carries a Raspberry Pi boot partition.\n";
    }
    out_.flush();
}

Result ConfirmationGate::Confirm(const DiskDevice& disk,
                                 const CandidateScore* score,
                                 const std::string& image_path) {
    if (!opt_.require_confirmation) {
        LogWarn("Confirmation disabled, writing to %s without asking", disk.path.c_str());
        return Result::Ok();
    }

    Render(disk, score, image_path);
    out_ << "\nType " << opt_.phrase << " to continue: ";
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << "\n";
        return Result::Fail(ErrorKind::UserAborted, "no confirmation received");
    }
    if (!answer.empty() && answer.back() == '\r') answer.pop_back();
    if (answer != opt_.phrase) {
        return Result::Fail(ErrorKind::UserAborted, "operation cancelled");
    }
    return Result::Ok();
}

} // namespace piprov
