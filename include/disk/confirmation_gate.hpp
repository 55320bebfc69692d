#pragma once

#include "disk/candidate_classifier.hpp"
#include "disk/disk_device.hpp"
#include "util/result.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace piprov {

// Last stop before an irreversible write: show the target, demand the exact phrase.
class ConfirmationGate {
public:
    struct Options {
        bool require_confirmation = true;
        std::string phrase = "YES";
    };

    ConfirmationGate(std::istream& in, std::ostream& out, Options opt);

    // Ok only on an exact match of the phrase; anything else (EOF included) is UserAborted.
    Result Confirm(const DiskDevice& disk,
                   const CandidateScore* score,
                   const std::string& image_path);

    void Render(const DiskDevice& disk, const CandidateScore* score, const std::string& image_path);

private:
    std::istream& in_;
    std::ostream& out_;
    Options opt_;
};

} // namespace piprov
