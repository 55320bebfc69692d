#pragma once

#include "disk/boot_partition_verifier.hpp"
#include "disk/candidate_classifier.hpp"
#include "disk/disk_inventory.hpp"
#include "disk/reenumeration_waiter.hpp"
#include "image/http_client.hpp"
#include "util/config_parser.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace piprov {

// Collaborators the commands run against. Tests substitute fakes for each.
struct ProvisionServices {
    IHttpClient* http = nullptr;
    DiskInventory* inventory = nullptr;
    IClock* clock = nullptr;
    std::istream* confirm_in = nullptr;
    std::ostream* confirm_out = nullptr;
    IProgress* progress = nullptr;
};

class Provisioner {
public:
    Provisioner(const config::ProvisionConfig& cfg, ProvisionServices services);

    // "download": a verified, decompressed image in the cache.
    Result DownloadImage(const std::string& version_spec, std::string& out_image_path);
    // "flash": select, validate, confirm, write, wait for the boot partition.
    Result FlashImage(const std::string& image_path, BootPartitionHandle& out);
    // "list": every non-root disk with its classification.
    Result ListDisks(std::vector<ScoredDisk>& out);

    CandidateClassifier MakeClassifier() const;

private:
    const config::ProvisionConfig& cfg_;
    ProvisionServices svc_;
};

void PrintDiskTable(const std::vector<ScoredDisk>& disks, std::ostream& out);

// 0 ok, 2 Usage, 3 UserAborted, 1 anything else.
int ExitCodeFor(const Result& r);

} // namespace piprov
