#include "app/provisioner.hpp"

#include "disk/confirmation_gate.hpp"
#include "disk/flasher.hpp"
#include "disk/safety_validator.hpp"
#include "image/artifact_cache.hpp"
#include "image/image_provider.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <optional>

namespace piprov {

Provisioner::Provisioner(const config::ProvisionConfig& cfg, ProvisionServices services)
    : cfg_(cfg), svc_(services) {}

CandidateClassifier Provisioner::MakeClassifier() const {
    CandidateClassifier::Options opt;
    opt.sd_path_pattern = svc_.inventory->SdPathPattern();
    return CandidateClassifier(std::move(opt));
}

Result Provisioner::DownloadImage(const std::string& version_spec, std::string& out_image_path) {
    ArtifactCache cache(cfg_.cache_dir);
    ImageProvider provider(*svc_.http,
                           cache,
                           {.base_url = cfg_.base_url, .os_flavor = cfg_.os_flavor},
                           {.required_free_bytes = cfg_.required_free_bytes,
                            .keep_compressed = cfg_.keep_cached_images,
                            .progress = svc_.progress});
    return provider.Download(version_spec.empty() ? cfg_.image_version : version_spec,
                             out_image_path);
}

Result Provisioner::ListDisks(std::vector<ScoredDisk>& out) {
    std::vector<DiskDevice> disks;
    auto r = svc_.inventory->ListDisks(disks);
    if (!r.ok) return r;
    out = MakeClassifier().ClassifyAll(disks);
    return Result::Ok();
}

Result Provisioner::FlashImage(const std::string& image_path, BootPartitionHandle& out) {
    if (!IsNonEmptyFile(image_path)) {
        return Result::Fail(ErrorKind::Flash, ENOENT, "image not found or empty: " + image_path);
    }

    std::vector<ScoredDisk> scored;
    auto r = ListDisks(scored);
    if (!r.ok) return r;

    std::string target_id;
    r = TargetSelector::Select(cfg_.target_disk, cfg_.auto_detect_sd, scored, target_id);
    if (!r.ok) return r;

    std::optional<ValidatedTarget> validated;
    SafetyValidator validator(*svc_.inventory, {.require_removable = !cfg_.require_confirmation});
    r = validator.Validate(target_id, validated);
    if (!r.ok) return r;

    const DiskDevice& disk = validated->Disk();
    const CandidateScore* score = nullptr;
    auto it = std::find_if(scored.begin(), scored.end(),
                           [&](const ScoredDisk& s) { return s.disk.identifier == disk.identifier; });
    if (it != scored.end()) score = &it->score;

    ConfirmationGate gate(*svc_.confirm_in, *svc_.confirm_out,
                          {.require_confirmation = cfg_.require_confirmation,
                           .phrase = cfg_.confirmation_phrase});
    r = gate.Confirm(disk, score, image_path);
    if (!r.ok) return r;

    FlashJob job(image_path, std::move(*validated));
    Flasher flasher(*svc_.inventory,
                    {.block_size = static_cast<std::size_t>(cfg_.block_size_bytes),
                     .verify = cfg_.verify_flash,
                     .progress = svc_.progress});
    FlashReport report;
    r = flasher.Flash(job, report);
    if (!r.ok) return r;

    ReenumerationWaiter waiter(*svc_.inventory, *svc_.clock,
                               {.budget = std::chrono::seconds(cfg_.mount_wait_seconds)});
    r = waiter.Wait(job.target.Disk().identifier, out);
    if (!r.ok) return r;

    BootPartitionVerifier::Verify(out);
    return Result::Ok();
}

void PrintDiskTable(const std::vector<ScoredDisk>& disks, std::ostream& out) {
    char line[256];
    std::snprintf(line, sizeof(line), "%-16s %10s %-9s %-16s %-3s %s\n", "DEVICE", "SIZE", "REMOVABLE",
                  "PROTOCOL", "SD", "MODEL / REASON");
    out << line;
    for (const auto& s : disks) {
        std::snprintf(line, sizeof(line), "%-16s %10s %-9s %-16s %-3s %s (%s)\n", s.disk.path.c_str(),
                      HumanSize(s.disk.size_bytes).c_str(), RemovableName(s.disk.removable),
                      s.disk.protocol.empty() ? "-" : s.disk.protocol.c_str(),
                      s.score.candidate ? "yes" : "no", s.disk.DisplayName().c_str(),
                      s.score.reason.c_str());
        out << line;
    }
}

int ExitCodeFor(const Result& r) {
    if (r.ok) return 0;
    switch (r.kind) {
    case ErrorKind::UserAborted:
        return 3;
    case ErrorKind::Usage:
        return 2;
    default:
        return 1;
    }
}

} // namespace piprov
