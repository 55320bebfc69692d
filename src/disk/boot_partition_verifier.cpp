#include "disk/boot_partition_verifier.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace piprov {

std::vector<std::string> BootPartitionVerifier::MissingMarkers(const BootPartitionHandle& handle) {
    std::vector<std::string> missing;
    for (const auto& marker : handle.required_markers) {
        std::error_code ec;
        if (!std::filesystem::exists(JoinPath(handle.mount_point, marker), ec)) {
            missing.push_back(marker);
        }
    }
    return missing;
}

bool BootPartitionVerifier::Verify(const BootPartitionHandle& handle) {
    const auto missing = MissingMarkers(handle);
    for (const auto& m : missing) {
        LogWarn("%s not found on %s; the card may not be a Raspberry Pi OS boot partition",
                m.c_str(), handle.mount_point.c_str());
    }
    return missing.empty();
}

} // namespace piprov
