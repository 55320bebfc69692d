#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace piprov::config {

inline constexpr const char* kDefaultConfigPath = "/etc/piprov/piprov.json";

struct ProvisionConfig {
    std::string image_version = "latest";
    std::string base_url = "https://downloads.raspberrypi.org";
    std::string os_flavor = "raspios_lite_armhf";
    std::string cache_dir = "cache/images";
    bool keep_cached_images = true;
    std::uint64_t required_free_bytes = 3ULL * 1024 * 1024 * 1024;

    bool auto_detect_sd = true;
    std::string target_disk;
    bool require_confirmation = true;
    std::string confirmation_phrase = "YES";

    bool verify_flash = false;
    std::uint64_t block_size_bytes = 4ULL * 1024 * 1024;
    std::uint32_t mount_wait_seconds = 30;
    std::string mount_base_dir = "/mnt";

    bool verbose = false;
    std::optional<std::string> log_level;

    void Reset();

    // Missing file is an error; callers decide whether a default path may be absent.
    Result LoadFile(const std::string& path);
    Result Validate() const;
};

} // namespace piprov::config
