#include "util/config_json_utils.hpp"

#include <fstream>

namespace piprov::config::detail {

namespace {

// Present-but-wrong-type keys are reported; absent keys keep the default.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ProvisionConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "ImageVersion", cfg.image_version, err) ||
        !GetStringIfPresent(j, "BaseUrl", cfg.base_url, err) ||
        !GetStringIfPresent(j, "OsFlavor", cfg.os_flavor, err) ||
        !GetStringIfPresent(j, "CacheDir", cfg.cache_dir, err) ||
        !GetBoolIfPresent(j, "KeepCachedImages", cfg.keep_cached_images, err) ||
        !GetU64IfPresent(j, "RequiredFreeBytes", cfg.required_free_bytes, err) ||
        !GetBoolIfPresent(j, "AutoDetectSd", cfg.auto_detect_sd, err) ||
        !GetStringIfPresent(j, "TargetDisk", cfg.target_disk, err) ||
        !GetBoolIfPresent(j, "RequireConfirmation", cfg.require_confirmation, err) ||
        !GetStringIfPresent(j, "ConfirmationPhrase", cfg.confirmation_phrase, err) ||
        !GetBoolIfPresent(j, "VerifyFlash", cfg.verify_flash, err) ||
        !GetU64IfPresent(j, "BlockSizeBytes", cfg.block_size_bytes, err) ||
        !GetStringIfPresent(j, "MountBaseDir", cfg.mount_base_dir, err) ||
        !GetBoolIfPresent(j, "Verbose", cfg.verbose, err)) {
        return false;
    }

    {
        std::uint64_t v = cfg.mount_wait_seconds;
        if (!GetU64IfPresent(j, "MountWaitSeconds", v, err))
            return false;
        if (v > 3600) {
            err = "MountWaitSeconds must be at most 3600";
            return false;
        }
        cfg.mount_wait_seconds = static_cast<std::uint32_t>(v);
    }
    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (!level.empty())
            cfg.log_level = level;
    }

    return true;
}

} // namespace piprov::config::detail
