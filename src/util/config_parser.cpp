#include "util/config_parser.hpp"

#include "image/image_resolver.hpp"
#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

namespace piprov::config {

void ProvisionConfig::Reset() { *this = ProvisionConfig{}; }

Result ProvisionConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorKind::Config, "Config: " + err + " in " + path);
    }

    return Validate();
}

Result ProvisionConfig::Validate() const {
    if (!IsValidImageVersion(image_version)) {
        return Result::Fail(ErrorKind::Config,
                            "ImageVersion must be 'latest' or YYYY-MM-DD (got '" + image_version + "')");
    }
    if (base_url.empty() || os_flavor.empty()) {
        return Result::Fail(ErrorKind::Config, "BaseUrl and OsFlavor must not be empty");
    }
    if (cache_dir.empty()) {
        return Result::Fail(ErrorKind::Config, "CacheDir must not be empty");
    }
    if (block_size_bytes == 0 || block_size_bytes % 512 != 0) {
        return Result::Fail(ErrorKind::Config, "BlockSizeBytes must be a non-zero multiple of 512");
    }
    if (mount_wait_seconds == 0) {
        return Result::Fail(ErrorKind::Config, "MountWaitSeconds must be greater than zero");
    }
    if (require_confirmation && confirmation_phrase.empty()) {
        return Result::Fail(ErrorKind::Config, "ConfirmationPhrase must not be empty");
    }
    if (!auto_detect_sd && target_disk.empty()) {
        LogWarn("AutoDetectSd is false but TargetDisk is not set; --target is required for flash");
    }
    if (log_level) {
        LogLevel lvl{};
        if (!ParseLogLevel(*log_level, lvl)) {
            return Result::Fail(ErrorKind::Config, "LogLevel must be debug, info, warn, error or none");
        }
    }
    return Result::Ok();
}

} // namespace piprov::config
