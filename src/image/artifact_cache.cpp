#include "image/artifact_cache.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace piprov {

namespace {

class StatvfsSpaceProbe final : public ArtifactCache::ISpaceProbe {
public:
    Result FreeBytes(std::string_view path, std::uint64_t& out) const override {
        struct statvfs st{};
        if (::statvfs(std::string(path).c_str(), &st) != 0) {
            const int err = errno;
            return Result::Fail(err, "statvfs " + std::string(path) + " failed (" +
                                         std::strerror(err) + ")");
        }
        out = static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
        return Result::Ok();
    }
};

} // namespace

bool IsNonEmptyFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

std::uint64_t FileSizeOrZero(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return 0;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::shared_ptr<const ArtifactCache::ISpaceProbe> ArtifactCache::DefaultSpaceProbe() {
    static const std::shared_ptr<const ISpaceProbe> kDefault = std::make_shared<StatvfsSpaceProbe>();
    return kDefault;
}

ArtifactCache::ArtifactCache(std::string cache_dir)
    : ArtifactCache(std::move(cache_dir), nullptr) {}

ArtifactCache::ArtifactCache(std::string cache_dir, std::shared_ptr<const ISpaceProbe> space_probe)
    : dir_(std::move(cache_dir)),
      space_probe_(space_probe ? std::move(space_probe) : DefaultSpaceProbe()) {}

Result ArtifactCache::EnsureDir() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create cache directory " + dir_ + ": " + ec.message());
    }
    return Result::Ok();
}

std::string ArtifactCache::ImagePathFor(std::string_view version) const {
    return JoinPath(dir_, "raspios-" + std::string(version) + ".img");
}

std::optional<std::string> ArtifactCache::FindImage(std::string_view version) const {
    std::string path = ImagePathFor(version);
    if (IsNonEmptyFile(path)) return path;
    return std::nullopt;
}

CacheEntry ArtifactCache::EntryFor(const ImageAsset& asset) const {
    CacheEntry e;
    e.version = asset.version;
    e.compressed_path = JoinPath(dir_, asset.file_name);
    e.digest_path = e.compressed_path + ".sha256";
    e.partial_path = e.compressed_path + ".tmp";
    e.decompressed_path = ImagePathFor(asset.version);
    return e;
}

Result ArtifactCache::CheckFreeSpace(std::uint64_t required_bytes) const {
    std::uint64_t available = 0;
    auto r = space_probe_->FreeBytes(dir_, available);
    if (!r.ok) return r;

    LogDebug("Required: %s, Available: %s",
             HumanSize(required_bytes).c_str(), HumanSize(available).c_str());

    if (available < required_bytes) {
        return Result::Fail(ErrorKind::InsufficientSpace, ENOSPC,
                            "insufficient disk space in " + dir_ + ": required " +
                                HumanSize(required_bytes) + ", available " + HumanSize(available));
    }
    return Result::Ok();
}

void ArtifactCache::DiscardCompressed(const CacheEntry& entry) const {
    std::error_code ec;
    fs::remove(entry.compressed_path, ec);
    if (ec) LogWarn("cannot remove %s: %s", entry.compressed_path.c_str(), ec.message().c_str());
    fs::remove(entry.digest_path, ec);
    if (ec) LogWarn("cannot remove %s: %s", entry.digest_path.c_str(), ec.message().c_str());
}

} // namespace piprov
