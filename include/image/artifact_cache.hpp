#pragma once

#include "image/image_resolver.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace piprov {

struct CacheEntry {
    std::string version;
    std::string compressed_path;    // {cache_dir}/{filename}
    std::string digest_path;        // {cache_dir}/{filename}.sha256
    std::string partial_path;       // {cache_dir}/{filename}.tmp
    std::string decompressed_path;  // {cache_dir}/raspios-{version}.img
    bool digest_verified = false;
};

class ArtifactCache {
public:
    class ISpaceProbe {
    public:
        virtual ~ISpaceProbe() = default;
        virtual Result FreeBytes(std::string_view path, std::uint64_t& out) const = 0;
    };

    explicit ArtifactCache(std::string cache_dir);
    ArtifactCache(std::string cache_dir, std::shared_ptr<const ISpaceProbe> space_probe);

    const std::string& Dir() const { return dir_; }

    Result EnsureDir() const;

    std::string ImagePathFor(std::string_view version) const;
    // Path of a non-empty decompressed image for `version`, if present.
    std::optional<std::string> FindImage(std::string_view version) const;
    CacheEntry EntryFor(const ImageAsset& asset) const;

    // InsufficientSpace when the filesystem holding the cache has less than `required_bytes` free.
    Result CheckFreeSpace(std::uint64_t required_bytes) const;

    // Removes the compressed artifact and its sidecar; the decompressed image stays.
    void DiscardCompressed(const CacheEntry& entry) const;

private:
    static std::shared_ptr<const ISpaceProbe> DefaultSpaceProbe();

    std::string dir_;
    std::shared_ptr<const ISpaceProbe> space_probe_;
};

bool IsNonEmptyFile(const std::string& path);
std::uint64_t FileSizeOrZero(const std::string& path);

} // namespace piprov
