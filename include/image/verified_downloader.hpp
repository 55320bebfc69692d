#pragma once

#include "image/artifact_cache.hpp"
#include "image/http_client.hpp"
#include "image/image_resolver.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstdint>

namespace piprov {

// Brings an image into the cache as a decompressed .img whose compressed source
// matched its published SHA-256. Partial downloads are resumed.
class VerifiedDownloader {
public:
    struct Options {
        std::uint64_t required_free_bytes = 3ull * 1024 * 1024 * 1024;
        bool keep_compressed = true;
        IProgress* progress = nullptr;
    };

    VerifiedDownloader(IHttpClient& http, const ArtifactCache& cache, Options opt);

    // On success `entry.decompressed_path` names the image.
    Result Acquire(ImageAsset& asset, CacheEntry& entry);

private:
    Result DownloadCompressed(const ImageAsset& asset, const CacheEntry& entry);
    Result FetchDigest(ImageAsset& asset, const CacheEntry& entry);

    IHttpClient& http_;
    const ArtifactCache& cache_;
    Options opt_;
};

} // namespace piprov
