#include "image/image_provider.hpp"

#include "util/logger.hpp"

namespace piprov {

ImageProvider::ImageProvider(IHttpClient& http,
                             const ArtifactCache& cache,
                             ImageResolver::Options resolver_opt,
                             VerifiedDownloader::Options download_opt)
    : http_(http),
      cache_(cache),
      resolver_(http, std::move(resolver_opt)),
      download_opt_(download_opt) {}

Result ImageProvider::Download(const std::string& spec, std::string& out_image_path) {
    std::string version;
    auto r = resolver_.ResolveVersion(spec, version);
    if (!r.ok) return r;
    LogInfo("Image version: %s", version.c_str());

    if (auto cached = cache_.FindImage(version)) {
        LogInfo("Using cached image %s", cached->c_str());
        out_image_path = *cached;
        return Result::Ok();
    }

    ImageAsset asset;
    r = resolver_.ResolveAsset(version, asset);
    if (!r.ok) return r;

    VerifiedDownloader downloader(http_, cache_, download_opt_);
    CacheEntry entry;
    r = downloader.Acquire(asset, entry);
    if (!r.ok) return r;

    out_image_path = entry.decompressed_path;
    return Result::Ok();
}

} // namespace piprov
