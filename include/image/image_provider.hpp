#pragma once

#include "image/artifact_cache.hpp"
#include "image/http_client.hpp"
#include "image/image_resolver.hpp"
#include "image/verified_downloader.hpp"
#include "util/result.hpp"

#include <string>

namespace piprov {

// Resolve, then reuse or acquire. The one entry point behind "download".
class ImageProvider {
public:
    ImageProvider(IHttpClient& http,
                  const ArtifactCache& cache,
                  ImageResolver::Options resolver_opt,
                  VerifiedDownloader::Options download_opt);

    // `spec` is "latest" or YYYY-MM-DD. A cached image for the resolved version is
    // returned without touching the network beyond resolving "latest".
    Result Download(const std::string& spec, std::string& out_image_path);

private:
    IHttpClient& http_;
    const ArtifactCache& cache_;
    ImageResolver resolver_;
    VerifiedDownloader::Options download_opt_;
};

} // namespace piprov
