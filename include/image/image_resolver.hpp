#pragma once

#include "image/http_client.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piprov {

inline constexpr const char* kLatestVersion = "latest";

// "latest" or a YYYY-MM-DD release date.
bool IsValidImageVersion(std::string_view spec);

struct ImageAsset {
    std::string version;
    std::string url;
    std::string file_name;
    std::string digest_url;
    std::string expected_digest; // filled from the sidecar by the downloader
};

class ImageResolver {
public:
    struct Options {
        std::string base_url = "https://downloads.raspberrypi.org";
        std::string os_flavor = "raspios_lite_armhf";
    };

    ImageResolver(IHttpClient& http, Options opt);

    // "latest" queries the index; an explicit date is validated and returned as is.
    Result ResolveVersion(const std::string& spec, std::string& out_version);
    Result ResolveAsset(const std::string& version, ImageAsset& out);
    Result Resolve(const std::string& spec, ImageAsset& out);

    std::string IndexUrl() const;
    std::string VersionDirUrl(const std::string& version) const;

    // Dates of every "<flavor>-YYYY-MM-DD" folder in a listing, newest first, deduplicated.
    static std::vector<std::string> ExtractVersions(std::string_view listing,
                                                    std::string_view os_flavor);
    // First "<version>-raspios-<codename>-<arch>[-<variant>].img.(xz|gz)" in a listing.
    static std::string ExtractImageFileName(std::string_view listing,
                                            std::string_view version,
                                            std::string_view os_flavor);

private:
    IHttpClient& http_;
    Options opt_;
};

} // namespace piprov
