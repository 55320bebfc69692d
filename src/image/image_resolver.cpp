#include "image/image_resolver.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <functional>
#include <regex>

namespace piprov {

namespace {

// "raspios_lite_armhf" -> "armhf-lite", "raspios_arm64" -> "arm64",
// "raspios_full_arm64" -> "arm64-full"
std::string FileSuffixForFlavor(std::string_view flavor) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= flavor.size()) {
        const size_t us = flavor.find('_', start);
        parts.emplace_back(flavor.substr(start, us == std::string_view::npos ? std::string_view::npos
                                                                               : us - start));
        if (us == std::string_view::npos) break;
        start = us + 1;
    }
    if (parts.size() >= 3) return parts.back() + "-" + parts[1];
    return parts.back();
}

} // namespace

bool IsValidImageVersion(std::string_view spec) {
    if (spec == kLatestVersion) return true;
    static const std::regex kDate(R"(^[0-9]{4}-(0[1-9]|1[0-2])-(0[1-9]|[12][0-9]|3[01])$)");
    return std::regex_match(spec.begin(), spec.end(), kDate);
}

ImageResolver::ImageResolver(IHttpClient& http, Options opt) : http_(http), opt_(std::move(opt)) {}

std::string ImageResolver::IndexUrl() const {
    return JoinPath(JoinPath(opt_.base_url, opt_.os_flavor), "images/");
}

std::string ImageResolver::VersionDirUrl(const std::string& version) const {
    return JoinPath(IndexUrl(), opt_.os_flavor + "-" + version + "/");
}

std::vector<std::string> ImageResolver::ExtractVersions(std::string_view listing,
                                                        std::string_view os_flavor) {
    const std::regex pattern(EscapeRegex(os_flavor) + R"(-([0-9]{4}-[0-9]{2}-[0-9]{2}))");
    std::vector<std::string> versions;
    for (std::cregex_iterator it(listing.data(), listing.data() + listing.size(), pattern), end;
         it != end; ++it) {
        versions.push_back((*it)[1].str());
    }
    // YYYY-MM-DD sorts chronologically as a plain string.
    std::sort(versions.begin(), versions.end(), std::greater<>());
    versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
    return versions;
}

std::string ImageResolver::ExtractImageFileName(std::string_view listing,
                                                std::string_view version,
                                                std::string_view os_flavor) {
    const std::regex pattern(EscapeRegex(version) + "-raspios-[a-z]+-" +
                             EscapeRegex(FileSuffixForFlavor(os_flavor)) + R"(\.img\.(xz|gz))");
    std::cmatch m;
    if (std::regex_search(listing.data(), listing.data() + listing.size(), m, pattern)) {
        return m[0].str();
    }
    return {};
}

Result ImageResolver::ResolveVersion(const std::string& spec, std::string& out_version) {
    if (!IsValidImageVersion(spec)) {
        return Result::Fail(ErrorKind::Resolution,
                            "image version must be 'latest' or YYYY-MM-DD (got '" + spec + "')");
    }
    if (spec != kLatestVersion) {
        out_version = spec;
        return Result::Ok();
    }

    LogInfo("Resolving latest %s version...", opt_.os_flavor.c_str());
    std::string listing;
    auto r = http_.FetchText(IndexUrl(), listing);
    if (!r.ok) {
        return Result::Fail(ErrorKind::Resolution, r.err,
                            "failed to fetch version list: " + r.msg);
    }

    const auto versions = ExtractVersions(listing, opt_.os_flavor);
    if (versions.empty()) {
        return Result::Fail(ErrorKind::Resolution, "no versions found at " + IndexUrl());
    }

    out_version = versions.front();
    LogInfo("Latest version: %s", out_version.c_str());
    return Result::Ok();
}

Result ImageResolver::ResolveAsset(const std::string& version, ImageAsset& out) {
    if (version == kLatestVersion || !IsValidImageVersion(version)) {
        return Result::Fail(ErrorKind::Resolution, "not a concrete image version: " + version);
    }

    const std::string dir_url = VersionDirUrl(version);
    LogDebug("Fetching file list from: %s", dir_url.c_str());

    std::string listing;
    auto r = http_.FetchText(dir_url, listing);
    if (!r.ok) {
        return Result::Fail(ErrorKind::Resolution, r.err,
                            "failed to fetch file list for " + version + ": " + r.msg);
    }

    const std::string file_name = ExtractImageFileName(listing, version, opt_.os_flavor);
    if (file_name.empty()) {
        return Result::Fail(ErrorKind::AssetNotFound,
                            "no image file matching the naming convention in " + dir_url);
    }

    out = ImageAsset{};
    out.version = version;
    out.file_name = file_name;
    out.url = JoinPath(dir_url, file_name);
    out.digest_url = out.url + ".sha256";
    LogDebug("Found image filename: %s", file_name.c_str());
    return Result::Ok();
}

Result ImageResolver::Resolve(const std::string& spec, ImageAsset& out) {
    std::string version;
    auto r = ResolveVersion(spec, version);
    if (!r.ok) return r;
    return ResolveAsset(version, out);
}

} // namespace piprov
