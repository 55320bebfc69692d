#include "image/verified_downloader.hpp"

#include "crypto/checksum_verifier.hpp"
#include "image/decompressor.hpp"
#include "io/device_writer.hpp"
#include "io/pending_file.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <span>

namespace piprov {

VerifiedDownloader::VerifiedDownloader(IHttpClient& http, const ArtifactCache& cache, Options opt)
    : http_(http), cache_(cache), opt_(opt) {}

Result VerifiedDownloader::DownloadCompressed(const ImageAsset& asset, const CacheEntry& entry) {
    const std::uint64_t offset = FileSizeOrZero(entry.partial_path);
    LogInfo("Downloading %s", asset.url.c_str());

    auto r = http_.FetchToFile(asset.url, entry.partial_path, offset, opt_.progress);
    if (!r.ok) {
        // The partial file stays for the next attempt.
        return r.As(ErrorKind::Download);
    }
    if (FileSizeOrZero(entry.partial_path) == 0) {
        return Result::Fail(ErrorKind::Download, "empty download from " + asset.url);
    }
    if (std::rename(entry.partial_path.c_str(), entry.compressed_path.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::Download, err,
                            "rename " + entry.partial_path + " -> " + entry.compressed_path +
                                " failed (" + std::strerror(err) + ")");
    }
    LogInfo("Download complete.");
    return Result::Ok();
}

Result VerifiedDownloader::FetchDigest(ImageAsset& asset, const CacheEntry& entry) {
    if (IsNonEmptyFile(entry.digest_path)) {
        auto r = ReadSidecarDigestFile(entry.digest_path, asset.expected_digest);
        if (r.ok) return r;
        LogWarn("Cached digest unusable (%s), fetching again", r.msg.c_str());
    }

    std::string body;
    auto r = http_.FetchText(asset.digest_url, body);
    if (!r.ok) return r.As(ErrorKind::Download);

    r = ParseSidecarDigest(body, asset.expected_digest);
    if (!r.ok) {
        r.msg += " (" + asset.digest_url + ")";
        return r;
    }

    PendingFile pending(entry.digest_path);
    DeviceWriter w;
    r = DeviceWriter::Open(pending.TempPath(), w);
    if (!r.ok) return r;
    r = w.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(body.data()), body.size()));
    if (!r.ok) return r;
    r = w.Close();
    if (!r.ok) return r;
    return pending.Commit();
}

Result VerifiedDownloader::Acquire(ImageAsset& asset, CacheEntry& entry) {
    entry = cache_.EntryFor(asset);

    if (IsNonEmptyFile(entry.decompressed_path)) {
        LogInfo("Decompressed image already exists: %s", entry.decompressed_path.c_str());
        return Result::Ok();
    }

    auto r = cache_.EnsureDir();
    if (!r.ok) return r;

    r = cache_.CheckFreeSpace(opt_.required_free_bytes);
    if (!r.ok) return r;

    if (IsNonEmptyFile(entry.compressed_path)) {
        LogInfo("Compressed image found in cache: %s", entry.compressed_path.c_str());
    } else {
        r = DownloadCompressed(asset, entry);
        if (!r.ok) return r;
    }

    r = FetchDigest(asset, entry);
    if (!r.ok) return r;

    ChecksumVerifier verifier(opt_.progress);
    r = verifier.VerifyFile(entry.compressed_path, asset.expected_digest);
    if (!r.ok) {
        if (r.kind == ErrorKind::ChecksumMismatch) {
            LogError("Checksum verification failed, removing %s", entry.compressed_path.c_str());
            cache_.DiscardCompressed(entry);
        }
        return r;
    }
    entry.digest_verified = true;
    LogInfo("Checksum OK.");

    Decompressor decompressor(opt_.progress);
    r = decompressor.Extract(entry.compressed_path, entry.decompressed_path);
    if (!r.ok) return r;

    if (!opt_.keep_compressed) {
        LogInfo("Removing compressed image %s", entry.compressed_path.c_str());
        cache_.DiscardCompressed(entry);
    }
    return Result::Ok();
}

} // namespace piprov
