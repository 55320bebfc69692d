#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "fakes.hpp"
#include "image/image_provider.hpp"
#include "image/verified_downloader.hpp"

#include <memory>
#include <string>

namespace piprov {
namespace {

constexpr const char* kBase = "https://downloads.example.org";
constexpr const char* kIndex = "https://downloads.example.org/raspios_lite_armhf/images/";
constexpr const char* kDir = "https://downloads.example.org/raspios_lite_armhf/images/raspios_lite_armhf-2024-03-15/";
constexpr const char* kFile = "2024-03-15-raspios-bookworm-armhf-lite.img.xz";

class FixedSpaceProbe final : public ArtifactCache::ISpaceProbe {
public:
    explicit FixedSpaceProbe(std::uint64_t free) : free_(free) {}
    Result FreeBytes(std::string_view, std::uint64_t& out) const override {
        out = free_;
        return Result::Ok();
    }

private:
    std::uint64_t free_;
};

std::string HexOf(const std::string& s) {
    return Sha256Hex(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

class VerifiedDownloaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        for (int i = 0; i < 256 * 1024; ++i) image_ += static_cast<char>((i * 131) & 0xFF);
        compressed_ = testutil::Compress(image_, "xz");
        url_ = std::string(kDir) + kFile;

        http_.bodies[kIndex] = "<a href=\"raspios_lite_armhf-2024-03-15/\">x</a>"
                               "<a href=\"raspios_lite_armhf-2023-12-11/\">y</a>";
        http_.bodies[kDir] = std::string("<a href=\"") + kFile + "\">" + kFile + "</a>";
        http_.bodies[url_] = compressed_;
        http_.bodies[url_ + ".sha256"] = HexOf(compressed_) + "  " + kFile + "\n";
    }

    ImageAsset Asset() const {
        ImageAsset a;
        a.version = "2024-03-15";
        a.file_name = kFile;
        a.url = url_;
        a.digest_url = url_ + ".sha256";
        return a;
    }

    VerifiedDownloader::Options Opts(bool keep = true) const {
        return {.required_free_bytes = 1024, .keep_compressed = keep, .progress = nullptr};
    }

    testutil::TemporaryDirectory tmp_;
    testutil::FakeHttpClient http_;
    std::string image_;
    std::string compressed_;
    std::string url_;
};

TEST_F(VerifiedDownloaderTest, DownloadsVerifiesAndDecompresses) {
    ArtifactCache cache(tmp_.Path());
    VerifiedDownloader dl(http_, cache, Opts());

    ImageAsset asset = Asset();
    CacheEntry entry;
    auto r = dl.Acquire(asset, entry);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_TRUE(entry.digest_verified);
    EXPECT_EQ(asset.expected_digest, HexOf(compressed_));
    EXPECT_EQ(testutil::ReadFile(entry.decompressed_path), image_);
    EXPECT_TRUE(testutil::Exists(entry.compressed_path));
    EXPECT_TRUE(testutil::Exists(entry.digest_path));
    EXPECT_FALSE(testutil::Exists(entry.partial_path));
}

TEST_F(VerifiedDownloaderTest, ChecksumMismatchDeletesArtifact) {
    http_.bodies[url_ + ".sha256"] = std::string(64, 'a') + "  " + kFile + "\n";
    ArtifactCache cache(tmp_.Path());
    VerifiedDownloader dl(http_, cache, Opts());

    ImageAsset asset = Asset();
    CacheEntry entry;
    auto r = dl.Acquire(asset, entry);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(testutil::Exists(entry.compressed_path));
    EXPECT_FALSE(testutil::Exists(entry.digest_path));
    EXPECT_FALSE(testutil::Exists(entry.decompressed_path));
}

TEST_F(VerifiedDownloaderTest, CachedCompressedArtifactIsReverified) {
    ArtifactCache cache(tmp_.Path());
    const CacheEntry layout = cache.EntryFor(Asset());
    testutil::WriteFile(layout.compressed_path, "tampered bytes");

    VerifiedDownloader dl(http_, cache, Opts());
    ImageAsset asset = Asset();
    CacheEntry entry;
    auto r = dl.Acquire(asset, entry);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(http_.CountRequests(url_), 0u);
    EXPECT_FALSE(testutil::Exists(layout.compressed_path));
}

TEST_F(VerifiedDownloaderTest, InsufficientSpaceStopsBeforeTransfer) {
    ArtifactCache cache(tmp_.Path(), std::make_shared<FixedSpaceProbe>(100));
    VerifiedDownloader dl(http_, cache, {.required_free_bytes = 3ULL * 1024 * 1024 * 1024});

    ImageAsset asset = Asset();
    CacheEntry entry;
    auto r = dl.Acquire(asset, entry);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::InsufficientSpace);
    EXPECT_TRUE(http_.requests.empty());
}

TEST_F(VerifiedDownloaderTest, InterruptedDownloadResumesFromPartialFile) {
    http_.truncate_file_at = compressed_.size() / 3;
    ArtifactCache cache(tmp_.Path());
    VerifiedDownloader dl(http_, cache, Opts());

    ImageAsset asset = Asset();
    CacheEntry entry;
    auto first = dl.Acquire(asset, entry);
    ASSERT_FALSE(first.ok);
    EXPECT_EQ(first.kind, ErrorKind::Download);
    EXPECT_EQ(testutil::ReadFile(entry.partial_path).size(), compressed_.size() / 3);

    auto second = dl.Acquire(asset, entry);
    ASSERT_TRUE(second.ok) << second.msg;
    ASSERT_EQ(http_.offsets.size(), 2u);
    EXPECT_EQ(http_.offsets[0], 0u);
    EXPECT_EQ(http_.offsets[1], compressed_.size() / 3);
    EXPECT_EQ(testutil::ReadFile(entry.decompressed_path), image_);
}

TEST_F(VerifiedDownloaderTest, DropsCompressedArtifactWhenNotKeeping) {
    ArtifactCache cache(tmp_.Path());
    VerifiedDownloader dl(http_, cache, Opts(false));

    ImageAsset asset = Asset();
    CacheEntry entry;
    ASSERT_TRUE(dl.Acquire(asset, entry).ok);
    EXPECT_FALSE(testutil::Exists(entry.compressed_path));
    EXPECT_FALSE(testutil::Exists(entry.digest_path));
    EXPECT_TRUE(testutil::Exists(entry.decompressed_path));
}

TEST_F(VerifiedDownloaderTest, MissingSidecarIsDownloadError) {
    http_.bodies.erase(url_ + ".sha256");
    ArtifactCache cache(tmp_.Path());
    VerifiedDownloader dl(http_, cache, Opts());

    ImageAsset asset = Asset();
    CacheEntry entry;
    auto r = dl.Acquire(asset, entry);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Download);
    EXPECT_FALSE(testutil::Exists(entry.decompressed_path));
}

TEST_F(VerifiedDownloaderTest, ProviderDownloadsRequestedVersion) {
    ArtifactCache cache(tmp_.Path());
    ImageProvider provider(http_, cache, {.base_url = kBase, .os_flavor = "raspios_lite_armhf"}, Opts());

    std::string path;
    auto r = provider.Download("2024-03-15", path);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(path, tmp_.File("raspios-2024-03-15.img"));
    EXPECT_EQ(testutil::ReadFile(path), image_);

    std::string digest;
    ASSERT_TRUE(Sha256HexFile(cache.EntryFor(Asset()).compressed_path, digest).ok);
    EXPECT_EQ(digest, HexOf(compressed_));
}

TEST_F(VerifiedDownloaderTest, ProviderSecondRunUsesCacheWithoutNetwork) {
    ArtifactCache cache(tmp_.Path());
    ImageProvider provider(http_, cache, {.base_url = kBase, .os_flavor = "raspios_lite_armhf"}, Opts());

    std::string first;
    ASSERT_TRUE(provider.Download("2024-03-15", first).ok);
    const size_t requests_after_first = http_.requests.size();

    std::string second;
    ASSERT_TRUE(provider.Download("2024-03-15", second).ok);
    EXPECT_EQ(second, first);
    EXPECT_EQ(http_.requests.size(), requests_after_first);
}

TEST_F(VerifiedDownloaderTest, ProviderLatestOnlyQueriesIndexWhenCached) {
    ArtifactCache cache(tmp_.Path());
    testutil::WriteFile(cache.ImagePathFor("2024-03-15"), image_);
    ImageProvider provider(http_, cache, {.base_url = kBase, .os_flavor = "raspios_lite_armhf"}, Opts());

    std::string path;
    ASSERT_TRUE(provider.Download("latest", path).ok);
    EXPECT_EQ(path, cache.ImagePathFor("2024-03-15"));
    ASSERT_EQ(http_.requests.size(), 1u);
    EXPECT_EQ(http_.requests[0], kIndex);
}

} // namespace
} // namespace piprov
