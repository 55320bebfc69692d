#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "disk/flasher.hpp"
#include "fakes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace piprov {
namespace {

std::string Pattern(size_t n) {
    std::string s;
    s.reserve(n);
    for (size_t i = 0; i < n; ++i) s += static_cast<char>((i * 7 + 3) & 0xFF);
    return s;
}

std::string HexOf(const std::string& s) {
    return Sha256Hex(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

TEST(FlasherCopyTest, PadsFinalChunkToSector) {
    testutil::FakeDiskInventory inv;
    Flasher flasher(inv, {.block_size = 4096, .verify = false, .progress = nullptr});

    const std::string image = Pattern(10000);
    testutil::MemoryReader reader(image);
    reader.SetMaxChunk(777);
    testutil::MemoryWriter writer;
    FlashReport report;

    ASSERT_TRUE(flasher.Copy(reader, writer, report).ok);
    EXPECT_EQ(report.image_bytes, 10000u);
    EXPECT_EQ(report.written_bytes, 10240u);
    ASSERT_EQ(writer.data.size(), 10240u);
    EXPECT_EQ(writer.data.substr(0, 10000), image);
    EXPECT_EQ(writer.data.substr(10000), std::string(240, '\0'));
    EXPECT_EQ(report.sha256, HexOf(image));
    EXPECT_EQ(writer.fsyncs, 1);
}

TEST(FlasherCopyTest, SectorAlignedImageIsNotPadded) {
    testutil::FakeDiskInventory inv;
    Flasher flasher(inv, {.block_size = 1024, .verify = false, .progress = nullptr});

    const std::string image = Pattern(3 * 512);
    testutil::MemoryReader reader(image);
    testutil::MemoryWriter writer;
    FlashReport report;

    ASSERT_TRUE(flasher.Copy(reader, writer, report).ok);
    EXPECT_EQ(report.written_bytes, report.image_bytes);
    EXPECT_EQ(writer.data, image);
}

TEST(FlasherCopyTest, WriteFailureIsFlashError) {
    testutil::FakeDiskInventory inv;
    Flasher flasher(inv, {.block_size = 4096, .verify = false, .progress = nullptr});

    testutil::MemoryReader reader(Pattern(20000));
    testutil::MemoryWriter writer;
    writer.fail_after = 8192;
    FlashReport report;

    auto r = flasher.Copy(reader, writer, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
    EXPECT_EQ(r.err, 28);
}

TEST(FlasherCopyTest, EmptyImageIsRejected) {
    testutil::FakeDiskInventory inv;
    Flasher flasher(inv, {});
    testutil::MemoryReader reader(std::string{});
    testutil::MemoryWriter writer;
    FlashReport report;
    auto r = flasher.Copy(reader, writer, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
}

class FlasherTest : public ::testing::Test {
  protected:
    void SetUp() override {
        image_ = Pattern(300 * 1024 + 100);
        image_path_ = tmp_.File("raspios.img");
        device_path_ = tmp_.File("card.bin");
        testutil::WriteFile(image_path_, image_);

        DiskDevice card = testutil::MakeDisk("sdb", 32 * kGiB, Removable::Yes);
        card.mount_points = {"/media/pi/bootfs"};
        inv_.disks = {card};
        inv_.raw_override = device_path_;
    }

    std::optional<ValidatedTarget> Validated() {
        std::optional<ValidatedTarget> t;
        auto r = SafetyValidator(inv_).Validate("sdb", t);
        EXPECT_TRUE(r.ok) << r.msg;
        return t;
    }

    testutil::TemporaryDirectory tmp_;
    testutil::FakeDiskInventory inv_;
    std::string image_;
    std::string image_path_;
    std::string device_path_;
};

TEST_F(FlasherTest, WritesImageAndVerifies) {
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));

    Flasher flasher(inv_, {.block_size = 64 * 1024, .verify = true, .progress = nullptr});
    FlashReport report;
    auto r = flasher.Flash(job, report);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(job.device_path, device_path_);
    ASSERT_EQ(inv_.unmounted.size(), 1u);
    EXPECT_EQ(inv_.unmounted[0], "sdb");
    ASSERT_EQ(inv_.rescanned.size(), 1u);

    const std::string written = testutil::ReadFile(device_path_);
    EXPECT_EQ(written.size() % kSectorSize, 0u);
    EXPECT_EQ(written.substr(0, image_.size()), image_);
    EXPECT_EQ(report.sha256, HexOf(image_));
}

TEST_F(FlasherTest, UnmountsMountsAddedAfterValidation) {
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));
    inv_.disks[0].mount_points.push_back("/media/pi/rootfs");

    Flasher flasher(inv_, {});
    FlashReport report;
    ASSERT_TRUE(flasher.Flash(job, report).ok);
    EXPECT_EQ(inv_.unmounted_mount_points,
              (std::vector<std::string>{"/media/pi/bootfs", "/media/pi/rootfs"}));
}

TEST_F(FlasherTest, SwappedCardIsNotWritten) {
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));
    inv_.disks[0].size_bytes = 64 * kGiB;

    Flasher flasher(inv_, {});
    FlashReport report;
    auto r = flasher.Flash(job, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
    EXPECT_TRUE(inv_.unmounted.empty());
    EXPECT_FALSE(testutil::Exists(device_path_));

    inv_.disks.clear();
    EXPECT_EQ(flasher.Flash(job, report).kind, ErrorKind::Flash);
}

TEST_F(FlasherTest, UnmountFailureStopsBeforeWriting) {
    inv_.unmount_result = Result::Fail(16, "target is busy");
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));

    Flasher flasher(inv_, {});
    FlashReport report;
    auto r = flasher.Flash(job, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
    EXPECT_FALSE(testutil::Exists(device_path_));
}

TEST_F(FlasherTest, RescanFailureIsOnlyAWarning) {
    inv_.rescan_result = Result::Fail(22, "BLKRRPART failed");
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));

    Flasher flasher(inv_, {});
    FlashReport report;
    EXPECT_TRUE(flasher.Flash(job, report).ok);
}

TEST_F(FlasherTest, FallsBackToBlockPathWhenRawCannotOpen) {
    inv_.raw_override = tmp_.File("missing-dir/rdisk");
    inv_.disks[0].path = device_path_;
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(image_path_, std::move(*target));

    Flasher flasher(inv_, {});
    FlashReport report;
    ASSERT_TRUE(flasher.Flash(job, report).ok);
    EXPECT_EQ(job.device_path, device_path_);
    EXPECT_EQ(testutil::ReadFile(device_path_).substr(0, image_.size()), image_);
}

TEST_F(FlasherTest, MissingImageIsFlashError) {
    auto target = Validated();
    ASSERT_TRUE(target.has_value());
    FlashJob job(tmp_.File("nope.img"), std::move(*target));

    Flasher flasher(inv_, {});
    FlashReport report;
    auto r = flasher.Flash(job, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
}

} // namespace
} // namespace piprov
