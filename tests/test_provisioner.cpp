#include <gtest/gtest.h>

#include "app/provisioner.hpp"
#include "crypto/sha256.hpp"
#include "fakes.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace piprov {
namespace {

constexpr const char* kIndex = "https://downloads.example.org/raspios_lite_armhf/images/";
constexpr const char* kDir = "https://downloads.example.org/raspios_lite_armhf/images/raspios_lite_armhf-2024-03-15/";
constexpr const char* kFile = "2024-03-15-raspios-bookworm-armhf-lite.img.xz";

class ProvisionerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        cfg_.base_url = "https://downloads.example.org";
        cfg_.cache_dir = tmp_.File("cache");
        cfg_.required_free_bytes = 1024;
        cfg_.mount_wait_seconds = 5;

        for (int i = 0; i < 64 * 1024 + 17; ++i) image_ += static_cast<char>((i * 29) & 0xFF);
        const std::string compressed = testutil::Compress(image_, "xz");
        const std::string url = std::string(kDir) + kFile;
        http_.bodies[kIndex] = "<a href=\"raspios_lite_armhf-2024-03-15/\">raspios_lite_armhf-2024-03-15/</a>";
        http_.bodies[kDir] = std::string("<a href=\"") + kFile + "\">";
        http_.bodies[url] = compressed;
        http_.bodies[url + ".sha256"] =
            Sha256Hex(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(compressed.data()),
                                                    compressed.size())) +
            "  " + kFile + "\n";

        boot_dir_ = tmp_.File("bootfs");
        ::mkdir(boot_dir_.c_str(), 0755);
        testutil::WriteFile(boot_dir_ + "/config.txt", "");
        testutil::WriteFile(boot_dir_ + "/cmdline.txt", "");

        DiskDevice root = testutil::MakeDisk("sda", 500 * kGiB, Removable::No, "sata", "Samsung SSD");
        DiskDevice card = testutil::MakeDisk("sdb", 32 * kGiB, Removable::Yes, "usb", "SD/MMC");
        card.partitions = {{.identifier = "sdb1", .label = "bootfs", .fs_type = "vfat", .mount_point = boot_dir_}};
        DiskDevice big = testutil::MakeDisk("sdc", 1024 * kGiB, Removable::No, "usb", "Portable");
        inv_.disks = {root, card, big};
        inv_.raw_override = tmp_.File("card.bin");
    }

    Provisioner Make() {
        return Provisioner(cfg_, {.http = &http_,
                                  .inventory = &inv_,
                                  .clock = &clock_,
                                  .confirm_in = &in_,
                                  .confirm_out = &out_,
                                  .progress = nullptr});
    }

    testutil::TemporaryDirectory tmp_;
    config::ProvisionConfig cfg_;
    testutil::FakeHttpClient http_;
    testutil::FakeDiskInventory inv_;
    testutil::FakeClock clock_;
    std::istringstream in_;
    std::ostringstream out_;
    std::string image_;
    std::string boot_dir_;
};

TEST_F(ProvisionerTest, DownloadThenFlashEndToEnd) {
    auto p = Make();
    std::string image;
    auto r = p.DownloadImage("", image);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(testutil::ReadFile(image), image_);

    in_.str("YES\n");
    BootPartitionHandle boot;
    r = p.FlashImage(image, boot);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(boot.mount_point, boot_dir_);
    EXPECT_EQ(testutil::ReadFile(inv_.raw_override).substr(0, image_.size()), image_);
    EXPECT_NE(out_.str().find("/dev/sdb"), std::string::npos);
}

TEST_F(ProvisionerTest, DeclinedConfirmationLeavesCardUntouched) {
    testutil::WriteFile(tmp_.File("raspios.img"), image_);
    in_.str("no\n");
    auto p = Make();
    BootPartitionHandle boot;
    auto r = p.FlashImage(tmp_.File("raspios.img"), boot);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::UserAborted);
    EXPECT_EQ(ExitCodeFor(r), 3);
    EXPECT_TRUE(inv_.unmounted.empty());
    EXPECT_FALSE(testutil::Exists(inv_.raw_override));
}

TEST_F(ProvisionerTest, ExplicitRootTargetIsRefused) {
    testutil::WriteFile(tmp_.File("raspios.img"), image_);
    cfg_.target_disk = "/dev/sda";
    cfg_.require_confirmation = false;
    auto p = Make();
    BootPartitionHandle boot;
    auto r = p.FlashImage(tmp_.File("raspios.img"), boot);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::UnsafeTarget);
    EXPECT_FALSE(testutil::Exists(inv_.raw_override));
}

TEST_F(ProvisionerTest, UnattendedFlashRefusesFixedDisk) {
    testutil::WriteFile(tmp_.File("raspios.img"), image_);
    inv_.disks.push_back(testutil::MakeDisk("sdd", 480 * kGiB, Removable::No, "sata", "Crucial MX500"));
    cfg_.target_disk = "/dev/sdd";
    cfg_.require_confirmation = false;
    auto p = Make();
    BootPartitionHandle boot;
    auto r = p.FlashImage(tmp_.File("raspios.img"), boot);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::UnsafeTarget);
    EXPECT_NE(r.msg.find("not removable"), std::string::npos);
    EXPECT_TRUE(inv_.unmounted.empty());
    EXPECT_FALSE(testutil::Exists(inv_.raw_override));

    // The same disk is still offered to an operator who can say no.
    cfg_.require_confirmation = true;
    in_.str("no\n");
    EXPECT_EQ(Make().FlashImage(tmp_.File("raspios.img"), boot).kind, ErrorKind::UserAborted);
    EXPECT_NE(out_.str().find("/dev/sdd"), std::string::npos);
}

TEST_F(ProvisionerTest, MissingImageFailsBeforeDiskAccess) {
    auto p = Make();
    BootPartitionHandle boot;
    auto r = p.FlashImage(tmp_.File("absent.img"), boot);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Flash);
    EXPECT_EQ(inv_.describe_calls, 0);
}

TEST_F(ProvisionerTest, ListClassifiesNonRootDisks) {
    auto p = Make();
    std::vector<ScoredDisk> disks;
    ASSERT_TRUE(p.ListDisks(disks).ok);
    ASSERT_EQ(disks.size(), 2u);
    EXPECT_TRUE(disks[0].score.candidate);
    EXPECT_FALSE(disks[1].score.candidate);

    std::ostringstream table;
    PrintDiskTable(disks, table);
    EXPECT_NE(table.str().find("DEVICE"), std::string::npos);
    EXPECT_NE(table.str().find("/dev/sdb"), std::string::npos);
    EXPECT_NE(table.str().find("/dev/sdc"), std::string::npos);
    EXPECT_EQ(table.str().find("/dev/sda "), std::string::npos);
}

TEST(ExitCodeTest, MapsKinds) {
    EXPECT_EQ(ExitCodeFor(Result::Ok()), 0);
    EXPECT_EQ(ExitCodeFor(Result::Fail(ErrorKind::Usage, "bad")), 2);
    EXPECT_EQ(ExitCodeFor(Result::Fail(ErrorKind::UserAborted, "no")), 3);
    EXPECT_EQ(ExitCodeFor(Result::Fail(ErrorKind::ChecksumMismatch, "x")), 1);
}

} // namespace
} // namespace piprov
