#include <gtest/gtest.h>

#include "disk/boot_partition_verifier.hpp"
#include "disk/reenumeration_waiter.hpp"
#include "fakes.hpp"

#include <chrono>
#include <vector>

namespace piprov {
namespace {

using namespace std::chrono_literals;

class ReenumerationWaiterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        DiskDevice card = testutil::MakeDisk("sdb", 32 * kGiB, Removable::Yes);
        card.partitions = {
            {.identifier = "sdb1", .label = "bootfs", .fs_type = "vfat", .mount_point = ""},
            {.identifier = "sdb2", .label = "rootfs", .fs_type = "ext4", .mount_point = ""},
        };
        inv_.disks = {card};
    }

    ReenumerationWaiter::Options Opts() const { return {.settle = 3000ms, .budget = 30000ms, .poll = 1000ms}; }

    testutil::FakeDiskInventory inv_;
    testutil::FakeClock clock_;
};

TEST_F(ReenumerationWaiterTest, AutoMountedOnFirstPoll) {
    inv_.disks[0].partitions[0].mount_point = "/media/pi/bootfs";
    ReenumerationWaiter waiter(inv_, clock_, Opts());

    BootPartitionHandle boot;
    auto r = waiter.Wait("sdb", boot);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(boot.mount_point, "/media/pi/bootfs");
    EXPECT_EQ(boot.partition_identifier, "sdb1");
    EXPECT_EQ(waiter.State(), WaitState::Mounted);
    EXPECT_EQ(waiter.History(),
              (std::vector<WaitState>{WaitState::WaitingForEnumeration, WaitState::Mounted}));
    EXPECT_EQ(clock_.Elapsed(), 3000ms);
    EXPECT_TRUE(inv_.mount_requests.empty());
}

TEST_F(ReenumerationWaiterTest, MountAppearsWhilePolling) {
    clock_.on_sleep = [this] {
        if (clock_.Elapsed() >= 6000ms) inv_.Find("sdb")->partitions[0].mount_point = "/media/pi/bootfs";
    };
    ReenumerationWaiter waiter(inv_, clock_, Opts());

    BootPartitionHandle boot;
    ASSERT_TRUE(waiter.Wait("sdb", boot).ok);
    EXPECT_EQ(boot.mount_point, "/media/pi/bootfs");
    EXPECT_EQ(waiter.History(), (std::vector<WaitState>{WaitState::WaitingForEnumeration,
                                                        WaitState::WaitingForMount, WaitState::Mounted}));
    EXPECT_EQ(clock_.Elapsed(), 6000ms);
    EXPECT_TRUE(inv_.mount_requests.empty());
}

TEST_F(ReenumerationWaiterTest, BudgetExhaustedFallsBackToOneManualMount) {
    ReenumerationWaiter waiter(inv_, clock_, Opts());

    BootPartitionHandle boot;
    auto r = waiter.Wait("sdb", boot);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(boot.mount_point, inv_.manual_mount_point);
    EXPECT_EQ(boot.partition_identifier, "sdb1");
    ASSERT_EQ(inv_.mount_requests.size(), 1u);
    EXPECT_EQ(inv_.mount_requests[0], "sdb1");
    EXPECT_EQ(clock_.Elapsed(), 30000ms);
    EXPECT_EQ(waiter.History().back(), WaitState::Mounted);
}

TEST_F(ReenumerationWaiterTest, ManualMountFailureIsMountTimeout) {
    inv_.mount_result = Result::Fail(19, "no such device");
    ReenumerationWaiter waiter(inv_, clock_, Opts());

    BootPartitionHandle boot;
    auto r = waiter.Wait("sdb", boot);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::MountTimeout);
    EXPECT_EQ(waiter.State(), WaitState::Failed);
    EXPECT_LE(clock_.Elapsed(), 30000ms);
    EXPECT_TRUE(boot.mount_point.empty());
}

TEST_F(ReenumerationWaiterTest, MissingDiskGuessesFirstPartition) {
    inv_.disks.clear();
    ReenumerationWaiter waiter(inv_, clock_, {.settle = 500ms, .budget = 2000ms, .poll = 700ms});

    BootPartitionHandle boot;
    ASSERT_TRUE(waiter.Wait("/dev/mmcblk0", boot).ok);
    ASSERT_EQ(inv_.mount_requests.size(), 1u);
    EXPECT_EQ(inv_.mount_requests[0], "mmcblk0p1");
    EXPECT_EQ(clock_.Elapsed(), 2000ms);
    // Never saw the partition, so no WaitingForMount.
    EXPECT_EQ(waiter.History(), (std::vector<WaitState>{WaitState::WaitingForEnumeration, WaitState::Mounted}));
}

TEST_F(ReenumerationWaiterTest, UnlabelledCardUsesFirstPartition) {
    inv_.disks[0].partitions[0].label = "";
    inv_.disks[0].partitions[0].mount_point = "/media/pi/1A2B-3C4D";
    ReenumerationWaiter waiter(inv_, clock_, Opts());

    BootPartitionHandle boot;
    ASSERT_TRUE(waiter.Wait("sdb", boot).ok);
    EXPECT_EQ(boot.partition_identifier, "sdb1");
    EXPECT_EQ(boot.mount_point, "/media/pi/1A2B-3C4D");
}

TEST_F(ReenumerationWaiterTest, SettleLongerThanBudgetIsClamped) {
    ReenumerationWaiter waiter(inv_, clock_, {.settle = 10000ms, .budget = 4000ms, .poll = 1000ms});
    BootPartitionHandle boot;
    ASSERT_TRUE(waiter.Wait("sdb", boot).ok);
    EXPECT_EQ(clock_.Elapsed(), 4000ms);
}

TEST(BootPartitionVerifierTest, ReportsMissingMarkers) {
    testutil::TemporaryDirectory tmp;
    BootPartitionHandle boot;
    boot.mount_point = tmp.Path();
    testutil::WriteFile(tmp.File("config.txt"), "dtparam=audio=on\n");

    EXPECT_EQ(BootPartitionVerifier::MissingMarkers(boot), std::vector<std::string>{"cmdline.txt"});
    EXPECT_FALSE(BootPartitionVerifier::Verify(boot));

    testutil::WriteFile(tmp.File("cmdline.txt"), "console=serial0,115200\n");
    EXPECT_TRUE(BootPartitionVerifier::MissingMarkers(boot).empty());
    EXPECT_TRUE(BootPartitionVerifier::Verify(boot));
}

} // namespace
} // namespace piprov
