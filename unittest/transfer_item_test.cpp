#include <gtest/gtest.h>
#include "transfer/transfer_item.hpp"
#include <set>
#include <thread>

class TransferItemTest : public ::testing::Test {
protected:
    TransferItem makeItem(bool isDirectory = false) {
        return TransferItem("item-1", "/data/in/report.pdf", "/media/usb/report.pdf", isDirectory);
    }
};

TEST_F(TransferItemTest, NewItemIsPending) {
    auto item = makeItem();
    EXPECT_EQ(item.getStatus(), TransferStatus::Pending);
    EXPECT_EQ(item.getBytesTransferred(), 0u);
    EXPECT_FALSE(item.getStartedAt().has_value());
    EXPECT_FALSE(item.isFinished());
}

TEST_F(TransferItemTest, StartThenCompleteRecordsTimes) {
    auto item = makeItem();
    ASSERT_TRUE(item.startTransfer());
    EXPECT_EQ(item.getStatus(), TransferStatus::Transferring);
    ASSERT_TRUE(item.getStartedAt().has_value());

    item.setTotalBytes(4096);
    item.addBytes(4096);
    ASSERT_TRUE(item.complete(4096));

    EXPECT_EQ(item.getStatus(), TransferStatus::Completed);
    ASSERT_TRUE(item.getFinishedAt().has_value());
    EXPECT_GE(*item.getFinishedAt(), *item.getStartedAt());
    EXPECT_EQ(item.getBytesTransferred(), 4096u);
    EXPECT_DOUBLE_EQ(item.progressFraction(), 1.0);
}

// Terminal states never change again
TEST_F(TransferItemTest, TerminalStatesAreFinal) {
    auto item = makeItem();
    ASSERT_TRUE(item.startTransfer());
    ASSERT_TRUE(item.complete());

    EXPECT_FALSE(item.fail("late failure"));
    EXPECT_FALSE(item.skip("late skip"));
    EXPECT_FALSE(item.startTransfer());
    EXPECT_EQ(item.getStatus(), TransferStatus::Completed);
    EXPECT_TRUE(item.getError().empty());
}

TEST_F(TransferItemTest, PendingItemCanBeSkippedOrFailed) {
    auto skipped = makeItem();
    ASSERT_TRUE(skipped.skip("File already exists"));
    EXPECT_EQ(skipped.getStatus(), TransferStatus::Skipped);
    EXPECT_EQ(skipped.getError(), "File already exists");

    auto failed = makeItem(true);
    ASSERT_TRUE(failed.fail("Failed to create directory"));
    EXPECT_EQ(failed.getStatus(), TransferStatus::Failed);
}

TEST_F(TransferItemTest, PendingItemCannotComplete) {
    auto item = makeItem();
    EXPECT_FALSE(item.complete());
    EXPECT_EQ(item.getStatus(), TransferStatus::Pending);
}

TEST_F(TransferItemTest, FailureAlwaysCarriesReason) {
    auto item = makeItem();
    item.startTransfer();
    item.fail("");
    EXPECT_FALSE(item.getError().empty());
}

TEST_F(TransferItemTest, ProgressFraction) {
    auto item = makeItem();
    item.startTransfer();
    item.setTotalBytes(200);
    item.addBytes(50);
    EXPECT_DOUBLE_EQ(item.progressFraction(), 0.25);

    // A source that grew while copying raises the total instead of overshooting
    item.addBytes(300);
    EXPECT_EQ(item.getTotalBytes(), 350u);
    EXPECT_DOUBLE_EQ(item.progressFraction(), 1.0);
}

TEST_F(TransferItemTest, EmptyCompletedItemReportsFullProgress) {
    auto item = makeItem();
    EXPECT_DOUBLE_EQ(item.progressFraction(), 0.0);
    item.startTransfer();
    item.complete(0);
    EXPECT_DOUBLE_EQ(item.progressFraction(), 1.0);
}

TEST_F(TransferItemTest, SpeedIsZeroWithoutDuration) {
    auto item = makeItem();
    EXPECT_DOUBLE_EQ(item.duration(), 0.0);
    EXPECT_DOUBLE_EQ(item.speed(), 0.0);

    item.startTransfer();
    item.addBytes(1000);
    EXPECT_DOUBLE_EQ(item.speed(), 0.0);
}

TEST_F(TransferItemTest, SpeedUsesDuration) {
    auto item = makeItem();
    item.startTransfer();
    item.addBytes(1 << 20);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    item.complete();

    EXPECT_GT(item.duration(), 0.0);
    EXPECT_NEAR(item.speed(), (1 << 20) / item.duration(), 1e-6);
}

TEST_F(TransferItemTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(TransferItem::generateId());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(TransferItemTest, SnapshotCopiesState) {
    auto item = makeItem(true);
    item.startTransfer();
    item.setTotalBytes(100);
    item.addBytes(40);
    item.recordFileTransferred();
    item.recordFileFailed();

    TransferSnapshot snapshot = item.snapshot();
    item.addBytes(10);

    EXPECT_EQ(snapshot.id, "item-1");
    EXPECT_EQ(snapshot.source, "/data/in/report.pdf");
    EXPECT_EQ(snapshot.destination, "/media/usb/report.pdf");
    EXPECT_TRUE(snapshot.isDirectory);
    EXPECT_EQ(snapshot.status, TransferStatus::Transferring);
    EXPECT_EQ(snapshot.bytesTransferred, 40u);
    EXPECT_DOUBLE_EQ(snapshot.progressFraction, 0.4);
    EXPECT_EQ(snapshot.filesTransferred, 1u);
    EXPECT_EQ(snapshot.filesFailed, 1u);
}

TEST_F(TransferItemTest, StatusNames) {
    EXPECT_EQ(toString(TransferStatus::Pending), "pending");
    EXPECT_EQ(toString(TransferStatus::Transferring), "transferring");
    EXPECT_EQ(toString(TransferStatus::Skipped), "skipped");
    EXPECT_TRUE(isTerminal(TransferStatus::Failed));
    EXPECT_FALSE(isTerminal(TransferStatus::Transferring));
}
