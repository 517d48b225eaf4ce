#include <gtest/gtest.h>
#include "transfer/directory_copier.hpp"
#include "transfer/checksum_verifier.hpp"
#include "test_utils.hpp"
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class DirectoryCopierTest : public testutil::ScratchTest {
protected:
    TransferItem makeItem() {
        return TransferItem(TransferItem::generateId(), source_, destination_, true);
    }

    // 10 KB, empty and 1 MB files spread over two levels
    void writeSampleTree() {
        testutil::writeFile(source_ / "a.bin", 10000, 1);
        testutil::writeFile(source_ / "sub" / "b.bin", 0);
        testutil::writeFile(source_ / "sub" / "deeper" / "c.bin", 1000000, 3);
    }

    TransferConfig config_;
    CancellationToken token_;
};

TEST_F(DirectoryCopierTest, MirrorsTree) {
    writeSampleTree();
    config_.verifyChecksum = true;
    DirectoryCopier copier(config_, token_);
    auto item = makeItem();

    TransferResult result = copier.copy(item);

    ASSERT_FALSE(result.isFailure()) << result.message;
    EXPECT_EQ(item.getStatus(), TransferStatus::Completed);
    EXPECT_EQ(item.getBytesTransferred(), 1010000u);
    EXPECT_EQ(item.getTotalBytes(), 1010000u);
    EXPECT_EQ(item.snapshot().filesTransferred, 3u);
    for (const char* name : {"a.bin", "sub/b.bin", "sub/deeper/c.bin"}) {
        EXPECT_TRUE(ChecksumVerifier::matches(source_ / name, destination_ / name)) << name;
    }
}

TEST_F(DirectoryCopierTest, MeasureTreeSumsRegularFiles) {
    writeSampleTree();
    EXPECT_EQ(DirectoryCopier::measureTree(source_), 1010000u);
    EXPECT_EQ(DirectoryCopier::measureTree(root_ / "missing"), 0u);
}

TEST_F(DirectoryCopierTest, ProgressReportedPerFile) {
    writeSampleTree();
    DirectoryCopier copier(config_, token_);
    auto item = makeItem();

    std::vector<uint64_t> seen;
    copier.copy(item, [&seen](const TransferItem& current) {
        seen.push_back(current.getBytesTransferred());
    });

    // Files before subdirectories, each level sorted by name
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], 10000u);
    EXPECT_EQ(seen[1], 10000u);
    EXPECT_EQ(seen[2], 1010000u);
}

TEST_F(DirectoryCopierTest, CopiesEmptySubdirectories) {
    fs::create_directories(source_ / "empty" / "nested");
    DirectoryCopier copier(config_, token_);
    auto item = makeItem();

    ASSERT_FALSE(copier.copy(item).isFailure());
    EXPECT_EQ(item.getStatus(), TransferStatus::Completed);
    EXPECT_TRUE(fs::is_directory(destination_ / "empty" / "nested"));
}

// One bad file must not stop the rest of the tree
TEST_F(DirectoryCopierTest, UnreadableFileDoesNotStopOthers) {
    for (int i = 0; i < 9; ++i) {
        testutil::writeFile(source_ / ("file" + std::to_string(i) + ".bin"), 512, i);
    }
    fs::create_symlink(source_ / "gone.bin", source_ / "file_broken.bin");

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());

    TransferSnapshot snapshot = item.snapshot();
    EXPECT_EQ(snapshot.status, TransferStatus::Completed);
    EXPECT_EQ(snapshot.filesTransferred, 9u);
    EXPECT_EQ(snapshot.filesFailed, 1u);
    EXPECT_EQ(snapshot.bytesTransferred, 9u * 512u);
    for (int i = 0; i < 9; ++i) {
        EXPECT_TRUE(fs::exists(destination_ / ("file" + std::to_string(i) + ".bin")));
    }
    EXPECT_FALSE(fs::exists(fs::symlink_status(destination_ / "file_broken.bin")));
}

TEST_F(DirectoryCopierTest, PermissionDeniedFileDoesNotStopOthers) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can read any file";
    }
    testutil::writeFile(source_ / "ok.bin", 256);
    testutil::writeFile(source_ / "secret.bin", 256);
    fs::permissions(source_ / "secret.bin", fs::perms::none, fs::perm_options::replace);

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    TransferResult result = copier.copy(item);
    fs::permissions(source_ / "secret.bin", fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);

    ASSERT_FALSE(result.isFailure());
    EXPECT_EQ(item.snapshot().filesTransferred, 1u);
    EXPECT_EQ(item.snapshot().filesFailed, 1u);
    EXPECT_TRUE(fs::exists(destination_ / "ok.bin"));
}

TEST_F(DirectoryCopierTest, ExistingFilesAreSkipped) {
    writeSampleTree();
    testutil::writeText(destination_ / "a.bin", "keep me");

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());

    TransferSnapshot snapshot = item.snapshot();
    EXPECT_EQ(snapshot.status, TransferStatus::Completed);
    EXPECT_EQ(snapshot.filesSkipped, 1u);
    EXPECT_EQ(snapshot.filesTransferred, 2u);
    EXPECT_EQ(testutil::readFile(destination_ / "a.bin"), "keep me");
}

// A subdirectory that cannot be mirrored is skipped, the rest still copies
TEST_F(DirectoryCopierTest, UnmirrorableSubdirectoryIsSkipped) {
    testutil::writeFile(source_ / "a.bin", 100);
    testutil::writeFile(source_ / "sub" / "x.bin", 200);
    testutil::writeFile(source_ / "zeta" / "y.bin", 300);
    testutil::writeText(destination_ / "sub", "plain file in the way");

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());

    TransferSnapshot snapshot = item.snapshot();
    EXPECT_EQ(snapshot.status, TransferStatus::Completed);
    EXPECT_EQ(snapshot.filesTransferred, 2u);
    EXPECT_TRUE(fs::is_regular_file(destination_ / "sub"));
    EXPECT_EQ(testutil::readFile(destination_ / "sub"), "plain file in the way");
    EXPECT_FALSE(fs::exists(destination_ / "sub" / "x.bin"));
    EXPECT_TRUE(fs::exists(destination_ / "a.bin"));
    EXPECT_TRUE(fs::exists(destination_ / "zeta" / "y.bin"));
}

TEST_F(DirectoryCopierTest, OverwritePolicyReplacesExistingFiles) {
    writeSampleTree();
    testutil::writeText(destination_ / "a.bin", "old");

    DirectoryCopier copier(config_, token_, makeConflictResolver(ConflictPolicy::Overwrite));
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());

    TransferSnapshot snapshot = item.snapshot();
    EXPECT_EQ(snapshot.filesTransferred, 3u);
    EXPECT_EQ(snapshot.filesSkipped, 0u);
    EXPECT_TRUE(ChecksumVerifier::matches(source_ / "a.bin", destination_ / "a.bin"));
}

TEST_F(DirectoryCopierTest, ConfiguredPolicyAppliesWithoutResolver) {
    writeSampleTree();
    testutil::writeText(destination_ / "a.bin", "old");

    config_.conflictPolicy = ConflictPolicy::Overwrite;
    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());
    EXPECT_TRUE(ChecksumVerifier::matches(source_ / "a.bin", destination_ / "a.bin"));
}

TEST_F(DirectoryCopierTest, RenamePolicyKeepsExistingFiles) {
    writeSampleTree();
    testutil::writeText(destination_ / "a.bin", "old");

    DirectoryCopier copier(config_, token_, makeConflictResolver(ConflictPolicy::Rename));
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());

    EXPECT_EQ(item.snapshot().filesTransferred, 3u);
    EXPECT_EQ(testutil::readFile(destination_ / "a.bin"), "old");
    EXPECT_TRUE(ChecksumVerifier::matches(source_ / "a.bin", destination_ / "a (1).bin"));
    EXPECT_FALSE(fs::exists(destination_ / "sub" / "b (1).bin"));
}

// Rollback only removes what the item created; overwritten files stay
TEST_F(DirectoryCopierTest, CancelDuringOverwriteKeepsPreexistingFiles) {
    testutil::writeFile(source_ / "a.bin", 4000, 1);
    testutil::writeFile(source_ / "b.bin", 4000, 2);
    testutil::writeFile(source_ / "sub" / "c.bin", 4000, 3);
    testutil::writeText(destination_ / "a.bin", "old a");
    testutil::writeText(destination_ / "b.bin", "old b");

    DirectoryCopier copier(config_, token_, makeConflictResolver(ConflictPolicy::Overwrite));
    auto item = makeItem();
    TransferResult result = copier.copy(item, [this](const TransferItem&) {
        token_.cancel();
    });

    EXPECT_TRUE(result.isCancelled());
    EXPECT_TRUE(ChecksumVerifier::matches(source_ / "a.bin", destination_ / "a.bin"));
    EXPECT_EQ(testutil::readFile(destination_ / "b.bin"), "old b");
    EXPECT_FALSE(fs::exists(destination_ / "sub"));
}

TEST_F(DirectoryCopierTest, CancelAfterRenameRemovesRenamedCopy) {
    testutil::writeFile(source_ / "a.bin", 4000, 1);
    testutil::writeFile(source_ / "b.bin", 4000, 2);
    testutil::writeText(destination_ / "a.bin", "old a");

    DirectoryCopier copier(config_, token_, makeConflictResolver(ConflictPolicy::Rename));
    auto item = makeItem();
    TransferResult result = copier.copy(item, [this](const TransferItem&) {
        token_.cancel();
    });

    EXPECT_TRUE(result.isCancelled());
    EXPECT_EQ(testutil::readFile(destination_ / "a.bin"), "old a");
    EXPECT_FALSE(fs::exists(destination_ / "a (1).bin"));
    EXPECT_FALSE(fs::exists(destination_ / "b.bin"));
}

TEST_F(DirectoryCopierTest, DestinationInsideSourceIsRejected) {
    testutil::writeFile(source_ / "a.bin", 10);
    DirectoryCopier copier(config_, token_);
    TransferItem item(TransferItem::generateId(), source_, source_ / "backup", true);

    TransferResult result = copier.copy(item);
    EXPECT_EQ(result.code, TransferErrorCode::IOFailure);
    EXPECT_FALSE(fs::exists(source_ / "backup"));
    EXPECT_EQ(item.getStatus(), TransferStatus::Pending);

    TransferItem same(TransferItem::generateId(), source_, source_ / ".", true);
    EXPECT_EQ(copier.copy(same).code, TransferErrorCode::IOFailure);
}

TEST_F(DirectoryCopierTest, SiblingWithSharedPrefixIsAllowed) {
    testutil::writeFile(source_ / "a.bin", 10);
    DirectoryCopier copier(config_, token_);
    TransferItem item(TransferItem::generateId(), source_, root_ / "source-copy", true);

    ASSERT_FALSE(copier.copy(item).isFailure());
    EXPECT_TRUE(fs::exists(root_ / "source-copy" / "a.bin"));
}

TEST_F(DirectoryCopierTest, DirectoryLinksAreNotFollowed) {
    testutil::writeFile(source_ / "a.bin", 10);
    fs::create_directory_symlink(source_, source_ / "loop");

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    ASSERT_FALSE(copier.copy(item).isFailure());
    EXPECT_TRUE(fs::exists(destination_ / "a.bin"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(destination_ / "loop")));
}

TEST_F(DirectoryCopierTest, SourceMustBeDirectory) {
    testutil::writeText(root_ / "plain.txt", "x");
    DirectoryCopier copier(config_, token_);
    TransferItem item(TransferItem::generateId(), root_ / "plain.txt", destination_, true);

    TransferResult result = copier.copy(item);
    EXPECT_EQ(result.code, TransferErrorCode::IOFailure);
    EXPECT_FALSE(fs::exists(destination_));
}

TEST_F(DirectoryCopierTest, CancelRemovesCreatedRoot) {
    writeSampleTree();
    DirectoryCopier copier(config_, token_);
    auto item = makeItem();

    TransferResult result = copier.copy(item, [this](const TransferItem&) {
        token_.cancel();
    });

    EXPECT_TRUE(result.isCancelled());
    EXPECT_FALSE(fs::exists(destination_));
}

TEST_F(DirectoryCopierTest, CancelKeepsPreexistingContent) {
    writeSampleTree();
    testutil::writeText(destination_ / "keep.txt", "mine");

    DirectoryCopier copier(config_, token_);
    auto item = makeItem();
    TransferResult result = copier.copy(item, [this](const TransferItem&) {
        token_.cancel();
    });

    EXPECT_TRUE(result.isCancelled());
    EXPECT_TRUE(fs::is_directory(destination_));
    EXPECT_EQ(testutil::readFile(destination_ / "keep.txt"), "mine");
    EXPECT_FALSE(fs::exists(destination_ / "a.bin"));
    EXPECT_FALSE(fs::exists(destination_ / "sub"));
}
