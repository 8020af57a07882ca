#include "test_helpers.h"
#include <pdfledger/storage/file_lock.h>

#include <thread>

using namespace pdfledger;
using namespace pdfledger::storage;
using namespace pdfledger::test;

class FileLockTest : public PdfLedgerTest {
protected:
    std::filesystem::path lockPath() const { return testDir / "locks" / "table.lock"; }
};

TEST_F(FileLockTest, AcquireCreatesLockFile) {
    auto lock = FileLock::acquire(lockPath());
    ASSERT_TRUE(lock);
    EXPECT_TRUE(lock.value().held());
    EXPECT_TRUE(std::filesystem::exists(lockPath()));
}

TEST_F(FileLockTest, SecondHolderIsExcludedUntilRelease) {
    auto first = FileLock::acquire(lockPath());
    ASSERT_TRUE(first);

    EXPECT_THAT(FileLock::tryAcquire(lockPath()), HasErrorCode(ErrorCode::OperationInProgress));

    auto held = std::move(first).value();
    held.release();
    EXPECT_FALSE(held.held());

    auto second = FileLock::tryAcquire(lockPath());
    EXPECT_TRUE(second);
}

TEST_F(FileLockTest, MoveTransfersOwnership) {
    auto acquired = FileLock::acquire(lockPath());
    ASSERT_TRUE(acquired);
    FileLock a = std::move(acquired).value();
    FileLock b = std::move(a);
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_FALSE(FileLock::tryAcquire(lockPath()));

    {
        FileLock c = std::move(b);
    }
    EXPECT_TRUE(FileLock::tryAcquire(lockPath()));
}

TEST_F(FileLockTest, SerializesThreads) {
    int counter = 0;
    int maxInside = 0;
    int inside = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 50; ++j) {
                auto lock = FileLock::acquire(lockPath());
                ASSERT_TRUE(lock);
                ++inside;
                maxInside = std::max(maxInside, inside);
                ++counter;
                --inside;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(counter, 200);
    EXPECT_EQ(maxInside, 1);
}
