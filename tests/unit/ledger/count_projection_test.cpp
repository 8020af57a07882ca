#include "test_helpers.h"
#include <pdfledger/ledger/count_projection.h>
#include <pdfledger/ledger/object_table.h>

using namespace pdfledger;
using namespace pdfledger::ledger;
using namespace pdfledger::test;

TEST(CountProjectionComputeTest, OrdersByCountThenHash) {
    auto counts = CountProjection::compute({"b", "a", "c", "b", "a", "d", "b", ""});
    EXPECT_EQ(counts, (std::vector<HashCount>{{"b", 3}, {"a", 2}, {"c", 1}, {"d", 1}}));
}

TEST(CountProjectionComputeTest, RendersOneLinePerHash) {
    EXPECT_EQ(CountProjection::render({{"b", 3}, {"a", 1}}), "b\t3\na\t1\n");
    EXPECT_EQ(CountProjection::render({}), "");
}

class CountProjectionTest : public PdfLedgerTest {
protected:
    void SetUp() override {
        PdfLedgerTest::SetUp();
        objects = std::make_unique<ObjectTable>(
            ObjectTableConfig{testDir / "objects.tsv", testDir / ".locks" / "objects.lock"});
        ASSERT_TRUE(objects->ensureLayout());
        projection = std::make_unique<CountProjection>(
            CountProjectionConfig{testDir / "hash-count.tsv", testDir / ".locks" / "counts.lock"},
            *objects);
    }

    static ObjectRow row(std::string hash, std::string path) {
        ObjectRow r;
        r.objectHash = std::move(hash);
        r.documentName = "doc.pdf";
        r.objectPath = std::move(path);
        return r;
    }

    std::unique_ptr<ObjectTable> objects;
    std::unique_ptr<CountProjection> projection;
};

TEST_F(CountProjectionTest, EmptyTableWritesEmptyProjection) {
    auto distinct = projection->rebuild();
    ASSERT_TRUE(distinct);
    EXPECT_EQ(distinct.value(), 0u);
    EXPECT_TRUE(std::filesystem::exists(projection->path()));
    EXPECT_EQ(readFile(projection->path()), "");
}

TEST_F(CountProjectionTest, RebuildReflectsEveryRow) {
    ASSERT_TRUE(objects->append({row("h2", "a"), row("h1", "b"), row("h2", "c")}));
    auto distinct = projection->rebuild();
    ASSERT_TRUE(distinct);
    EXPECT_EQ(distinct.value(), 2u);
    EXPECT_EQ(readFile(projection->path()), "h2\t2\nh1\t1\n");

    ASSERT_TRUE(objects->append({row("h1", "d"), row("h1", "e")}));
    ASSERT_TRUE(projection->rebuild());
    EXPECT_EQ(readFile(projection->path()), "h1\t3\nh2\t2\n");
}

TEST_F(CountProjectionTest, RebuildReplacesStaleProjection) {
    writeFile("hash-count.tsv", "stale\t99\n");
    ASSERT_TRUE(objects->append({row("h1", "a")}));
    ASSERT_TRUE(projection->rebuild());
    EXPECT_EQ(readFile(projection->path()), "h1\t1\n");
}
