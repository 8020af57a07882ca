#include "test_helpers.h"
#include <pdfledger/ledger/object_table.h>
#include <pdfledger/ledger/tsv.h>

using namespace pdfledger;
using namespace pdfledger::ledger;
using namespace pdfledger::test;

class ObjectTableTest : public PdfLedgerTest {
protected:
    void SetUp() override {
        PdfLedgerTest::SetUp();
        table = std::make_unique<ObjectTable>(
            ObjectTableConfig{testDir / "objects.tsv", testDir / ".locks" / "objects.lock"});
    }

    static ObjectRow row(std::string hash, std::string doc, std::string path) {
        ObjectRow r;
        r.objectHash = std::move(hash);
        r.documentName = std::move(doc);
        r.objectPath = std::move(path);
        r.objectType = ".png";
        return r;
    }

    std::unique_ptr<ObjectTable> table;
};

TEST_F(ObjectTableTest, CreatesHeaderOnFirstUse) {
    auto version = table->ensureLayout();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), SchemaVersion::Empty);
    EXPECT_EQ(readFile(table->path()), currentHeader() + "\n");

    auto again = table->ensureLayout();
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), SchemaVersion::Current);
    EXPECT_EQ(readAllLines(table->path()).size(), 1u);
}

TEST_F(ObjectTableTest, RowFieldsFollowColumnOrder) {
    ObjectRow r = row("abc", "MCRO_1_Order.pdf", "MCRO_1_Order-0a1b/img-0001.png");
    r.filing = {"1", "Order", "2024-01-02"};
    r.fontName = "Helvetica";
    r.author = "Clerk\tOffice";
    r.creator = "Writer";
    r.signatures[0] = {"Jane", "2024-01-05 10:11:12", "[0 - 1]"};
    r.signatures[3] = {"Roe", "", "[2 - 3]"};

    auto fields = r.toFields();
    ASSERT_EQ(fields.size(), kObjectColumns.size());
    EXPECT_EQ(fields[0], "1");
    EXPECT_EQ(fields[1], "Order");
    EXPECT_EQ(fields[2], "2024-01-02");
    EXPECT_EQ(fields[kHashColumn], "abc");
    EXPECT_EQ(fields[kDocumentNameColumn], "MCRO_1_Order.pdf");
    EXPECT_EQ(fields[kObjectPathColumn], "MCRO_1_Order-0a1b/img-0001.png");
    EXPECT_EQ(fields[6], ".png");
    EXPECT_EQ(fields[7], "Helvetica");
    EXPECT_EQ(fields[8], "Jane");
    EXPECT_EQ(fields[10], "Clerk Office");
    EXPECT_EQ(fields[11], "Writer");
    EXPECT_EQ(fields[13], "Roe");
    EXPECT_EQ(fields[14], "2024-01-05 10:11:12");
    EXPECT_EQ(fields[18], "[0 - 1]");
    EXPECT_EQ(fields[21], "[2 - 3]");
}

TEST_F(ObjectTableTest, AppendAndQuery) {
    ASSERT_TRUE(table->ensureLayout());
    ASSERT_TRUE(table->append({row("h1", "a.pdf", "a/1.png"), row("h2", "a.pdf", "a/2.png"),
                               row("h1", "b.pdf", "b/1.png")}));
    ASSERT_TRUE(table->append({}));

    auto hashes = table->hashColumn();
    ASSERT_TRUE(hashes);
    EXPECT_EQ(hashes.value(), (std::vector<std::string>{"h1", "h2", "h1"}));

    auto countA = table->countRowsForDocument("a.pdf");
    ASSERT_TRUE(countA);
    EXPECT_EQ(countA.value(), 2u);

    auto paths = table->objectPathsForDocument("a.pdf");
    ASSERT_TRUE(paths);
    EXPECT_EQ(paths.value(), (std::unordered_set<std::string>{"a/1.png", "a/2.png"}));

    auto later = table->objectPathsForDocument("a.pdf", 1);
    ASSERT_TRUE(later);
    EXPECT_EQ(later.value(), std::unordered_set<std::string>{"a/2.png"});

    auto total = table->dataRowCount();
    ASSERT_TRUE(total);
    EXPECT_EQ(total.value(), 3u);

    auto none = table->countRowsForDocument("c.pdf");
    ASSERT_TRUE(none);
    EXPECT_EQ(none.value(), 0u);
}

TEST_F(ObjectTableTest, MigratesLegacyTableOnce) {
    writeFile("objects.tsv", legacyHeader() + "\n" + "h1\ta.pdf\ta/1.png\t.png\t\n" +
                                 "h2\ta.pdf\ta/2.ttf\t.ttf\tTimes\n");

    auto version = table->ensureLayout();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), SchemaVersion::Legacy5);

    auto lines = readAllLines(table->path());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], currentHeader());
    auto second = splitFields(lines[2]);
    ASSERT_EQ(second.size(), kObjectColumns.size());
    EXPECT_EQ(second[kHashColumn], "h2");
    EXPECT_EQ(second[7], "Times");
    EXPECT_EQ(second[0], "");

    // Running again finds the current schema and changes nothing
    auto before = readFile(table->path());
    auto again = table->ensureLayout();
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), SchemaVersion::Current);
    EXPECT_EQ(readFile(table->path()), before);
}

TEST_F(ObjectTableTest, CustomHeaderIsLeftUntouched) {
    auto content = std::string("My\tOwn\tColumns\nx\ty\tz\n");
    writeFile("objects.tsv", content);
    auto version = table->ensureLayout();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), SchemaVersion::Custom);
    EXPECT_EQ(readFile(table->path()), content);
}

TEST_F(ObjectTableTest, TornTailIsDroppedBeforeAppending) {
    writeFile("objects.tsv", currentHeader() + "\n" + row("h1", "a.pdf", "a/1").toLine() +
                                 "\n" + "h2\tinterrupt");
    auto version = table->ensureLayout();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), SchemaVersion::Current);

    ASSERT_TRUE(table->append({row("h3", "b.pdf", "b/1")}));
    auto hashes = table->hashColumn();
    ASSERT_TRUE(hashes);
    EXPECT_EQ(hashes.value(), (std::vector<std::string>{"h1", "h3"}));
}

TEST_F(ObjectTableTest, TornTailLeftAfterLayoutCheckIsDroppedOnAppend) {
    ASSERT_TRUE(table->ensureLayout());
    ASSERT_TRUE(table->append({row("h1", "a.pdf", "a/1")}));
    {
        std::ofstream out(table->path(), std::ios::binary | std::ios::app);
        out << "h2\tinterrupted\tmid";
    }

    ASSERT_TRUE(table->append({row("h3", "b.pdf", "b/1")}));
    auto rows = table->readDataRows();
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[1].size(), kObjectColumns.size());
    EXPECT_EQ(rows.value()[1][kHashColumn], "h3");
}

TEST_F(ObjectTableTest, RowsWithBlankHashAreNotCounted) {
    ASSERT_TRUE(table->ensureLayout());
    ASSERT_TRUE(table->append({row("", "a.pdf", "a/1"), row("h1", "a.pdf", "a/2")}));
    auto hashes = table->hashColumn();
    ASSERT_TRUE(hashes);
    EXPECT_EQ(hashes.value(), std::vector<std::string>{"h1"});
}
