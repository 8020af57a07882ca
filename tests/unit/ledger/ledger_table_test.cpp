#include "test_helpers.h"
#include <pdfledger/ledger/ledger_table.h>

#include <thread>

using namespace pdfledger;
using namespace pdfledger::ledger;
using namespace pdfledger::test;

class LedgerTableTest : public PdfLedgerTest {
protected:
    void SetUp() override {
        PdfLedgerTest::SetUp();
        ledger = std::make_unique<LedgerTable>(
            LedgerTableConfig{testDir / "processed.tsv", testDir / ".locks" / "processed.lock"});
    }

    static LedgerEntry entry(std::string hash, std::string name = "doc.pdf") {
        return LedgerEntry{std::move(hash), std::move(name), 1024, 1700000000,
                           "2024-01-05T10:11:12Z"};
    }

    std::unique_ptr<LedgerTable> ledger;
};

TEST(LedgerEntryTest, LineFormat) {
    LedgerEntry e{"abc", "MCRO_1.pdf", 42, 1700000000, "2024-01-05T10:11:12Z"};
    EXPECT_EQ(e.toLine(), "abc\tMCRO_1.pdf\t42\t1700000000\t2024-01-05T10:11:12Z");

    auto parsed = LedgerEntry::fromLine(e.toLine());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().documentHash, "abc");
    EXPECT_EQ(parsed.value().documentName, "MCRO_1.pdf");
    EXPECT_EQ(parsed.value().size, 42u);
    EXPECT_EQ(parsed.value().mtime, 1700000000);
}

TEST(LedgerEntryTest, MalformedLinesAreCorruption) {
    EXPECT_THAT(LedgerEntry::fromLine("abc\tdoc.pdf"), HasErrorCode(ErrorCode::CorruptedData));
    EXPECT_THAT(LedgerEntry::fromLine("abc\tdoc.pdf\tbig\t1\tnow"),
                HasErrorCode(ErrorCode::CorruptedData));
    EXPECT_THAT(LedgerEntry::fromLine("abc\tdoc.pdf\t1\t2\t3\textra"),
                HasErrorCode(ErrorCode::CorruptedData));
}

TEST_F(LedgerTableTest, AppendAndContains) {
    auto initial = ledger->ensureLayout();
    ASSERT_TRUE(initial);
    EXPECT_EQ(initial.value(), 0u);

    ASSERT_TRUE(ledger->append(entry("h1")));
    auto has = ledger->contains("h1");
    ASSERT_TRUE(has);
    EXPECT_TRUE(has.value());
    auto missing = ledger->contains("h2");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value());

    auto counted = ledger->ensureLayout();
    ASSERT_TRUE(counted);
    EXPECT_EQ(counted.value(), 1u);
}

TEST_F(LedgerTableTest, AppendIfAbsentRecordsOnce) {
    auto first = ledger->appendIfAbsent(entry("h1", "a.pdf"));
    ASSERT_TRUE(first);
    EXPECT_TRUE(first.value());

    auto second = ledger->appendIfAbsent(entry("h1", "b.pdf"));
    ASSERT_TRUE(second);
    EXPECT_FALSE(second.value());

    auto all = ledger->entries();
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].documentName, "a.pdf");
}

TEST_F(LedgerTableTest, ConcurrentAppendIfAbsentRecordsOnce) {
    std::atomic<int> appended{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto result = ledger->appendIfAbsent(entry("h1", fmt::format("copy-{}.pdf", i)));
            if (result && result.value()) {
                ++appended;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(appended.load(), 1);
    EXPECT_EQ(readAllLines(ledger->path()).size(), 1u);
}

TEST_F(LedgerTableTest, TornTailIsRepaired) {
    writeFile("processed.tsv", entry("h1").toLine() + "\n" + "h2\tdoc");
    auto count = ledger->ensureLayout();
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 1u);
    EXPECT_EQ(readFile(ledger->path()), entry("h1").toLine() + "\n");
}

TEST_F(LedgerTableTest, AppendAfterInterruptedWriterDropsPartialRow) {
    ASSERT_TRUE(ledger->ensureLayout());
    ASSERT_TRUE(ledger->append(entry("h1")));
    // Another process died halfway through its append after this one opened the table
    {
        std::ofstream out(ledger->path(), std::ios::binary | std::ios::app);
        out << "deadbeef\tpartial";
    }

    auto added = ledger->appendIfAbsent(entry("h2"));
    ASSERT_TRUE(added) << added.error().message;
    EXPECT_TRUE(added.value());
    ASSERT_TRUE(ledger->append(entry("h3")));

    auto all = ledger->entries();
    ASSERT_TRUE(all) << all.error().message;
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[1].documentHash, "h2");
    auto has = ledger->contains("deadbeef");
    ASSERT_TRUE(has);
    EXPECT_FALSE(has.value());
}

TEST_F(LedgerTableTest, CorruptRowFailsLayoutCheck) {
    writeFile("processed.tsv", entry("h1").toLine() + "\nnot-a-ledger-row\n");
    auto result = ledger->ensureLayout();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::CorruptedData);
    EXPECT_NE(result.error().message.find("processed.tsv:2"), std::string::npos);
}

TEST_F(LedgerTableTest, BlankLinesAreTolerated) {
    writeFile("processed.tsv", entry("h1").toLine() + "\n\n" + entry("h2").toLine() + "\n");
    auto count = ledger->ensureLayout();
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 2u);
}
