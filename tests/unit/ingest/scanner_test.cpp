#include "test_helpers.h"
#include <pdfledger/crypto/hasher.h>
#include <pdfledger/ingest/processing_coordinator.h>
#include <pdfledger/ingest/scanner.h>

#include <thread>

using namespace pdfledger;
using namespace pdfledger::ingest;
using namespace pdfledger::test;

namespace {

class CountingExtractor : public tools::IObjectExtractor {
public:
    Result<std::vector<std::filesystem::path>>
    extract(const std::filesystem::path& document,
            const std::filesystem::path& destination) override {
        ++calls;
        if (failNext.exchange(false)) {
            return Error{ErrorCode::ExtractionFailed, "simulated extraction failure"};
        }
        std::filesystem::create_directories(destination);
        std::ofstream(destination / "image-0001.png") << "image of " << document.filename();
        if (withFont) {
            std::ofstream(destination / "font-0002.ttf") << "font of " << document.filename();
        }
        return tools::listFilesRecursive(destination);
    }

    std::atomic<int> calls{0};
    std::atomic<bool> failNext{false};
    std::atomic<bool> withFont{false};
};

class BlankMetadata : public tools::IDocumentMetadataProvider {
public:
    tools::AuthorCreator authorCreator(const std::filesystem::path&) override { return {}; }
    std::string signatureReport(const std::filesystem::path&) override { return {}; }
};

// Can delete the font file it is asked about, as an outside cleanup racing the ingest would
class BlankFonts : public tools::IFontNameProvider {
public:
    std::string fontName(const std::filesystem::path& file) override {
        if (removeFile) {
            std::error_code ec;
            std::filesystem::remove(file, ec);
        }
        return {};
    }

    std::atomic<bool> removeFile{false};
};

std::string hashOf(std::string_view content) {
    return crypto::createSHA256Hasher()->hash(content);
}

} // namespace

class ScannerTest : public PdfLedgerTest {
protected:
    void SetUp() override {
        PdfLedgerTest::SetUp();
        config::IngestConfig cfg;
        cfg.paths.root = testDir;
        cfg.quiescenceAttempts = 2;
        cfg.quiescenceInterval = std::chrono::milliseconds(1);
        cfg.pollInterval = std::chrono::seconds(1);

        auto owned = std::make_unique<CountingExtractor>();
        extractor = owned.get();
        auto ownedFonts = std::make_unique<BlankFonts>();
        fonts = ownedFonts.get();
        coordinator = std::make_unique<ProcessingCoordinator>(
            cfg, std::move(owned), std::make_unique<BlankMetadata>(), std::move(ownedFonts));
        ASSERT_TRUE(coordinator->initialize());
    }

    std::filesystem::path addDocument(const std::string& name, std::string_view content) {
        return writeFile(testDir / "pdf" / name, content);
    }

    bool ledgered(std::string_view content) {
        auto found = coordinator->ledgerTable().contains(hashOf(content));
        return found && found.value();
    }

    bool waitUntilLedgered(std::string_view content, std::chrono::seconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (ledgered(content)) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return ledgered(content);
    }

    CountingExtractor* extractor = nullptr;
    BlankFonts* fonts = nullptr;
    std::unique_ptr<ProcessingCoordinator> coordinator;
};

TEST_F(ScannerTest, ListsDocumentCandidatesSorted) {
    addDocument("b.pdf", "b");
    addDocument("A.PDF", "a");
    addDocument("notes.txt", "n");
    addDocument("upload.pdf.part", "p");
    std::filesystem::create_directories(testDir / "pdf" / "folder.pdf");

    Scanner scanner(*coordinator);
    auto candidates = scanner.listCandidates();
    ASSERT_TRUE(candidates);
    ASSERT_EQ(candidates.value().size(), 2u);
    EXPECT_EQ(candidates.value()[0].filename(), "A.PDF");
    EXPECT_EQ(candidates.value()[1].filename(), "b.pdf");
}

TEST_F(ScannerTest, ScanOnceProcessesEachDistinctDocument) {
    addDocument("one.pdf", "content one");
    addDocument("two.pdf", "content two");
    addDocument("one-copy.pdf", "content one");

    Scanner scanner(*coordinator);
    auto summary = scanner.scanOnce();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().candidates, 3u);
    EXPECT_EQ(summary.value().processed, 2u);
    EXPECT_EQ(summary.value().skipped, 1u);
    EXPECT_EQ(summary.value().failed, 0u);

    auto again = scanner.scanOnce();
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().processed, 0u);
    EXPECT_EQ(again.value().skipped, 3u);
    EXPECT_EQ(extractor->calls.load(), 2);
}

TEST_F(ScannerTest, ParallelWorkersProcessEachContentOnce) {
    for (int i = 0; i < 12; ++i) {
        addDocument(fmt::format("doc-{:02}.pdf", i), fmt::format("content {}", i % 4));
    }

    Scanner scanner(*coordinator, 4);
    auto summary = scanner.scanOnce();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().candidates, 12u);
    EXPECT_EQ(summary.value().processed, 4u);
    EXPECT_EQ(summary.value().skipped, 8u);
    EXPECT_EQ(extractor->calls.load(), 4);

    auto entries = coordinator->ledgerTable().entries();
    ASSERT_TRUE(entries);
    EXPECT_EQ(entries.value().size(), 4u);
}

TEST_F(ScannerTest, FailuresAreCountedAndReported) {
    auto doc = addDocument("flaky.pdf", "flaky");
    extractor->failNext = true;

    Scanner scanner(*coordinator);
    auto summary = scanner.scanOnce();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().failed, 1u);
    ASSERT_EQ(summary.value().failedDocuments.size(), 1u);
    EXPECT_EQ(summary.value().failedDocuments[0], doc);
}

TEST_F(ScannerTest, DocumentScopedErrorDoesNotStopTheScan) {
    auto vanishing = addDocument("a-vanishing.pdf", "vanishing");
    addDocument("b-steady.pdf", "steady");
    extractor->withFont = true;
    fonts->removeFile = true;

    Scanner scanner(*coordinator);
    auto summary = scanner.scanOnce();
    ASSERT_TRUE(summary) << summary.error().message;
    EXPECT_EQ(summary.value().candidates, 2u);
    EXPECT_EQ(summary.value().failed, 2u);
    ASSERT_EQ(summary.value().failedDocuments.size(), 2u);
    EXPECT_EQ(summary.value().failedDocuments[0], vanishing);
    EXPECT_FALSE(ledgered("vanishing"));

    fonts->removeFile = false;
    auto retried = scanner.scanOnce();
    ASSERT_TRUE(retried) << retried.error().message;
    EXPECT_EQ(retried.value().processed, 2u);
    EXPECT_TRUE(ledgered("vanishing"));
    EXPECT_TRUE(ledgered("steady"));
}

TEST_F(ScannerTest, EmptyInputIsNotAnError) {
    Scanner scanner(*coordinator);
    auto summary = scanner.scanOnce();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().candidates, 0u);
}

TEST_F(ScannerTest, WatchReturnsAfterCatchUpWhenStopped) {
    addDocument("early.pdf", "early");
    std::atomic<bool> stop{true};

    Scanner scanner(*coordinator);
    ASSERT_TRUE(scanner.watch(stop));
    EXPECT_TRUE(ledgered("early"));
}

TEST_F(ScannerTest, WatchPicksUpNewDocuments) {
    std::atomic<bool> stop{false};
    Scanner scanner(*coordinator);
    Result<void> watched;
    std::thread watcher([&] { watched = scanner.watch(stop); });

    // Written elsewhere and moved in, so the document appears complete
    auto staged = writeFile("staging/new.pdf", "arrived later");
    std::filesystem::rename(staged, testDir / "pdf" / "new.pdf");

    bool picked = waitUntilLedgered("arrived later", std::chrono::seconds(10));
    stop = true;
    watcher.join();
    EXPECT_TRUE(picked);
    EXPECT_TRUE(watched);
}

TEST_F(ScannerTest, WatchRetriesFailedDocuments) {
    addDocument("retry.pdf", "retry me");
    extractor->failNext = true;

    std::atomic<bool> stop{false};
    Scanner scanner(*coordinator);
    Result<void> watched;
    std::thread watcher([&] { watched = scanner.watch(stop); });

    bool picked = waitUntilLedgered("retry me", std::chrono::seconds(10));
    stop = true;
    watcher.join();
    EXPECT_TRUE(picked);
    EXPECT_TRUE(watched);
    EXPECT_EQ(extractor->calls.load(), 2);
}

TEST_F(ScannerTest, DirectoryWatcherReportsNewEntries) {
    auto dir = testDir / "watched";
    std::filesystem::create_directories(dir);
    auto opened = DirectoryWatcher::open(dir);
    ASSERT_TRUE(opened);
    auto watcher = std::move(opened).value();

    auto quiet = watcher.waitForChanges(std::chrono::milliseconds(10));
    ASSERT_TRUE(quiet);
    EXPECT_TRUE(quiet.value().empty());

    writeFile(dir / "x.pdf", "x");
    std::filesystem::create_directories(dir / "sub");
    auto changed = watcher.waitForChanges(std::chrono::milliseconds(2000));
    ASSERT_TRUE(changed);
    EXPECT_EQ(changed.value(), std::vector<std::string>{"x.pdf"});

    EXPECT_FALSE(DirectoryWatcher::open(testDir / "absent"));
}
