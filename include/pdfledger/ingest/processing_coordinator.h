#pragma once

#include <pdfledger/config/ingest_config.h>
#include <pdfledger/core/types.h>
#include <pdfledger/ingest/inflight_guard.h>
#include <pdfledger/ledger/count_projection.h>
#include <pdfledger/ledger/ledger_table.h>
#include <pdfledger/ledger/object_table.h>
#include <pdfledger/storage/dedup_store.h>
#include <pdfledger/tools/external_tools.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pdfledger::ingest {

class DocumentMarkers;

enum class ProcessState {
    Unseen,
    Quiescing,
    SkippedInFlight,
    SkippedProcessed,
    SkippedStampedReconciled,
    Extracting,
    RowsEmitted,
    Stamped,
    Ledgered,
    Failed,
};

const char* processStateName(ProcessState state);

struct ProcessOutcome {
    ProcessState state = ProcessState::Unseen;
    std::string documentHash;
    size_t rowsEmitted = 0;
    std::string message;

    bool skipped() const {
        return state == ProcessState::SkippedInFlight ||
               state == ProcessState::SkippedProcessed ||
               state == ProcessState::SkippedStampedReconciled;
    }
};

/**
 * @brief Drives one document from discovery to its ledger entry, exactly once.
 *
 * Per-document failures (unreadable document, extraction failure) come back as a Failed
 * outcome and leave the document eligible for a retry. Errors returned through Result are
 * table or store failures that should stop the invocation.
 *
 * Safe to call from several threads and processes at once against the same layout.
 */
class ProcessingCoordinator {
public:
    ProcessingCoordinator(config::IngestConfig config,
                          std::unique_ptr<tools::IObjectExtractor> extractor,
                          std::unique_ptr<tools::IDocumentMetadataProvider> metadata,
                          std::unique_ptr<tools::IFontNameProvider> fonts);
    ~ProcessingCoordinator();

    ProcessingCoordinator(const ProcessingCoordinator&) = delete;
    ProcessingCoordinator& operator=(const ProcessingCoordinator&) = delete;

    // Creates the directory layout, then prepares (and if needed migrates) the tables
    Result<void> initialize();

    Result<ProcessOutcome> process(const std::filesystem::path& document);

    const config::IngestConfig& config() const { return config_; }
    const ledger::ObjectTable& objectTable() const { return objects_; }
    const ledger::LedgerTable& ledgerTable() const { return ledger_; }
    const storage::DedupStore& dedupStore() const { return dedup_; }
    ledger::CountProjection& countProjection() { return counts_; }

    // Display name lookup applies to these extensions only
    static bool isFontExtension(std::string_view ext);

private:
    Result<ProcessOutcome> processDocument(const std::filesystem::path& document);

    // Ledger and stamp checks; an outcome when the document must be skipped
    Result<std::optional<ProcessOutcome>> checkAdmission(const ledger::LedgerEntry& entry,
                                                         const DocumentMarkers& markers);

    Result<ProcessOutcome> extractAndRecord(const std::filesystem::path& document,
                                            const ledger::LedgerEntry& entry,
                                            DocumentMarkers& markers);

    config::IngestConfig config_;
    std::unique_ptr<tools::IObjectExtractor> extractor_;
    std::unique_ptr<tools::IDocumentMetadataProvider> metadata_;
    std::unique_ptr<tools::IFontNameProvider> fonts_;

    storage::DedupStore dedup_;
    ledger::ObjectTable objects_;
    ledger::LedgerTable ledger_;
    ledger::CountProjection counts_;
    InFlightGuardOptions guardOptions_;
};

} // namespace pdfledger::ingest
