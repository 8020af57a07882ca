#include <pdfledger/core/time_format.h>
#include <pdfledger/crypto/hasher.h>
#include <pdfledger/ingest/document_markers.h>
#include <pdfledger/ingest/processing_coordinator.h>
#include <pdfledger/ingest/quiescence.h>
#include <pdfledger/ingest/safe_name.h>
#include <pdfledger/metadata/filename_parser.h>
#include <pdfledger/metadata/signature_report.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

namespace pdfledger::ingest {

namespace {

constexpr std::array<std::string_view, 7> kFontExtensions = {
    ".ttf", ".otf", ".ttc", ".woff", ".woff2", ".pfb", ".pfa",
};

config::IngestConfig withResolvedPaths(config::IngestConfig config) {
    config.paths = config.paths.resolved();
    return config;
}

ProcessOutcome makeOutcome(ProcessState state, std::string hash, std::string message,
                           size_t rows = 0) {
    ProcessOutcome outcome;
    outcome.state = state;
    outcome.documentHash = std::move(hash);
    outcome.rowsEmitted = rows;
    outcome.message = std::move(message);
    return outcome;
}

} // namespace

const char* processStateName(ProcessState state) {
    switch (state) {
        case ProcessState::Unseen: return "unseen";
        case ProcessState::Quiescing: return "quiescing";
        case ProcessState::SkippedInFlight: return "skipped-in-flight";
        case ProcessState::SkippedProcessed: return "skipped-processed";
        case ProcessState::SkippedStampedReconciled: return "skipped-stamped-reconciled";
        case ProcessState::Extracting: return "extracting";
        case ProcessState::RowsEmitted: return "rows-emitted";
        case ProcessState::Stamped: return "stamped";
        case ProcessState::Ledgered: return "ledgered";
        case ProcessState::Failed: return "failed";
    }
    return "unknown";
}

bool ProcessingCoordinator::isFontExtension(std::string_view ext) {
    return std::find(kFontExtensions.begin(), kFontExtensions.end(), ext) !=
           kFontExtensions.end();
}

ProcessingCoordinator::ProcessingCoordinator(
    config::IngestConfig config, std::unique_ptr<tools::IObjectExtractor> extractor,
    std::unique_ptr<tools::IDocumentMetadataProvider> metadata,
    std::unique_ptr<tools::IFontNameProvider> fonts)
    : config_(withResolvedPaths(std::move(config))), extractor_(std::move(extractor)),
      metadata_(std::move(metadata)), fonts_(std::move(fonts)),
      dedup_(storage::DedupStoreConfig{config_.paths.hashedDir, config_.paths.lockDir / "dedup"}),
      objects_(ledger::ObjectTableConfig{config_.paths.objectsTable,
                                         config_.paths.lockDir / "objects.lock"}),
      ledger_(ledger::LedgerTableConfig{config_.paths.ledgerTable,
                                        config_.paths.lockDir / "processed.lock"}),
      counts_(ledger::CountProjectionConfig{config_.paths.countsTable,
                                            config_.paths.lockDir / "counts.lock"},
              objects_),
      guardOptions_{config_.paths.lockDir / "inflight", config_.guardStaleAfter} {}

ProcessingCoordinator::~ProcessingCoordinator() = default;

Result<void> ProcessingCoordinator::initialize() {
    const auto& paths = config_.paths;
    for (const auto& dir :
         {paths.inputDir, paths.objectsDir, paths.lockDir, guardOptions_.guardDir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         fmt::format("Cannot create {}: {}", dir.string(), ec.message())};
        }
    }

    if (auto r = dedup_.initialize(); !r) {
        return r;
    }

    auto schema = objects_.ensureLayout();
    if (!schema) {
        return schema.error();
    }
    spdlog::debug("Object table schema on open: {}", ledger::schemaVersionName(schema.value()));

    auto ledgered = ledger_.ensureLayout();
    if (!ledgered) {
        return ledgered.error();
    }
    spdlog::debug("{} documents in the ledger", ledgered.value());
    return {};
}

Result<ProcessOutcome> ProcessingCoordinator::process(const std::filesystem::path& document) {
    try {
        return processDocument(document);
    } catch (const std::exception& e) {
        spdlog::error("Processing {} failed: {}", document.filename().string(), e.what());
        return makeOutcome(ProcessState::Failed, {}, e.what());
    }
}

Result<ProcessOutcome>
ProcessingCoordinator::processDocument(const std::filesystem::path& document) {
    const std::string baseName = document.filename().string();

    waitForQuiescence(document,
                      QuiescencePolicy{config_.quiescenceAttempts, config_.quiescenceInterval});

    ledger::LedgerEntry entry;
    entry.documentName = baseName;
    try {
        auto hasher = crypto::createSHA256Hasher();
        entry.documentHash = hasher->hashFile(document);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot read {}: {}", baseName, e.what());
        return makeOutcome(ProcessState::Failed, {}, e.what());
    }

    struct stat st{};
    if (::stat(document.c_str(), &st) != 0) {
        std::string reason = std::strerror(errno);
        spdlog::warn("Cannot stat {}: {}", baseName, reason);
        return makeOutcome(ProcessState::Failed, entry.documentHash, reason);
    }
    entry.size = static_cast<std::uint64_t>(st.st_size);
    entry.mtime = static_cast<std::int64_t>(st.st_mtime);

    const std::string& hash = entry.documentHash;
    DocumentMarkers markers(config_.paths.objectsDir /
                            safeDestinationName(baseName, config_.documentExtensions));

    if (InFlightGuard::isHeld(guardOptions_, hash)) {
        spdlog::info("Skipping {} (in flight)", baseName);
        return makeOutcome(ProcessState::SkippedInFlight, hash, "in flight");
    }
    auto admission = checkAdmission(entry, markers);
    if (!admission) {
        return admission.error();
    }
    if (admission.value()) {
        return *admission.value();
    }

    auto guard = InFlightGuard::acquire(guardOptions_, hash);
    if (!guard) {
        if (guard.error().code == ErrorCode::OperationInProgress) {
            spdlog::info("Skipping {} (in flight)", baseName);
            return makeOutcome(ProcessState::SkippedInFlight, hash, "in flight");
        }
        return guard.error();
    }

    // Another worker may have finished between the checks above and the guard acquisition
    admission = checkAdmission(entry, markers);
    if (!admission) {
        return admission.error();
    }
    if (admission.value()) {
        return *admission.value();
    }

    return extractAndRecord(document, entry, markers);
}

Result<std::optional<ProcessOutcome>>
ProcessingCoordinator::checkAdmission(const ledger::LedgerEntry& entry,
                                      const DocumentMarkers& markers) {
    auto ledgered = ledger_.contains(entry.documentHash);
    if (!ledgered) {
        return ledgered.error();
    }
    if (ledgered.value()) {
        spdlog::info("Skipping {} (already processed)", entry.documentName);
        return std::optional<ProcessOutcome>{
            makeOutcome(ProcessState::SkippedProcessed, entry.documentHash, "already processed")};
    }

    if (!markers.stampMatches(entry.documentHash)) {
        return std::optional<ProcessOutcome>{};
    }

    ledger::LedgerEntry reconciled = entry;
    reconciled.completedAt = utcNowIso();
    auto appended = ledger_.appendIfAbsent(reconciled);
    if (!appended) {
        return appended.error();
    }
    if (appended.value()) {
        spdlog::info("Recorded {} in the ledger from its stamp", entry.documentName);
    }
    spdlog::info("Skipping {} (stamp says processed)", entry.documentName);
    return std::optional<ProcessOutcome>{makeOutcome(ProcessState::SkippedStampedReconciled,
                                                     entry.documentHash, "stamp says processed")};
}

Result<ProcessOutcome> ProcessingCoordinator::extractAndRecord(
    const std::filesystem::path& document, const ledger::LedgerEntry& entry,
    DocumentMarkers& markers) {
    const std::string& hash = entry.documentHash;
    const std::string& baseName = entry.documentName;

    spdlog::info("Extracting objects from {}", baseName);
    if (auto cleared = markers.clearExtracted(); !cleared) {
        spdlog::error("{}: {}", baseName, cleared.error().message);
        return makeOutcome(ProcessState::Failed, hash, cleared.error().message);
    }

    auto extracted = extractor_->extract(document, markers.destination());
    if (!extracted) {
        spdlog::error("Extraction of {} failed: {}", baseName, extracted.error().message);
        return makeOutcome(ProcessState::Failed, hash, extracted.error().message);
    }
    std::vector<std::filesystem::path> files;
    for (const auto& file : extracted.value()) {
        if (!DocumentMarkers::isMarker(file)) {
            files.push_back(file);
        }
    }
    std::sort(files.begin(), files.end());

    // Document-level attributes, shared by every row
    ledger::ObjectRow base;
    base.filing = metadata::parseFilingName(baseName, config_.documentExtensions);
    base.signatures = metadata::SignatureReportParser::parse(metadata_->signatureReport(document));
    auto ac = metadata_->authorCreator(document);
    base.author = std::move(ac.author);
    base.creator = std::move(ac.creator);
    base.documentName = baseName;

    // Rows from an interrupted earlier attempt on this content are already in the table. Rows
    // before the journaled position belong to older versions of a same-named document.
    std::unordered_set<std::string> alreadyRecorded;
    auto firstRow = markers.journalFirstRow(hash);
    if (firstRow) {
        auto existing = objects_.objectPathsForDocument(baseName, *firstRow);
        if (!existing) {
            return existing.error();
        }
        alreadyRecorded = std::move(existing).value();
        spdlog::info("Resuming {}: {} rows already recorded", baseName, alreadyRecorded.size());
    } else {
        auto rowCount = objects_.dataRowCount();
        if (!rowCount) {
            return rowCount.error();
        }
        firstRow = rowCount.value();
    }

    auto hasher = crypto::createSHA256Hasher();
    std::vector<ledger::ObjectRow> rows;
    rows.reserve(files.size());
    for (const auto& file : files) {
        ledger::ObjectRow row = base;
        try {
            row.objectHash = hasher->hashFile(file);
        } catch (const std::exception& e) {
            spdlog::error("Cannot hash extracted object {}: {}", file.string(), e.what());
            return makeOutcome(ProcessState::Failed, hash, e.what());
        }
        row.objectPath = file.lexically_relative(config_.paths.objectsDir).generic_string();
        row.objectType = storage::DedupStore::normalizedExtension(file);
        if (isFontExtension(row.objectType)) {
            row.fontName = fonts_->fontName(file);
        }

        auto stored = dedup_.submit(row.objectHash, file);
        if (!stored) {
            return stored.error();
        }
        if (alreadyRecorded.count(row.objectPath) == 0) {
            rows.push_back(std::move(row));
        }
    }

    if (auto r = markers.writeJournal(hash, *firstRow); !r) {
        return r.error();
    }
    if (auto r = objects_.append(rows); !r) {
        return r.error();
    }
    spdlog::debug("{}: {} rows emitted", baseName, rows.size());

    if (auto r = markers.writeStamp(hash); !r) {
        return r.error();
    }
    if (auto r = markers.removeJournal(); !r) {
        return r.error();
    }

    ledger::LedgerEntry completed = entry;
    completed.completedAt = utcNowIso();
    auto appended = ledger_.appendIfAbsent(completed);
    if (!appended) {
        return appended.error();
    }
    if (auto r = counts_.rebuild(); !r) {
        return r.error();
    }

    auto recorded = objects_.countRowsForDocument(baseName);
    if (!recorded) {
        return recorded.error();
    }
    spdlog::info("Processed {} → {} object-rows now recorded for this PDF", baseName,
                 recorded.value());
    return makeOutcome(ProcessState::Ledgered, hash, "processed", rows.size());
}

} // namespace pdfledger::ingest
