#pragma once

#include <pdfledger/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::ledger {

// One fully processed document. Presence in processed.tsv is the exactly-once marker.
struct LedgerEntry {
    std::string documentHash;
    std::string documentName;
    std::uint64_t size = 0;
    std::int64_t mtime = 0; ///< epoch seconds
    std::string completedAt; ///< UTC, YYYY-MM-DDTHH:MM:SSZ

    std::string toLine() const;
    static Result<LedgerEntry> fromLine(std::string_view line);
};

inline constexpr size_t kLedgerFieldCount = 5;

struct LedgerTableConfig {
    std::filesystem::path tablePath;
    std::filesystem::path lockFile;
};

class LedgerTable {
public:
    explicit LedgerTable(LedgerTableConfig config);

    // Repairs a torn final line and validates every row; CorruptedData on a malformed row
    Result<size_t> ensureLayout();

    Result<bool> contains(std::string_view documentHash) const;

    Result<void> append(const LedgerEntry& entry);

    /**
     * @brief Appends the entry unless its hash is already recorded.
     *
     * The check and the append happen under one hold of the ledger lock, so concurrent callers
     * for the same hash record it once. Returns true when this call appended.
     */
    Result<bool> appendIfAbsent(const LedgerEntry& entry);

    Result<std::vector<LedgerEntry>> entries() const;

    const std::filesystem::path& path() const { return config_.tablePath; }

private:
    // Caller holds the ledger lock
    Result<std::vector<LedgerEntry>> readEntries() const;

    LedgerTableConfig config_;
};

} // namespace pdfledger::ledger
