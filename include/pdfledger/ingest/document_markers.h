#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pdfledger::ingest {

inline constexpr std::string_view kStampFileName = ".processed.sha";
inline constexpr std::string_view kRowJournalFileName = ".rows-pending.sha";

/**
 * @brief Per-document marker files kept in the extraction destination.
 *
 * The stamp records that the document with this hash finished extraction and row emission.
 * The row journal is present while rows are being appended; finding it on a retry means some
 * rows may already be in the object table. It records the object table's data row count taken
 * before the append, so only rows from that point on can belong to this attempt.
 */
class DocumentMarkers {
public:
    explicit DocumentMarkers(std::filesystem::path destination);

    Result<std::optional<std::string>> readStamp() const;
    bool stampMatches(std::string_view documentHash) const;
    Result<void> writeStamp(std::string_view documentHash);

    bool journalMatches(std::string_view documentHash) const;
    // First object table row the journaled attempt could have written, when the journal is for
    // this hash. A journal without a row count yields 0.
    std::optional<size_t> journalFirstRow(std::string_view documentHash) const;
    Result<void> writeJournal(std::string_view documentHash, size_t firstRow);
    Result<void> removeJournal();

    // Deletes everything in the destination except the markers
    Result<size_t> clearExtracted();

    const std::filesystem::path& destination() const { return destination_; }

    // Marker files and their in-progress temp files
    static bool isMarker(const std::filesystem::path& file);

private:
    Result<std::optional<std::string>> readMarker(std::string_view name) const;
    Result<void> writeMarker(std::string_view name, std::string_view content);

    std::filesystem::path destination_;
};

} // namespace pdfledger::ingest
