#pragma once

#include <pdfledger/core/types.h>
#include <pdfledger/ledger/table_schema.h>
#include <pdfledger/metadata/filename_parser.h>
#include <pdfledger/metadata/signature_report.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pdfledger::ledger {

// One extracted object with the denormalized attributes of its document
struct ObjectRow {
    metadata::FilingAttributes filing;
    std::string objectHash;
    std::string documentName;
    std::string objectPath; ///< relative to the objects directory
    std::string objectType; ///< lowercased ".ext" or blank
    std::string fontName;
    std::string author;
    std::string creator;
    metadata::SignatureBlocks signatures;

    // Fields in kObjectColumns order, sanitized for TSV
    std::vector<std::string> toFields() const;
    std::string toLine() const;
};

struct ObjectTableConfig {
    std::filesystem::path tablePath;
    std::filesystem::path lockFile;
};

// objects.tsv: append-only, guarded by its own lock file
class ObjectTable {
public:
    explicit ObjectTable(ObjectTableConfig config);

    /**
     * @brief Prepares the table for appends.
     *
     * Writes the header into a missing or empty table, repairs a torn final line, and migrates
     * a legacy five-column table in place (temp file + rename). Returns the schema found before
     * migration.
     */
    Result<SchemaVersion> ensureLayout();

    // All rows go out in a single write under the table lock
    Result<void> append(const std::vector<ObjectRow>& rows);

    // Data rows (header excluded), split into fields
    Result<std::vector<std::vector<std::string>>> readDataRows() const;

    // Column 4 of every data row that has one
    Result<std::vector<std::string>> hashColumn() const;

    Result<size_t> countRowsForDocument(std::string_view documentName) const;

    Result<size_t> dataRowCount() const;

    // Object paths of the document's rows at data row index firstRow or later
    Result<std::unordered_set<std::string>>
    objectPathsForDocument(std::string_view documentName, size_t firstRow = 0) const;

    const std::filesystem::path& path() const { return config_.tablePath; }

private:
    Result<std::vector<std::string>> readDataLines() const;

    ObjectTableConfig config_;
};

} // namespace pdfledger::ledger
