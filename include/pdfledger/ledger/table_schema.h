#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::ledger {

// Current objects.tsv schema
inline constexpr std::array<std::string_view, 22> kObjectColumns = {
    "Case Number",         "Filing Type",         "Filing Date",
    "SHA256 Hash Value",   "Pdf File Name",       "Pdf Internal Object Path",
    "Object Type",         "Font Name",           "Sig #1 Common Name",
    "Sig #2 Common Name",  "Author",              "Creator",
    "Sig #3 Common Name",  "Sig #4 Common Name",  "Sig #1 Signing Time",
    "Sig #2 Signing Time", "Sig #3 Signing Time", "Sig #4 Signing Time",
    "Sig #1 Byte Ranges",  "Sig #2 Byte Ranges",  "Sig #3 Byte Ranges",
    "Sig #4 Byte Ranges",
};

// The original five-column schema, migrated in place by padding
inline constexpr std::array<std::string_view, 5> kLegacyObjectColumns = {
    "SHA256 Hash Value", "Pdf File Name", "Pdf Internal Object Path", "Object Type", "Font Name",
};

inline constexpr size_t kLegacyLeadingPad = 3;
inline constexpr size_t kLegacyTrailingPad = 14;
static_assert(kLegacyLeadingPad + kLegacyObjectColumns.size() + kLegacyTrailingPad ==
              kObjectColumns.size());

// Zero-based column indexes used by readers
inline constexpr size_t kHashColumn = 3;
inline constexpr size_t kDocumentNameColumn = 4;
inline constexpr size_t kObjectPathColumn = 5;

enum class SchemaVersion {
    Empty,   ///< no header yet
    Legacy5, ///< old five-column header, needs migration
    Current, ///< matches kObjectColumns exactly
    Custom,  ///< anything else, passed through untouched
};

const char* schemaVersionName(SchemaVersion version);

std::string currentHeader();
std::string legacyHeader();

// Exact header match; no normalization of whitespace or case
SchemaVersion detectSchema(std::string_view headerLine);

// Legacy data row -> current layout: three blank leading fields, fourteen blank trailing fields
std::string padLegacyRow(std::string_view row);

/**
 * @brief Versioned schema transformer for objects.tsv.
 *
 * Given the table lines (header first), returns the migrated lines when the header is the
 * legacy schema, or the input unchanged for every other header. Row order is preserved.
 */
struct SchemaMigration {
    SchemaVersion from = SchemaVersion::Empty;
    bool changed = false;
    std::vector<std::string> lines;

    static SchemaMigration apply(std::vector<std::string> lines);
};

} // namespace pdfledger::ledger
