#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::ledger {

// Splits on every tab; "a\t\tb" yields three fields, "" yields one empty field
std::vector<std::string> splitFields(std::string_view line);

std::string joinFields(const std::vector<std::string>& fields);

// Tabs, carriage returns and newlines would break the row structure; they become spaces
std::string sanitizeField(std::string_view value);

// Reads all complete lines (without their newline). A missing file reads as empty.
Result<std::vector<std::string>> readLines(const std::filesystem::path& path);

/**
 * @brief Appends text and flushes. The caller holds the table lock.
 *
 * A torn final line left by a writer that died mid-append is repaired first (see
 * repairTornTail), so new rows never land on the end of a partial one.
 */
Result<void> appendText(const std::filesystem::path& path, std::string_view text,
                        bool keepFirstLine);

/**
 * @brief Drops an incomplete final line left by an interrupted append.
 *
 * When the file does not end in a newline, everything after the last newline is truncated. If
 * the incomplete line is the first line of a table with a header (keepFirstLine), it is
 * completed with a newline instead. Returns true when the file was changed.
 */
Result<bool> repairTornTail(const std::filesystem::path& path, bool keepFirstLine);

} // namespace pdfledger::ledger
