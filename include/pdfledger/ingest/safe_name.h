#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::ingest {

// Base name without a recognized document extension (case-insensitive)
std::string documentStem(std::string_view baseName, const std::vector<std::string>& extensions);

/**
 * @brief Extraction directory name for a document.
 *
 * <stem with every character outside [A-Za-z0-9._-] replaced by '_'>-<first 12 hex chars of
 * SHA-256(baseName)>. Distinct base names never share a directory.
 */
std::string safeDestinationName(std::string_view baseName,
                                const std::vector<std::string>& extensions = {".pdf"});

} // namespace pdfledger::ingest
