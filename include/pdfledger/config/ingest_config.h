#pragma once

#include <pdfledger/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace pdfledger::config {

// Locations of every persisted artifact. Relative entries resolve against root.
struct LayoutPaths {
    std::filesystem::path root;
    std::filesystem::path inputDir{"pdf"};
    std::filesystem::path objectsDir{"pdf-objects"};
    std::filesystem::path hashedDir{"hashed-objects"};
    std::filesystem::path objectsTable{"objects.tsv"};
    std::filesystem::path ledgerTable{"processed.tsv"};
    std::filesystem::path countsTable{"hash-count.tsv"};
    std::filesystem::path lockDir{".locks"};

    // Returns a copy with every entry made absolute against root
    LayoutPaths resolved() const;
};

struct ToolNames {
    std::string mutool = "mutool";
    std::string pdfsig = "pdfsig";
    std::string exiftool = "exiftool";
    std::string otfinfo = "otfinfo";
    std::string fcScan = "fc-scan";
};

struct IngestConfig {
    LayoutPaths paths;
    ToolNames tools;

    std::chrono::seconds pollInterval{5};
    int quiescenceAttempts = 10;
    std::chrono::milliseconds quiescenceInterval{300};
    std::vector<std::string> documentExtensions{".pdf"};
    int jobs = 1;

    // 0 disables age-based reclamation of abandoned in-flight guards
    std::chrono::seconds guardStaleAfter{6 * 3600};

    std::string logLevel = "info";
    std::filesystem::path logFile;
};

// Reads the config file (if any) on top of the defaults. Missing keys keep their defaults.
Result<IngestConfig> loadIngestConfig(const std::filesystem::path& root,
                                      const std::filesystem::path& configFile);

// Case-insensitive match of path's extension against the configured document extensions
bool isDocumentPath(const std::filesystem::path& path, const std::vector<std::string>& extensions);

} // namespace pdfledger::config
