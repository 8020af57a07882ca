#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <string>

namespace pdfledger::cli {

// Process exit status
enum ExitStatus : int {
    kExitOk = 0,           ///< completed, even when individual documents failed
    kExitUsage = 1,        ///< bad arguments, bad config, or mutool missing
    kExitFatalStorage = 2, ///< a table or store write failed, or the ledger is corrupt
};

// Exit status for an error that ended the run
int exitStatusFor(const Error& error);

/**
 * @brief Installs the default logger: colored stderr, plus a rotating file when logFile is set.
 *
 * Unknown level names fall back to info.
 */
void configureLogging(const std::string& level, const std::filesystem::path& logFile);

// Entry point of the pdfledger executable
int runIngestCli(int argc, char** argv);

} // namespace pdfledger::cli
