#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pdfledger::tools {

/**
 * @brief Command line of an external tool invocation
 *
 * The executable is resolved through PATH by execvp; no shell is involved, so arguments are
 * passed verbatim.
 */
struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> workdir;
};

struct ProcessResult {
    int exitCode = -1;
    std::string output; ///< Captured stdout; stderr is discarded
};

/**
 * @brief Run a tool to completion and capture its standard output.
 *
 * Returns ToolUnavailable when the executable cannot be started (exit status 127 from the
 * child), InternalError when pipe/fork fail. A tool that starts and exits non-zero is not an
 * error at this level; callers inspect ProcessResult::exitCode.
 */
Result<ProcessResult> runProcess(const ProcessSpec& spec);

/// Locate an executable: names containing '/' are checked directly, others searched on PATH.
std::optional<std::filesystem::path> findExecutable(const std::string& name);

} // namespace pdfledger::tools
