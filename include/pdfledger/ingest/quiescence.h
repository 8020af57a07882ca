#pragma once

#include <chrono>
#include <filesystem>

namespace pdfledger::ingest {

struct QuiescencePolicy {
    int attempts = 10;
    std::chrono::milliseconds interval{300};
};

// Samples the file size until two consecutive samples agree. A missing file is a failed sample.
// Returns false when the attempts ran out first; callers go ahead either way.
bool waitForQuiescence(const std::filesystem::path& file, const QuiescencePolicy& policy);

} // namespace pdfledger::ingest
