#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace pdfledger::ledger {

class ObjectTable;

using HashCount = std::pair<std::string, size_t>;

struct CountProjectionConfig {
    std::filesystem::path projectionPath;
    std::filesystem::path lockFile;
};

// hash-count.tsv, derived from the object table's hash column and rebuilt in full
class CountProjection {
public:
    CountProjection(CountProjectionConfig config, const ObjectTable& objects);

    // Count descending, then hash ascending
    static std::vector<HashCount> compute(const std::vector<std::string>& hashes);

    static std::string render(const std::vector<HashCount>& counts);

    // Holds the counts lock for the whole rebuild; the objects lock only while reading
    Result<size_t> rebuild();

    const std::filesystem::path& path() const { return config_.projectionPath; }

private:
    CountProjectionConfig config_;
    const ObjectTable& objects_;
};

} // namespace pdfledger::ledger
