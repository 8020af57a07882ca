#include <pdfledger/ledger/count_projection.h>
#include <pdfledger/ledger/object_table.h>
#include <pdfledger/storage/atomic_file.h>
#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace pdfledger::ledger {

CountProjection::CountProjection(CountProjectionConfig config, const ObjectTable& objects)
    : config_(std::move(config)), objects_(objects) {}

std::vector<HashCount> CountProjection::compute(const std::vector<std::string>& hashes) {
    std::unordered_map<std::string, size_t> tally;
    for (const auto& hash : hashes) {
        if (!hash.empty()) {
            ++tally[hash];
        }
    }

    std::vector<HashCount> counts(tally.begin(), tally.end());
    std::sort(counts.begin(), counts.end(), [](const HashCount& a, const HashCount& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    return counts;
}

std::string CountProjection::render(const std::vector<HashCount>& counts) {
    std::string out;
    out.reserve(counts.size() * (HASH_STRING_SIZE + 8));
    for (const auto& [hash, count] : counts) {
        out += hash;
        out.push_back('\t');
        out += std::to_string(count);
        out.push_back('\n');
    }
    return out;
}

Result<size_t> CountProjection::rebuild() {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }

    auto hashes = objects_.hashColumn();
    if (!hashes) {
        return hashes.error();
    }

    auto counts = compute(hashes.value());
    storage::AtomicFileWriter writer;
    if (auto written = writer.write(config_.projectionPath, render(counts)); !written) {
        return written.error();
    }
    spdlog::debug("Rebuilt {} ({} distinct hashes)", config_.projectionPath.string(),
                  counts.size());
    return counts.size();
}

} // namespace pdfledger::ledger
