#pragma once

#include <pdfledger/core/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace pdfledger::ingest {

class ProcessingCoordinator;

struct ScanSummary {
    size_t candidates = 0;
    size_t processed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<std::filesystem::path> failedDocuments;

    void merge(const ScanSummary& other);
};

// inotify watch on one directory; closed on destruction
class DirectoryWatcher {
public:
    static Result<DirectoryWatcher> open(const std::filesystem::path& dir);

    ~DirectoryWatcher();
    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;
    DirectoryWatcher(DirectoryWatcher&& other) noexcept;
    DirectoryWatcher& operator=(DirectoryWatcher&& other) noexcept;

    // Names of entries written, created or moved in; empty on timeout
    Result<std::vector<std::string>> waitForChanges(std::chrono::milliseconds timeout);

private:
    DirectoryWatcher(int fd, int wd) : fd_(fd), wd_(wd) {}
    void close() noexcept;

    int fd_ = -1;
    int wd_ = -1;
};

/**
 * @brief Finds candidate documents in the input directory and feeds them to the coordinator.
 *
 * scanOnce() is the one-shot catch-up. watch() runs a catch-up and then waits for new
 * documents (inotify, or polling when inotify is unavailable) until stop is set.
 */
class Scanner {
public:
    Scanner(ProcessingCoordinator& coordinator, int jobs = 1);

    // Regular files in the input directory with a document extension, sorted by path
    Result<std::vector<std::filesystem::path>> listCandidates() const;

    Result<ScanSummary> scanOnce();

    Result<ScanSummary> processAll(const std::vector<std::filesystem::path>& documents);

    Result<void> watch(const std::atomic<bool>& stop);

private:
    Result<void> processOne(const std::filesystem::path& document, ScanSummary& summary);
    Result<void> watchWithInotify(DirectoryWatcher& watcher, const std::atomic<bool>& stop);
    Result<void> watchByPolling(const std::atomic<bool>& stop);

    ProcessingCoordinator& coordinator_;
    int jobs_;
    std::vector<std::filesystem::path> retry_;
};

} // namespace pdfledger::ingest
