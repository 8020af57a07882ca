#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>

namespace pdfledger::storage {

/**
 * @brief Exclusive advisory lock on a lock file (flock), released on destruction.
 *
 * Each acquisition opens its own file description, so the lock excludes other threads of this
 * process as well as other processes. The kernel drops the lock if the holder dies.
 */
class FileLock {
public:
    // Blocks until the lock is held. Creates the lock file (and its directory) if needed.
    static Result<FileLock> acquire(const std::filesystem::path& lockFile);

    // Non-blocking variant; OperationInProgress when another holder has it
    static Result<FileLock> tryAcquire(const std::filesystem::path& lockFile);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    void release() noexcept;
    bool held() const noexcept { return fd_ >= 0; }

private:
    explicit FileLock(int fd) : fd_(fd) {}

    static Result<FileLock> lockImpl(const std::filesystem::path& lockFile, bool blocking);

    int fd_ = -1;
};

} // namespace pdfledger::storage
