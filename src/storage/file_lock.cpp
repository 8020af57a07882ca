#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace pdfledger::storage {

Result<FileLock> FileLock::lockImpl(const std::filesystem::path& lockFile, bool blocking) {
    std::error_code ec;
    std::filesystem::create_directories(lockFile.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot create lock directory {}: {}",
                                 lockFile.parent_path().string(), ec.message())};
    }

    int fd = ::open(lockFile.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Failed to open lock file {}: {}", lockFile.string(),
                                 std::strerror(errno))};
    }

    int op = LOCK_EX | (blocking ? 0 : LOCK_NB);
    while (::flock(fd, op) != 0) {
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return Error{ErrorCode::OperationInProgress,
                         fmt::format("{} is locked by another holder", lockFile.string())};
        }
        return Error{ErrorCode::InternalError,
                     fmt::format("flock({}) failed: {}", lockFile.string(), std::strerror(err))};
    }

    spdlog::trace("Acquired lock {}", lockFile.string());
    return FileLock(fd);
}

Result<FileLock> FileLock::acquire(const std::filesystem::path& lockFile) {
    return lockImpl(lockFile, true);
}

Result<FileLock> FileLock::tryAcquire(const std::filesystem::path& lockFile) {
    return lockImpl(lockFile, false);
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace pdfledger::storage
