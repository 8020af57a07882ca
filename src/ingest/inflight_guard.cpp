#include <pdfledger/core/time_format.h>
#include <pdfledger/ingest/inflight_guard.h>
#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace pdfledger::ingest {

namespace {

std::filesystem::path guardFileFor(const InFlightGuardOptions& options, std::string_view hash) {
    return options.guardDir / (std::string(hash) + ".lock");
}

std::string localHostName() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        return {};
    }
    return buf;
}

bool processGone(pid_t pid) {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

} // namespace

std::optional<GuardOwner> InFlightGuard::readOwner(const std::filesystem::path& guardFile) {
    std::ifstream in(guardFile);
    if (!in) {
        return std::nullopt;
    }

    GuardOwner owner;
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string_view key(line.data(), eq);
        std::string_view value(line.data() + eq + 1, line.size() - eq - 1);
        if (key == "acquired") {
            owner.acquiredAt = value;
        } else if (key == "pid") {
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), owner.pid);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                owner.pid = 0;
            }
        } else if (key == "host") {
            owner.host = value;
        }
    }
    if (owner.pid <= 0) {
        return std::nullopt;
    }
    return owner;
}

Result<void> InFlightGuard::tryCreate(const std::filesystem::path& guardFile) {
    int fd = ::open(guardFile.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Error{ErrorCode::OperationInProgress,
                         fmt::format("{} is already in flight", guardFile.filename().string())};
        }
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot create guard {}: {}", guardFile.string(),
                                 std::strerror(errno))};
    }

    std::string content = fmt::format("acquired={}\npid={}\nhost={}\n", utcNowIso(), ::getpid(),
                                      localHostName());
    ssize_t written = ::write(fd, content.data(), content.size());
    ::close(fd);
    if (written != static_cast<ssize_t>(content.size())) {
        std::error_code ec;
        std::filesystem::remove(guardFile, ec);
        return Error{ErrorCode::WriteError,
                     fmt::format("Failed to write guard {}", guardFile.string())};
    }
    return {};
}

bool InFlightGuard::reclaimIfStale(const InFlightGuardOptions& options,
                                   const std::filesystem::path& guardFile) {
    // Serialize reclaimers so a fresh guard created after a removal is never removed again
    auto lock = storage::FileLock::acquire(options.guardDir / ".reclaim.lock");
    if (!lock) {
        spdlog::warn("Cannot check guard {} for staleness: {}", guardFile.string(),
                     lock.error().message);
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(guardFile, ec)) {
        return true;
    }

    std::string reason;
    if (auto owner = readOwner(guardFile);
        owner && owner->host == localHostName() && processGone(owner->pid)) {
        reason = fmt::format("owner pid {} is gone", owner->pid);
    } else if (options.staleAfter.count() > 0) {
        auto mtime = std::filesystem::last_write_time(guardFile, ec);
        if (!ec) {
            auto age = std::filesystem::file_time_type::clock::now() - mtime;
            if (age > options.staleAfter) {
                reason = fmt::format(
                    "older than {}s",
                    std::chrono::duration_cast<std::chrono::seconds>(options.staleAfter).count());
            }
        }
    }
    if (reason.empty()) {
        return false;
    }

    std::filesystem::remove(guardFile, ec);
    if (ec) {
        spdlog::warn("Failed to remove stale guard {}: {}", guardFile.string(), ec.message());
        return false;
    }
    spdlog::warn("Reclaimed stale in-flight guard {} ({})", guardFile.filename().string(), reason);
    return true;
}

Result<InFlightGuard> InFlightGuard::acquire(const InFlightGuardOptions& options,
                                             std::string_view hash) {
    std::error_code ec;
    std::filesystem::create_directories(options.guardDir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot create guard directory {}: {}",
                                 options.guardDir.string(), ec.message())};
    }

    auto guardFile = guardFileFor(options, hash);
    auto created = tryCreate(guardFile);
    if (!created && created.error().code == ErrorCode::OperationInProgress &&
        reclaimIfStale(options, guardFile)) {
        created = tryCreate(guardFile);
    }
    if (!created) {
        return created.error();
    }
    spdlog::debug("Acquired in-flight guard for {}", hash);
    return InFlightGuard(std::move(guardFile));
}

bool InFlightGuard::isHeld(const InFlightGuardOptions& options, std::string_view hash) {
    auto guardFile = guardFileFor(options, hash);
    std::error_code ec;
    if (!std::filesystem::exists(guardFile, ec)) {
        return false;
    }
    return !reclaimIfStale(options, guardFile);
}

InFlightGuard::~InFlightGuard() {
    release();
}

InFlightGuard::InFlightGuard(InFlightGuard&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

InFlightGuard& InFlightGuard::operator=(InFlightGuard&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void InFlightGuard::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to release in-flight guard {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

} // namespace pdfledger::ingest
