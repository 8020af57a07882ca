#pragma once

#include <pdfledger/core/types.h>

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pdfledger::ingest {

// Contents of a guard file
struct GuardOwner {
    std::string acquiredAt;
    pid_t pid = 0;
    std::string host;
};

struct InFlightGuardOptions {
    std::filesystem::path guardDir; ///< <lock dir>/inflight
    std::chrono::seconds staleAfter{6 * 3600}; ///< 0 disables age-based reclamation
};

/**
 * @brief Exclusive per-hash claim on processing a document.
 *
 * The guard is a file <guardDir>/<hash>.lock created with O_CREAT|O_EXCL and removed on
 * destruction. Guards left by a dead process on this host, or older than staleAfter, are
 * reclaimed.
 */
class InFlightGuard {
public:
    // OperationInProgress when another live worker holds the hash
    static Result<InFlightGuard> acquire(const InFlightGuardOptions& options,
                                         std::string_view hash);

    // True when a live (non-stale) guard exists. Stale guards are removed as a side effect.
    static bool isHeld(const InFlightGuardOptions& options, std::string_view hash);

    static std::optional<GuardOwner> readOwner(const std::filesystem::path& guardFile);

    ~InFlightGuard();

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;
    InFlightGuard(InFlightGuard&& other) noexcept;
    InFlightGuard& operator=(InFlightGuard&& other) noexcept;

    void release() noexcept;
    const std::filesystem::path& path() const { return path_; }

private:
    explicit InFlightGuard(std::filesystem::path path) : path_(std::move(path)) {}

    static Result<void> tryCreate(const std::filesystem::path& guardFile);
    static bool reclaimIfStale(const InFlightGuardOptions& options,
                               const std::filesystem::path& guardFile);

    std::filesystem::path path_;
};

} // namespace pdfledger::ingest
