#include <pdfledger/config/ingest_config.h>
#include <pdfledger/ingest/processing_coordinator.h>
#include <pdfledger/ingest/scanner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace pdfledger::ingest {

namespace {

constexpr auto kStopCheckInterval = std::chrono::milliseconds(200);

} // namespace

void ScanSummary::merge(const ScanSummary& other) {
    candidates += other.candidates;
    processed += other.processed;
    skipped += other.skipped;
    failed += other.failed;
    failedDocuments.insert(failedDocuments.end(), other.failedDocuments.begin(),
                           other.failedDocuments.end());
}

// DirectoryWatcher

Result<DirectoryWatcher> DirectoryWatcher::open(const std::filesystem::path& dir) {
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::InternalError,
                     fmt::format("inotify_init1 failed: {}", std::strerror(errno))};
    }
    int wd = ::inotify_add_watch(fd, dir.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE);
    if (wd < 0) {
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::InternalError,
                     fmt::format("Cannot watch {}: {}", dir.string(), std::strerror(err))};
    }
    return DirectoryWatcher(fd, wd);
}

DirectoryWatcher::~DirectoryWatcher() {
    close();
}

DirectoryWatcher::DirectoryWatcher(DirectoryWatcher&& other) noexcept
    : fd_(other.fd_), wd_(other.wd_) {
    other.fd_ = -1;
    other.wd_ = -1;
}

DirectoryWatcher& DirectoryWatcher::operator=(DirectoryWatcher&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        wd_ = other.wd_;
        other.fd_ = -1;
        other.wd_ = -1;
    }
    return *this;
}

void DirectoryWatcher::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        wd_ = -1;
    }
}

Result<std::vector<std::string>>
DirectoryWatcher::waitForChanges(std::chrono::milliseconds timeout) {
    std::vector<std::string> names;
    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return names;
        }
        return Error{ErrorCode::InternalError,
                     fmt::format("poll on inotify failed: {}", std::strerror(errno))};
    }
    if (ready == 0) {
        return names;
    }

    alignas(inotify_event) char buf[4096];
    while (true) {
        ssize_t len = ::read(fd_, buf, sizeof(buf));
        if (len <= 0) {
            break;
        }
        for (char* p = buf; p < buf + len;) {
            auto* event = reinterpret_cast<inotify_event*>(p);
            if (event->len > 0 && (event->mask & IN_ISDIR) == 0) {
                std::string name(event->name);
                if (std::find(names.begin(), names.end(), name) == names.end()) {
                    names.push_back(std::move(name));
                }
            }
            p += sizeof(inotify_event) + event->len;
        }
    }
    return names;
}

// Scanner

Scanner::Scanner(ProcessingCoordinator& coordinator, int jobs)
    : coordinator_(coordinator), jobs_(std::max(1, jobs)) {}

Result<std::vector<std::filesystem::path>> Scanner::listCandidates() const {
    const auto& cfg = coordinator_.config();
    std::vector<std::filesystem::path> documents;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(cfg.paths.inputDir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) &&
            config::isDocumentPath(it->path(), cfg.documentExtensions)) {
            documents.push_back(it->path());
        }
    }
    if (ec) {
        return Error{ErrorCode::ReadError, fmt::format("Cannot list {}: {}",
                                                       cfg.paths.inputDir.string(), ec.message())};
    }
    std::sort(documents.begin(), documents.end());
    return documents;
}

Result<void> Scanner::processOne(const std::filesystem::path& document, ScanSummary& summary) {
    auto outcome = coordinator_.process(document);
    if (!outcome) {
        if (isFatal(outcome.error().code)) {
            spdlog::critical("Stopping on {}: {}", document.filename().string(),
                             outcome.error().message);
            return outcome.error();
        }
        spdlog::error("Failed to process {}: {}", document.filename().string(),
                      outcome.error().message);
        ++summary.failed;
        summary.failedDocuments.push_back(document);
        return {};
    }
    const auto& o = outcome.value();
    if (o.state == ProcessState::Failed) {
        ++summary.failed;
        summary.failedDocuments.push_back(document);
    } else if (o.skipped()) {
        ++summary.skipped;
    } else {
        ++summary.processed;
    }
    spdlog::debug("{}: {}", document.filename().string(), processStateName(o.state));
    return {};
}

Result<ScanSummary> Scanner::processAll(const std::vector<std::filesystem::path>& documents) {
    ScanSummary summary;
    summary.candidates = documents.size();

    size_t workers = std::min(static_cast<size_t>(jobs_), documents.size());
    if (workers <= 1) {
        for (const auto& document : documents) {
            if (auto r = processOne(document, summary); !r) {
                return r.error();
            }
        }
        return summary;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> stopping{false};
    std::mutex mutex;
    std::optional<Error> fatal;

    auto worker = [&]() {
        ScanSummary local;
        while (!stopping.load()) {
            size_t index = next.fetch_add(1);
            if (index >= documents.size()) {
                break;
            }
            if (auto r = processOne(documents[index], local); !r) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!fatal) {
                    fatal = r.error();
                }
                stopping.store(true);
                break;
            }
        }
        std::lock_guard<std::mutex> lock(mutex);
        summary.merge(local);
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (fatal) {
        return *fatal;
    }
    return summary;
}

Result<ScanSummary> Scanner::scanOnce() {
    const auto& inputDir = coordinator_.config().paths.inputDir;
    spdlog::info("Scanning for unprocessed documents in {}", inputDir.string());

    auto documents = listCandidates();
    if (!documents) {
        return documents.error();
    }
    if (documents.value().empty()) {
        spdlog::info("No documents found");
        return ScanSummary{};
    }

    auto summary = processAll(documents.value());
    if (!summary) {
        return summary;
    }
    const auto& s = summary.value();
    retry_ = s.failedDocuments;
    spdlog::info("Scan complete: {} processed, {} skipped, {} failed", s.processed, s.skipped,
                 s.failed);
    return summary;
}

Result<void> Scanner::watchWithInotify(DirectoryWatcher& watcher, const std::atomic<bool>& stop) {
    const auto& cfg = coordinator_.config();
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.pollInterval);

    while (!stop.load()) {
        auto changed = watcher.waitForChanges(std::min(timeout, std::chrono::milliseconds(1000)));
        if (!changed) {
            return changed.error();
        }

        std::vector<std::filesystem::path> documents;
        if (changed.value().empty()) {
            // Quiet period: retry what failed earlier
            documents.swap(retry_);
        } else {
            std::set<std::filesystem::path> unique;
            for (const auto& name : changed.value()) {
                auto path = cfg.paths.inputDir / name;
                if (config::isDocumentPath(path, cfg.documentExtensions)) {
                    unique.insert(path);
                }
            }
            documents.assign(unique.begin(), unique.end());
        }
        if (documents.empty() || stop.load()) {
            continue;
        }

        auto summary = processAll(documents);
        if (!summary) {
            return summary.error();
        }
        for (const auto& failed : summary.value().failedDocuments) {
            if (std::find(retry_.begin(), retry_.end(), failed) == retry_.end()) {
                retry_.push_back(failed);
            }
        }
    }
    return {};
}

Result<void> Scanner::watchByPolling(const std::atomic<bool>& stop) {
    const auto interval = coordinator_.config().pollInterval;
    spdlog::info("inotify unavailable; polling every {}s", interval.count());

    while (!stop.load()) {
        auto deadline = std::chrono::steady_clock::now() + interval;
        while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kStopCheckInterval);
        }
        if (stop.load()) {
            break;
        }
        if (auto summary = scanOnce(); !summary) {
            return summary.error();
        }
    }
    return {};
}

Result<void> Scanner::watch(const std::atomic<bool>& stop) {
    const auto& inputDir = coordinator_.config().paths.inputDir;

    // Watch before the catch-up so nothing arriving during it is missed
    auto watcher = DirectoryWatcher::open(inputDir);

    if (auto summary = scanOnce(); !summary) {
        return summary.error();
    }

    spdlog::info("Monitoring {} for new documents (Ctrl+C to stop)", inputDir.string());
    Result<void> result;
    if (watcher) {
        auto active = std::move(watcher).value();
        result = watchWithInotify(active, stop);
    } else {
        spdlog::debug("{}", watcher.error().message);
        result = watchByPolling(stop);
    }
    if (result) {
        spdlog::info("Stopped monitoring {}", inputDir.string());
    }
    return result;
}

} // namespace pdfledger::ingest
