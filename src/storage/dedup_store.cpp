#include <pdfledger/crypto/hasher.h>
#include <pdfledger/storage/atomic_file.h>
#include <pdfledger/storage/dedup_store.h>
#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace pdfledger::storage {

namespace {

constexpr size_t kMaxExtensionLength = 11; // including the dot
constexpr size_t kShardPrefixLength = 2;
constexpr const char* kStagingDir = ".tmp";
constexpr const char* kExtensionRegistry = ".extensions";
constexpr const char* kExtensionLock = "extensions.lock";
constexpr size_t kHashLength = 64;

} // namespace

DedupStore::DedupStore(DedupStoreConfig config) : config_(std::move(config)) {}

Result<void> DedupStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(config_.basePath / kStagingDir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Failed to create dedup store {}: {}", config_.basePath.string(),
                                 ec.message())};
    }
    std::filesystem::create_directories(config_.lockDir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Failed to create lock directory {}: {}",
                                 config_.lockDir.string(), ec.message())};
    }

    auto lock = FileLock::acquire(config_.lockDir / kExtensionLock);
    if (!lock) {
        return lock.error();
    }
    if (!std::filesystem::exists(registryPath(), ec)) {
        auto found = scanExtensions();
        if (auto written = writeRegistry(found); !written) {
            return written.error();
        }
        spdlog::debug("Indexed {} blob extension(s) in {}", found.size(),
                      config_.basePath.string());
    }
    auto registered = readRegistry();
    if (!registered) {
        return registered.error();
    }
    {
        std::lock_guard guard(extensionsMutex_);
        extensions_ = std::move(registered).value();
    }

    spdlog::debug("Initialized dedup store at: {}", config_.basePath.string());
    return {};
}

std::filesystem::path DedupStore::registryPath() const {
    return config_.basePath / kExtensionRegistry;
}

Result<std::set<std::string>> DedupStore::readRegistry() const {
    std::set<std::string> extensions;
    std::error_code ec;
    if (!std::filesystem::exists(registryPath(), ec)) {
        return extensions;
    }
    std::ifstream in(registryPath());
    if (!in) {
        return Error{ErrorCode::ReadError,
                     fmt::format("Cannot read {}", registryPath().string())};
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() > 1 && line.front() == '.') {
            extensions.insert(line);
        }
    }
    return extensions;
}

Result<void> DedupStore::writeRegistry(const std::set<std::string>& extensions) {
    std::string content;
    for (const auto& ext : extensions) {
        content += ext;
        content.push_back('\n');
    }
    AtomicFileWriter writer(config_.basePath / kStagingDir);
    return writer.write(registryPath(), content);
}

std::set<std::string> DedupStore::scanExtensions() const {
    std::set<std::string> found;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(config_.basePath, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.size() > kHashLength + 1 && name[kHashLength] == '.' &&
            crypto::isHexDigest(std::string_view(name).substr(0, kHashLength))) {
            found.insert(name.substr(kHashLength));
        }
    }
    if (ec) {
        spdlog::warn("Listing {} stopped early: {}", config_.basePath.string(), ec.message());
    }
    return found;
}

size_t DedupStore::refreshExtensions() const {
    auto onDisk = readRegistry();
    if (!onDisk) {
        spdlog::warn("{}", onDisk.error().message);
        return 0;
    }
    std::lock_guard guard(extensionsMutex_);
    size_t before = extensions_.size();
    extensions_.insert(onDisk.value().begin(), onDisk.value().end());
    return extensions_.size() - before;
}

Result<void> DedupStore::registerExtension(const std::string& extension) {
    if (extension.empty()) {
        return {};
    }
    {
        std::lock_guard guard(extensionsMutex_);
        if (extensions_.contains(extension)) {
            return {};
        }
    }

    auto lock = FileLock::acquire(config_.lockDir / kExtensionLock);
    if (!lock) {
        return lock.error();
    }
    auto onDisk = readRegistry();
    if (!onDisk) {
        return onDisk.error();
    }
    auto extensions = std::move(onDisk).value();
    if (extensions.insert(extension).second) {
        if (auto written = writeRegistry(extensions); !written) {
            return written.error();
        }
    }
    std::lock_guard guard(extensionsMutex_);
    extensions_.insert(extensions.begin(), extensions.end());
    return {};
}

std::string DedupStore::normalizedExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() > kMaxExtensionLength || ext == ".") {
        return {};
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::filesystem::path DedupStore::shardLockPath(std::string_view hash) const {
    return config_.lockDir / (std::string(hash.substr(0, kShardPrefixLength)) + ".lock");
}

std::optional<std::filesystem::path> DedupStore::findBlob(std::string_view hash) const {
    std::error_code ec;
    auto exact = config_.basePath / std::string(hash);
    if (std::filesystem::is_regular_file(exact, ec)) {
        return exact;
    }

    std::set<std::string> extensions;
    {
        std::lock_guard guard(extensionsMutex_);
        extensions = extensions_;
    }
    if (auto blob = blobUnder(hash, extensions)) {
        return blob;
    }

    // Another process may have stored it under an extension this one has not seen yet
    if (refreshExtensions() == 0) {
        return std::nullopt;
    }
    std::lock_guard guard(extensionsMutex_);
    extensions = extensions_;
    return blobUnder(hash, extensions);
}

std::optional<std::filesystem::path>
DedupStore::blobUnder(std::string_view hash, const std::set<std::string>& extensions) const {
    std::error_code ec;
    for (const auto& ext : extensions) {
        auto candidate = config_.basePath / (std::string(hash) + ext);
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool DedupStore::contains(std::string_view hash) const {
    return blobPath(hash).has_value();
}

std::optional<std::filesystem::path> DedupStore::blobPath(std::string_view hash) const {
    if (!crypto::isHexDigest(hash)) {
        return std::nullopt;
    }
    return findBlob(hash);
}

Result<SubmitResult> DedupStore::submit(std::string_view hash,
                                        const std::filesystem::path& source) {
    if (!crypto::isHexDigest(hash)) {
        spdlog::error("Invalid hash for dedup store: '{}'", hash);
        return Error{ErrorCode::InvalidArgument, fmt::format("Invalid hash '{}'", hash)};
    }

    {
        std::lock_guard lock(knownMutex_);
        if (known_.contains(std::string(hash))) {
            return SubmitResult::AlreadyPresent;
        }
    }

    // Serialize writers of the same hash across threads and processes
    auto shardLock = FileLock::acquire(shardLockPath(hash));
    if (!shardLock) {
        return shardLock.error();
    }

    if (findBlob(hash)) {
        std::lock_guard lock(knownMutex_);
        known_.emplace(hash);
        spdlog::trace("Object {} already stored", hash);
        return SubmitResult::AlreadyPresent;
    }

    auto extension = normalizedExtension(source);
    if (auto registered = registerExtension(extension); !registered) {
        return registered.error();
    }
    auto dest = config_.basePath / (std::string(hash) + extension);
    AtomicFileWriter writer(config_.basePath / kStagingDir);
    if (auto copied = writer.copy(source, dest); !copied) {
        return copied.error();
    }

    {
        std::lock_guard lock(knownMutex_);
        known_.emplace(hash);
    }
    spdlog::debug("Stored object {}", dest.filename().string());
    return SubmitResult::Stored;
}

} // namespace pdfledger::storage
