#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>

namespace pdfledger::storage {

struct DedupStoreConfig {
    std::filesystem::path basePath; ///< one blob per hash: <basePath>/<hash><ext>
    std::filesystem::path lockDir;  ///< sharded per-hash locks: <lockDir>/<xx>.lock
};

enum class SubmitResult { Stored, AlreadyPresent };

/**
 * @brief Content-addressed blob store keyed by SHA-256.
 *
 * The first submission of a hash decides the stored extension; later submissions of the same
 * hash are no-ops whatever their extension. Blobs are staged under <basePath>/.tmp and renamed
 * into place, so a reader never sees a partial blob.
 *
 * Every extension in use is listed in <basePath>/.extensions before the first blob carrying it
 * is renamed into place, so a lookup checks one path per known extension instead of listing the
 * store. initialize() builds the list once for a store that predates it.
 */
class DedupStore {
public:
    explicit DedupStore(DedupStoreConfig config);

    DedupStore(const DedupStore&) = delete;
    DedupStore& operator=(const DedupStore&) = delete;

    Result<void> initialize();

    Result<SubmitResult> submit(std::string_view hash, const std::filesystem::path& source);

    bool contains(std::string_view hash) const;
    std::optional<std::filesystem::path> blobPath(std::string_view hash) const;

    // Lowercased ".ext" of a path, blank when absent or longer than 11 characters
    static std::string normalizedExtension(const std::filesystem::path& path);

private:
    std::optional<std::filesystem::path> findBlob(std::string_view hash) const;
    std::optional<std::filesystem::path> blobUnder(std::string_view hash,
                                                   const std::set<std::string>& extensions) const;
    std::filesystem::path shardLockPath(std::string_view hash) const;

    std::filesystem::path registryPath() const;
    Result<std::set<std::string>> readRegistry() const;
    Result<void> writeRegistry(const std::set<std::string>& extensions);
    std::set<std::string> scanExtensions() const;
    // Merges the on-disk list into extensions_; returns the number of newly learned entries
    size_t refreshExtensions() const;
    Result<void> registerExtension(const std::string& extension);

    DedupStoreConfig config_;
    mutable std::mutex knownMutex_;
    mutable std::unordered_set<std::string> known_;
    mutable std::mutex extensionsMutex_;
    mutable std::set<std::string> extensions_;
};

} // namespace pdfledger::storage
