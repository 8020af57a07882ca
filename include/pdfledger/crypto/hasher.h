#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace pdfledger::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Hash a whole file; throws std::runtime_error when the file cannot be read
    virtual std::string hashFile(const std::filesystem::path& path) = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

// SHA-256 implementation
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    std::string hashFile(const std::filesystem::path& path) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

// True for a 64 character lowercase hex digest
bool isHexDigest(std::string_view value) noexcept;

} // namespace pdfledger::crypto
