#pragma once

#include <pdfledger/core/types.h>

#include <filesystem>
#include <string_view>

namespace pdfledger::storage {

// Atomic file writer for safe concurrent writes: data goes to a uniquely named temp file which is
// then renamed over the target, so readers see either the old or the new content.
class AtomicFileWriter {
public:
    // tempDir defaults to the target's directory; it must live on the same filesystem
    explicit AtomicFileWriter(std::filesystem::path tempDir = {});

    [[nodiscard]] Result<void> write(const std::filesystem::path& path, std::string_view data);

    [[nodiscard]] Result<void> copy(const std::filesystem::path& source,
                                    const std::filesystem::path& path);

private:
    [[nodiscard]] std::filesystem::path generateTempName(const std::filesystem::path& target) const;

    Result<void> commit(const std::filesystem::path& temp, const std::filesystem::path& path);

    std::filesystem::path tempDir_;
};

} // namespace pdfledger::storage
