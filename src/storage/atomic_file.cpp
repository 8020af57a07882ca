#include <pdfledger/storage/atomic_file.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <random>

namespace pdfledger::storage {

constexpr size_t TEMP_NAME_LENGTH = 16;

AtomicFileWriter::AtomicFileWriter(std::filesystem::path tempDir) : tempDir_(std::move(tempDir)) {}

std::filesystem::path
AtomicFileWriter::generateTempName(const std::filesystem::path& target) const {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> dis(0, 15);

    std::string tempName = target.filename().string() + ".tmp.";
    for (size_t i = 0; i < TEMP_NAME_LENGTH; ++i) {
        tempName += fmt::format("{:x}", dis(gen));
    }

    auto dir = tempDir_.empty() ? target.parent_path() : tempDir_;
    return dir / tempName;
}

Result<void> AtomicFileWriter::commit(const std::filesystem::path& temp,
                                      const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        spdlog::error("Failed to rename {} to {}: {}", temp.string(), path.string(), ec.message());
        return Error{ErrorCode::WriteError,
                     fmt::format("Failed to replace {}: {}", path.string(), ec.message())};
    }
    return {};
}

Result<void> AtomicFileWriter::write(const std::filesystem::path& path, std::string_view data) {
    auto tempPath = generateTempName(path);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::PermissionDenied,
                         fmt::format("Cannot create {}", tempPath.string())};
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError,
                         fmt::format("Failed writing {}", tempPath.string())};
        }
    }
    return commit(tempPath, path);
}

Result<void> AtomicFileWriter::copy(const std::filesystem::path& source,
                                    const std::filesystem::path& path) {
    auto tempPath = generateTempName(path);
    std::error_code ec;
    std::filesystem::copy_file(source, tempPath, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        // The source vanishing is not a store failure; a full disk is
        auto code = (ec == std::errc::no_such_file_or_directory) ? ErrorCode::FileNotFound
                                                                  : ErrorCode::WriteError;
        return Error{code, fmt::format("Failed to copy {} to {}: {}", source.string(),
                                       tempPath.string(), ec.message())};
    }
    return commit(tempPath, path);
}

} // namespace pdfledger::storage
