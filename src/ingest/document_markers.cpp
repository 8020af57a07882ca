#include <pdfledger/config/config_helpers.h>
#include <pdfledger/ingest/document_markers.h>
#include <pdfledger/storage/atomic_file.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace pdfledger::ingest {

DocumentMarkers::DocumentMarkers(std::filesystem::path destination)
    : destination_(std::move(destination)) {}

bool DocumentMarkers::isMarker(const std::filesystem::path& file) {
    auto name = file.filename().string();
    return name.starts_with(kStampFileName) || name.starts_with(kRowJournalFileName);
}

Result<std::optional<std::string>> DocumentMarkers::readMarker(std::string_view name) const {
    auto path = destination_ / name;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::optional<std::string>{};
    }
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::ReadError, fmt::format("Cannot read {}", path.string())};
    }
    std::string line;
    std::getline(in, line);
    return std::optional<std::string>{config::trimmed(line)};
}

Result<void> DocumentMarkers::writeMarker(std::string_view name, std::string_view content) {
    std::error_code ec;
    std::filesystem::create_directories(destination_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, fmt::format("Cannot create {}: {}",
                                                        destination_.string(), ec.message())};
    }
    storage::AtomicFileWriter writer;
    return writer.write(destination_ / name, std::string(content) + "\n");
}

Result<std::optional<std::string>> DocumentMarkers::readStamp() const {
    return readMarker(kStampFileName);
}

bool DocumentMarkers::stampMatches(std::string_view documentHash) const {
    auto stamp = readStamp();
    return stamp && stamp.value() && *stamp.value() == documentHash;
}

Result<void> DocumentMarkers::writeStamp(std::string_view documentHash) {
    return writeMarker(kStampFileName, documentHash);
}

bool DocumentMarkers::journalMatches(std::string_view documentHash) const {
    return journalFirstRow(documentHash).has_value();
}

std::optional<size_t> DocumentMarkers::journalFirstRow(std::string_view documentHash) const {
    std::ifstream in(destination_ / kRowJournalFileName);
    if (!in) {
        return std::nullopt;
    }
    std::string hashLine;
    std::string rowLine;
    std::getline(in, hashLine);
    std::getline(in, rowLine);
    if (config::trimmed(hashLine) != documentHash) {
        return std::nullopt;
    }

    auto text = config::trimmed(rowLine);
    size_t firstRow = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), firstRow);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return size_t{0};
    }
    return firstRow;
}

Result<void> DocumentMarkers::writeJournal(std::string_view documentHash, size_t firstRow) {
    return writeMarker(kRowJournalFileName, fmt::format("{}\n{}", documentHash, firstRow));
}

Result<void> DocumentMarkers::removeJournal() {
    std::error_code ec;
    std::filesystem::remove(destination_ / kRowJournalFileName, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     fmt::format("Cannot remove row journal in {}: {}", destination_.string(),
                                 ec.message())};
    }
    return {};
}

Result<size_t> DocumentMarkers::clearExtracted() {
    std::error_code ec;
    if (!std::filesystem::exists(destination_, ec)) {
        return size_t{0};
    }

    size_t removed = 0;
    for (const auto& entry : std::filesystem::directory_iterator(destination_, ec)) {
        if (isMarker(entry.path())) {
            continue;
        }
        std::error_code rmEc;
        auto n = std::filesystem::remove_all(entry.path(), rmEc);
        if (rmEc) {
            return Error{ErrorCode::WriteError,
                         fmt::format("Cannot clear {}: {}", entry.path().string(),
                                     rmEc.message())};
        }
        removed += static_cast<size_t>(n);
    }
    if (ec) {
        return Error{ErrorCode::ReadError,
                     fmt::format("Cannot list {}: {}", destination_.string(), ec.message())};
    }
    if (removed > 0) {
        spdlog::debug("Cleared {} stale entries from {}", removed, destination_.string());
    }
    return removed;
}

} // namespace pdfledger::ingest
