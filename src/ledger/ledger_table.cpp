#include <pdfledger/ledger/ledger_table.h>
#include <pdfledger/ledger/tsv.h>
#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

#include <charconv>

namespace pdfledger::ledger {

namespace {

template <typename T> bool parseInteger(std::string_view text, T& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

std::string LedgerEntry::toLine() const {
    return joinFields({sanitizeField(documentHash), sanitizeField(documentName),
                       std::to_string(size), std::to_string(mtime), sanitizeField(completedAt)});
}

Result<LedgerEntry> LedgerEntry::fromLine(std::string_view line) {
    auto fields = splitFields(line);
    if (fields.size() != kLedgerFieldCount) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("Ledger row has {} fields, expected {}", fields.size(),
                                 kLedgerFieldCount)};
    }

    LedgerEntry entry;
    entry.documentHash = std::move(fields[0]);
    entry.documentName = std::move(fields[1]);
    if (!parseInteger(fields[2], entry.size) || !parseInteger(fields[3], entry.mtime)) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("Ledger row for {} has a malformed size or mtime",
                                 entry.documentHash)};
    }
    entry.completedAt = std::move(fields[4]);
    return entry;
}

LedgerTable::LedgerTable(LedgerTableConfig config) : config_(std::move(config)) {}

Result<std::vector<LedgerEntry>> LedgerTable::readEntries() const {
    auto lines = readLines(config_.tablePath);
    if (!lines) {
        return lines.error();
    }

    std::vector<LedgerEntry> result;
    result.reserve(lines.value().size());
    size_t lineNo = 0;
    for (const auto& line : lines.value()) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        auto entry = LedgerEntry::fromLine(line);
        if (!entry) {
            return Error{ErrorCode::CorruptedData,
                         fmt::format("{}:{}: {}", config_.tablePath.string(), lineNo,
                                     entry.error().message)};
        }
        result.push_back(std::move(entry).value());
    }
    return result;
}

Result<size_t> LedgerTable::ensureLayout() {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.tablePath.parent_path(), ec);
    if (std::filesystem::exists(config_.tablePath, ec)) {
        auto repaired = repairTornTail(config_.tablePath, /*keepFirstLine=*/false);
        if (!repaired) {
            return repaired.error();
        }
    }

    auto rows = readEntries();
    if (!rows) {
        spdlog::critical("Ledger corruption: {}", rows.error().message);
        return rows.error();
    }
    return rows.value().size();
}

Result<bool> LedgerTable::contains(std::string_view documentHash) const {
    auto all = entries();
    if (!all) {
        return all.error();
    }
    for (const auto& entry : all.value()) {
        if (entry.documentHash == documentHash) {
            return true;
        }
    }
    return false;
}

Result<void> LedgerTable::append(const LedgerEntry& entry) {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }
    return appendText(config_.tablePath, entry.toLine() + "\n", /*keepFirstLine=*/false);
}

Result<bool> LedgerTable::appendIfAbsent(const LedgerEntry& entry) {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }

    auto existing = readEntries();
    if (!existing) {
        return existing.error();
    }
    for (const auto& e : existing.value()) {
        if (e.documentHash == entry.documentHash) {
            return false;
        }
    }

    auto appended = appendText(config_.tablePath, entry.toLine() + "\n", /*keepFirstLine=*/false);
    if (!appended) {
        return appended.error();
    }
    return true;
}

Result<std::vector<LedgerEntry>> LedgerTable::entries() const {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }
    return readEntries();
}

} // namespace pdfledger::ledger
