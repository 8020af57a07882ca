#include <pdfledger/ledger/object_table.h>
#include <pdfledger/ledger/tsv.h>
#include <pdfledger/storage/atomic_file.h>
#include <pdfledger/storage/file_lock.h>

#include <spdlog/spdlog.h>

namespace pdfledger::ledger {

std::vector<std::string> ObjectRow::toFields() const {
    const auto& s = signatures;
    std::vector<std::string> fields = {
        filing.caseNumber, filing.filingType,  filing.filingDate,  objectHash,
        documentName,      objectPath,         objectType,         fontName,
        s[0].commonName,   s[1].commonName,    author,             creator,
        s[2].commonName,   s[3].commonName,    s[0].signingTime,   s[1].signingTime,
        s[2].signingTime,  s[3].signingTime,   s[0].byteRanges,    s[1].byteRanges,
        s[2].byteRanges,   s[3].byteRanges,
    };
    for (auto& field : fields) {
        field = sanitizeField(field);
    }
    return fields;
}

std::string ObjectRow::toLine() const {
    return joinFields(toFields());
}

ObjectTable::ObjectTable(ObjectTableConfig config) : config_(std::move(config)) {}

Result<SchemaVersion> ObjectTable::ensureLayout() {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.tablePath.parent_path(), ec);

    if (std::filesystem::exists(config_.tablePath, ec)) {
        auto repaired = repairTornTail(config_.tablePath, /*keepFirstLine=*/true);
        if (!repaired) {
            return repaired.error();
        }
    }

    auto lines = readLines(config_.tablePath);
    if (!lines) {
        return lines.error();
    }

    if (lines.value().empty()) {
        storage::AtomicFileWriter writer;
        if (auto written = writer.write(config_.tablePath, currentHeader() + "\n"); !written) {
            return written.error();
        }
        spdlog::debug("Created {} with current schema", config_.tablePath.string());
        return SchemaVersion::Empty;
    }

    auto migration = SchemaMigration::apply(std::move(lines).value());
    switch (migration.from) {
        case SchemaVersion::Legacy5: {
            std::string content;
            for (const auto& line : migration.lines) {
                content += line;
                content.push_back('\n');
            }
            storage::AtomicFileWriter writer;
            if (auto written = writer.write(config_.tablePath, content); !written) {
                spdlog::critical("Schema migration of {} failed: {}", config_.tablePath.string(),
                                 written.error().message);
                return Error{ErrorCode::SchemaMismatch,
                             fmt::format("Migration of {} failed: {}", config_.tablePath.string(),
                                         written.error().message)};
            }
            spdlog::info("Migrated {} from the 5-column schema ({} data rows)",
                         config_.tablePath.string(), migration.lines.size() - 1);
            break;
        }
        case SchemaVersion::Custom:
            spdlog::warn("{} has a custom header; leaving it untouched",
                         config_.tablePath.string());
            break;
        case SchemaVersion::Current:
        case SchemaVersion::Empty:
            break;
    }
    return migration.from;
}

Result<void> ObjectTable::append(const std::vector<ObjectRow>& rows) {
    if (rows.empty()) {
        return {};
    }

    std::string text;
    for (const auto& row : rows) {
        text += row.toLine();
        text.push_back('\n');
    }

    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }
    return appendText(config_.tablePath, text, /*keepFirstLine=*/true);
}

Result<std::vector<std::string>> ObjectTable::readDataLines() const {
    auto lock = storage::FileLock::acquire(config_.lockFile);
    if (!lock) {
        return lock.error();
    }
    auto lines = readLines(config_.tablePath);
    if (!lines) {
        return lines.error();
    }
    auto all = std::move(lines).value();
    if (!all.empty()) {
        all.erase(all.begin());
    }
    return all;
}

Result<std::vector<std::vector<std::string>>> ObjectTable::readDataRows() const {
    auto lines = readDataLines();
    if (!lines) {
        return lines.error();
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(lines.value().size());
    for (const auto& line : lines.value()) {
        rows.push_back(splitFields(line));
    }
    return rows;
}

Result<std::vector<std::string>> ObjectTable::hashColumn() const {
    auto rows = readDataRows();
    if (!rows) {
        return rows.error();
    }
    std::vector<std::string> hashes;
    hashes.reserve(rows.value().size());
    for (const auto& fields : rows.value()) {
        if (fields.size() > kHashColumn && !fields[kHashColumn].empty()) {
            hashes.push_back(fields[kHashColumn]);
        }
    }
    return hashes;
}

Result<size_t> ObjectTable::countRowsForDocument(std::string_view documentName) const {
    auto rows = readDataRows();
    if (!rows) {
        return rows.error();
    }
    size_t count = 0;
    for (const auto& fields : rows.value()) {
        if (fields.size() > kDocumentNameColumn && fields[kDocumentNameColumn] == documentName) {
            ++count;
        }
    }
    return count;
}

Result<size_t> ObjectTable::dataRowCount() const {
    auto lines = readDataLines();
    if (!lines) {
        return lines.error();
    }
    return lines.value().size();
}

Result<std::unordered_set<std::string>>
ObjectTable::objectPathsForDocument(std::string_view documentName, size_t firstRow) const {
    auto rows = readDataRows();
    if (!rows) {
        return rows.error();
    }
    std::unordered_set<std::string> paths;
    const auto& all = rows.value();
    for (size_t i = firstRow; i < all.size(); ++i) {
        const auto& fields = all[i];
        if (fields.size() > kObjectPathColumn && fields[kDocumentNameColumn] == documentName) {
            paths.insert(fields[kObjectPathColumn]);
        }
    }
    return paths;
}

} // namespace pdfledger::ledger
