#include <pdfledger/ledger/table_schema.h>

namespace pdfledger::ledger {

namespace {

template <size_t N> std::string joinColumns(const std::array<std::string_view, N>& columns) {
    std::string out;
    for (size_t i = 0; i < N; ++i) {
        if (i > 0) {
            out.push_back('\t');
        }
        out.append(columns[i]);
    }
    return out;
}

} // namespace

const char* schemaVersionName(SchemaVersion version) {
    switch (version) {
        case SchemaVersion::Empty: return "empty";
        case SchemaVersion::Legacy5: return "legacy-5";
        case SchemaVersion::Current: return "current";
        case SchemaVersion::Custom: return "custom";
    }
    return "unknown";
}

std::string currentHeader() {
    static const std::string header = joinColumns(kObjectColumns);
    return header;
}

std::string legacyHeader() {
    static const std::string header = joinColumns(kLegacyObjectColumns);
    return header;
}

SchemaVersion detectSchema(std::string_view headerLine) {
    if (headerLine.empty()) {
        return SchemaVersion::Empty;
    }
    if (headerLine == currentHeader()) {
        return SchemaVersion::Current;
    }
    if (headerLine == legacyHeader()) {
        return SchemaVersion::Legacy5;
    }
    return SchemaVersion::Custom;
}

std::string padLegacyRow(std::string_view row) {
    std::string out(kLegacyLeadingPad, '\t');
    out.append(row);
    out.append(kLegacyTrailingPad, '\t');
    return out;
}

SchemaMigration SchemaMigration::apply(std::vector<std::string> lines) {
    SchemaMigration result;
    result.from = lines.empty() ? SchemaVersion::Empty : detectSchema(lines.front());

    if (result.from != SchemaVersion::Legacy5) {
        result.lines = std::move(lines);
        return result;
    }

    result.changed = true;
    result.lines.reserve(lines.size());
    result.lines.push_back(currentHeader());
    for (size_t i = 1; i < lines.size(); ++i) {
        result.lines.push_back(padLegacyRow(lines[i]));
    }
    return result;
}

} // namespace pdfledger::ledger
