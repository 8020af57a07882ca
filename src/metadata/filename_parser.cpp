#include <pdfledger/metadata/filename_parser.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace pdfledger::metadata {

namespace {

bool endsWithNoCase(std::string_view value, std::string_view suffix) {
    if (suffix.empty() || value.size() < suffix.size()) {
        return false;
    }
    auto tail = value.substr(value.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

std::string_view stripExtension(std::string_view field, const std::vector<std::string>& exts) {
    for (const auto& ext : exts) {
        if (endsWithNoCase(field, ext)) {
            return field.substr(0, field.size() - ext.size());
        }
    }
    return field;
}

} // namespace

FilingAttributes parseFilingName(std::string_view baseName,
                                 const std::vector<std::string>& documentExtensions) {
    FilingAttributes out;
    if (!baseName.starts_with(kFilingPrefix)) {
        return out;
    }

    auto rest = baseName.substr(kFilingPrefix.size());
    std::array<std::string*, 3> targets{&out.caseNumber, &out.filingType, &out.filingDate};

    size_t start = 0;
    for (auto* target : targets) {
        size_t next = rest.find(kFilingDelimiter, start);
        bool last = next == std::string_view::npos;
        auto field = rest.substr(start, last ? std::string_view::npos : next - start);
        if (last) {
            field = stripExtension(field, documentExtensions);
        }
        target->assign(field);
        if (last) {
            break;
        }
        start = next + 1;
    }
    return out;
}

} // namespace pdfledger::metadata
