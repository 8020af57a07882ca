#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::metadata {

// Case/filing attributes encoded in names like MCRO_<case>_<type>_<date>_....pdf
struct FilingAttributes {
    std::string caseNumber;
    std::string filingType;
    std::string filingDate;

    bool operator==(const FilingAttributes&) const = default;
};

inline constexpr std::string_view kFilingPrefix = "MCRO_";
inline constexpr char kFilingDelimiter = '_';

// The document extension is stripped only from the final field of the name, and only when that
// field is one of the three kept. Names without the prefix yield blanks.
FilingAttributes parseFilingName(std::string_view baseName,
                                 const std::vector<std::string>& documentExtensions = {".pdf"});

} // namespace pdfledger::metadata
