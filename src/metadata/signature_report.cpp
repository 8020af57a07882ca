#include <pdfledger/config/config_helpers.h>
#include <pdfledger/metadata/signature_report.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>

namespace pdfledger::metadata {

namespace {

const std::regex& blockHeaderRe() {
    static const std::regex re(R"(^Signature\s+#(\d+):)");
    return re;
}

const std::regex& commonNameRe() {
    static const std::regex re(R"(Signer\sCertificate\sCommon\sName:\s(.*)$)");
    return re;
}

const std::regex& signingTimeRe() {
    static const std::regex re(R"(Signing\sTime:\s(.*)$)");
    return re;
}

const std::regex& signedRangesRe() {
    static const std::regex re(R"(Signed\sRanges:\s(.*)$)");
    return re;
}

// Most specific formats first: "%b %d %Y %H:%M" would also accept a value with seconds.
constexpr const char* kTimeFormats[] = {
    "%b %d %Y %H:%M:%S", "%b %d %Y %H:%M",   "%a %b %d %H:%M:%S %Y",
    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S",
};

bool tryParse(const std::string& text, const char* format, std::tm& out) {
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    std::tm tm{};
    in >> std::get_time(&tm, format);
    if (in.fail()) {
        return false;
    }
    // Anything left must be a separate token (time zone etc.), not a continuation
    int next = in.peek();
    if (next != std::char_traits<char>::eof() && !std::isspace(next) && next != 'Z' &&
        next != '+' && next != '-' && next != '.') {
        return false;
    }
    out = tm;
    return true;
}

} // namespace

std::string normalizeSigningTime(std::string_view raw) {
    std::string text = config::trimmed(raw);
    if (text.empty()) {
        return text;
    }

    std::tm tm{};
    for (const char* format : kTimeFormats) {
        if (tryParse(text, format, tm)) {
            std::ostringstream out;
            out.imbue(std::locale::classic());
            out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }
    }
    return text;
}

void SignatureReportParser::feedLine(std::string_view rawLine) {
    std::string line(rawLine);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::smatch match;
    std::string header = config::trimmed(line);
    if (std::regex_search(header, match, blockHeaderRe())) {
        size_t index = 0;
        try {
            index = std::stoul(match[1].str());
        } catch (const std::exception&) {
            index = 0;
        }
        current_ = (index >= 1 && index <= kMaxSignatureBlocks) ? index : 0;
        return;
    }

    if (current_ == 0) {
        return;
    }

    auto& block = blocks_[current_ - 1];
    if (std::regex_search(line, match, commonNameRe())) {
        block.commonName = config::trimmed(match[1].str());
    } else if (std::regex_search(line, match, signingTimeRe())) {
        block.signingTime = normalizeSigningTime(match[1].str());
    } else if (std::regex_search(line, match, signedRangesRe())) {
        block.byteRanges = config::trimmed(match[1].str());
    }
}

SignatureBlocks SignatureReportParser::parse(std::string_view report) {
    SignatureReportParser parser;
    size_t start = 0;
    while (start < report.size()) {
        size_t end = report.find('\n', start);
        if (end == std::string_view::npos) {
            parser.feedLine(report.substr(start));
            break;
        }
        parser.feedLine(report.substr(start, end - start));
        start = end + 1;
    }
    return parser.blocks();
}

} // namespace pdfledger::metadata
