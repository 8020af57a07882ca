#include <pdfledger/crypto/hasher.h>
#include <pdfledger/ingest/safe_name.h>

#include <algorithm>
#include <cctype>
#include <span>

namespace pdfledger::ingest {

namespace {

constexpr size_t kNameDigestChars = 12;

bool iendsWith(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) {
        return false;
    }
    return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace

std::string documentStem(std::string_view baseName, const std::vector<std::string>& extensions) {
    for (const auto& ext : extensions) {
        if (!ext.empty() && iendsWith(baseName, ext)) {
            return std::string(baseName.substr(0, baseName.size() - ext.size()));
        }
    }
    return std::string(baseName);
}

std::string safeDestinationName(std::string_view baseName,
                                const std::vector<std::string>& extensions) {
    std::string stem = documentStem(baseName, extensions);
    for (auto& c : stem) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') {
            c = '_';
        }
    }

    auto digest =
        crypto::SHA256Hasher::hash(std::as_bytes(std::span(baseName.data(), baseName.size())));
    return stem + "-" + digest.substr(0, kNameDigestChars);
}

} // namespace pdfledger::ingest
