#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pdfledger::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed(std::string_view in) {
    std::string s(in);
    trim(s);
    return s;
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Accepts "[section] key = v" and "section.key = v".
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list. Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Config file resolution: explicit override, then PDFLEDGER_CONFIG, then <root>/pdfledger.toml.
// Returns an empty path when none applies.
std::filesystem::path get_config_path(const std::filesystem::path& root,
                                      const std::string& override_path = "");

} // namespace pdfledger::config
