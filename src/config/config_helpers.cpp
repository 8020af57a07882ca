#include <fstream>
#include <pdfledger/config/config_helpers.h>

namespace pdfledger::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if (k == section + "." + key || (currentSection == section && k == key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_path(const std::filesystem::path& root,
                                      const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("PDFLEDGER_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    auto local = root / "pdfledger.toml";
    std::error_code ec;
    if (std::filesystem::exists(local, ec)) {
        return local;
    }
    return {};
}

} // namespace pdfledger::config
