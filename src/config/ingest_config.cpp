#include <pdfledger/config/config_helpers.h>
#include <pdfledger/config/ingest_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pdfledger::config {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::filesystem::path anchor(const std::filesystem::path& root, const std::filesystem::path& p) {
    if (p.is_absolute()) {
        return p;
    }
    return root / p;
}

Result<long> parseNumber(const std::string& section, const std::string& key,
                         const std::string& raw, long minimum) {
    long value = 0;
    auto* first = raw.data();
    auto* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < minimum) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid value for {}.{}: '{}'", section, key, raw)};
    }
    return value;
}

} // namespace

LayoutPaths LayoutPaths::resolved() const {
    LayoutPaths out = *this;
    out.inputDir = anchor(root, inputDir);
    out.objectsDir = anchor(root, objectsDir);
    out.hashedDir = anchor(root, hashedDir);
    out.objectsTable = anchor(root, objectsTable);
    out.ledgerTable = anchor(root, ledgerTable);
    out.countsTable = anchor(root, countsTable);
    out.lockDir = anchor(root, lockDir);
    return out;
}

Result<IngestConfig> loadIngestConfig(const std::filesystem::path& root,
                                      const std::filesystem::path& configFile) {
    IngestConfig cfg;
    cfg.paths.root = root;

    if (configFile.empty()) {
        return cfg;
    }

    std::error_code ec;
    if (!std::filesystem::exists(configFile, ec)) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Config file not found: {}", configFile.string())};
    }
    spdlog::debug("Loading configuration from {}", configFile.string());

    auto value = [&](const char* section, const char* key) {
        return parse_config_value(configFile, section, key);
    };
    auto setPath = [&](const char* key, std::filesystem::path& target) {
        if (auto v = value("paths", key); !v.empty()) {
            target = expand_tilde(v);
        }
    };

    setPath("input_dir", cfg.paths.inputDir);
    setPath("objects_dir", cfg.paths.objectsDir);
    setPath("hashed_dir", cfg.paths.hashedDir);
    setPath("objects_table", cfg.paths.objectsTable);
    setPath("ledger_table", cfg.paths.ledgerTable);
    setPath("counts_table", cfg.paths.countsTable);
    setPath("lock_dir", cfg.paths.lockDir);

    if (auto v = value("scan", "poll_seconds"); !v.empty()) {
        auto n = parseNumber("scan", "poll_seconds", v, 1);
        if (!n)
            return n.error();
        cfg.pollInterval = std::chrono::seconds(n.value());
    }
    if (auto v = value("scan", "quiescence_attempts"); !v.empty()) {
        auto n = parseNumber("scan", "quiescence_attempts", v, 1);
        if (!n)
            return n.error();
        cfg.quiescenceAttempts = static_cast<int>(n.value());
    }
    if (auto v = value("scan", "quiescence_interval_ms"); !v.empty()) {
        auto n = parseNumber("scan", "quiescence_interval_ms", v, 0);
        if (!n)
            return n.error();
        cfg.quiescenceInterval = std::chrono::milliseconds(n.value());
    }
    if (auto v = value("scan", "jobs"); !v.empty()) {
        auto n = parseNumber("scan", "jobs", v, 1);
        if (!n)
            return n.error();
        cfg.jobs = static_cast<int>(n.value());
    }
    if (auto v = value("scan", "extensions"); !v.empty()) {
        std::vector<std::string> exts;
        for (auto& e : parse_list(v)) {
            e = lowercase(e);
            if (e.front() != '.') {
                e.insert(e.begin(), '.');
            }
            exts.push_back(std::move(e));
        }
        if (exts.empty()) {
            return Error{ErrorCode::InvalidArgument, "scan.extensions must not be empty"};
        }
        cfg.documentExtensions = std::move(exts);
    }

    if (auto v = value("guard", "stale_seconds"); !v.empty()) {
        auto n = parseNumber("guard", "stale_seconds", v, 0);
        if (!n)
            return n.error();
        cfg.guardStaleAfter = std::chrono::seconds(n.value());
    }

    if (auto v = value("tools", "mutool"); !v.empty())
        cfg.tools.mutool = v;
    if (auto v = value("tools", "pdfsig"); !v.empty())
        cfg.tools.pdfsig = v;
    if (auto v = value("tools", "exiftool"); !v.empty())
        cfg.tools.exiftool = v;
    if (auto v = value("tools", "otfinfo"); !v.empty())
        cfg.tools.otfinfo = v;
    if (auto v = value("tools", "fc_scan"); !v.empty())
        cfg.tools.fcScan = v;

    if (auto v = value("log", "level"); !v.empty())
        cfg.logLevel = lowercase(v);
    if (auto v = value("log", "file"); !v.empty())
        cfg.logFile = anchor(root, expand_tilde(v));

    return cfg;
}

bool isDocumentPath(const std::filesystem::path& path, const std::vector<std::string>& extensions) {
    auto ext = lowercase(path.extension().string());
    if (ext.empty()) {
        return false;
    }
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

} // namespace pdfledger::config
