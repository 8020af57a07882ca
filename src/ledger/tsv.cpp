#include <pdfledger/ledger/tsv.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>

namespace pdfledger::ledger {

std::vector<std::string> splitFields(std::string_view line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.emplace_back(line.substr(start));
            break;
        }
        fields.emplace_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::string joinFields(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out.push_back('\t');
        }
        out += fields[i];
    }
    return out;
}

std::string sanitizeField(std::string_view value) {
    std::string out(value);
    std::replace_if(
        out.begin(), out.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return out;
}

Result<std::vector<std::string>> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return lines;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::ReadError, fmt::format("Cannot open {}", path.string())};
    }
    std::string line;
    while (std::getline(in, line)) {
        // An unterminated final line is an append in progress; it is not a row yet
        if (in.eof()) {
            break;
        }
        lines.push_back(std::move(line));
    }
    if (in.bad()) {
        return Error{ErrorCode::ReadError, fmt::format("Failed reading {}", path.string())};
    }
    return lines;
}

Result<void> appendText(const std::filesystem::path& path, std::string_view text,
                        bool keepFirstLine) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (auto repaired = repairTornTail(path, keepFirstLine); !repaired) {
            return repaired.error();
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot open {} for append", path.string())};
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, fmt::format("Failed appending to {}", path.string())};
    }
    return {};
}

Result<bool> repairTornTail(const std::filesystem::path& path, bool keepFirstLine) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        return false;
    }

    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        return Error{ErrorCode::ReadError, fmt::format("Cannot open {}", path.string())};
    }

    char last = 0;
    file.seekg(static_cast<std::streamoff>(size - 1));
    file.get(last);
    if (last == '\n') {
        return false;
    }

    // Scan backwards for the newline that ends the last complete line
    constexpr std::uintmax_t kChunk = 64 * 1024;
    std::string buffer;
    std::uintmax_t end = size;
    std::uintmax_t keep = 0;
    bool found = false;
    while (end > 0 && !found) {
        std::uintmax_t begin = end > kChunk ? end - kChunk : 0;
        buffer.resize(static_cast<size_t>(end - begin));
        file.seekg(static_cast<std::streamoff>(begin));
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!file) {
            return Error{ErrorCode::ReadError, fmt::format("Failed reading {}", path.string())};
        }
        auto pos = buffer.rfind('\n');
        if (pos != std::string::npos) {
            keep = begin + pos + 1;
            found = true;
        }
        end = begin;
    }

    if (!found && keepFirstLine) {
        file.clear();
        file.seekp(0, std::ios::end);
        file.put('\n');
        file.flush();
        if (!file) {
            return Error{ErrorCode::WriteError, fmt::format("Failed to repair {}", path.string())};
        }
        spdlog::warn("Completed unterminated header line in {}", path.string());
        return true;
    }
    file.close();

    std::filesystem::resize_file(path, keep, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     fmt::format("Failed to truncate torn tail of {}: {}", path.string(),
                                 ec.message())};
    }
    spdlog::warn("Dropped {} byte(s) of an interrupted append at the end of {}", size - keep,
                 path.string());
    return true;
}

} // namespace pdfledger::ledger
