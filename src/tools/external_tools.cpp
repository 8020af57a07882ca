#include <pdfledger/config/config_helpers.h>
#include <pdfledger/tools/external_tools.h>
#include <pdfledger/tools/process_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace pdfledger::tools {

namespace {

std::string firstLine(const std::string& text) {
    auto end = text.find('\n');
    return config::trimmed(text.substr(0, end));
}

} // namespace

OptionalTool::OptionalTool(std::string name) : name_(std::move(name)) {}

bool OptionalTool::available() {
    int state = state_.load(std::memory_order_acquire);
    if (state == 0) {
        state = findExecutable(name_) ? 1 : 2;
        state_.store(state, std::memory_order_release);
    }
    if (state == 2 && !noted_.exchange(true)) {
        spdlog::warn("NOTE: Optional tool not found: {}", name_);
    }
    return state == 1;
}

void OptionalTool::markUnavailable() {
    state_.store(2, std::memory_order_release);
    if (!noted_.exchange(true)) {
        spdlog::warn("NOTE: Optional tool not found: {}", name_);
    }
}

std::vector<std::filesystem::path> listFilesRecursive(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return files;
    }
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Listing {} stopped early: {}", dir.string(), ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ---------------------------------------------------------------------------
// MutoolExtractor

MutoolExtractor::MutoolExtractor(std::string executable) : executable_(std::move(executable)) {}

Result<std::vector<std::filesystem::path>>
MutoolExtractor::extract(const std::filesystem::path& document,
                         const std::filesystem::path& destination) {
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return Error{ErrorCode::ExtractionFailed,
                     fmt::format("Cannot create {}: {}", destination.string(), ec.message())};
    }

    auto before = listFilesRecursive(destination);

    auto absDoc = std::filesystem::absolute(document, ec);
    ProcessSpec spec{executable_, {"extract", "--", ec ? document.string() : absDoc.string()},
                     destination};
    auto run = runProcess(spec);
    if (!run) {
        return Error{ErrorCode::ExtractionFailed, run.error().message};
    }

    std::vector<std::filesystem::path> files;
    for (auto& file : listFilesRecursive(destination)) {
        if (!std::binary_search(before.begin(), before.end(), file)) {
            files.push_back(std::move(file));
        }
    }
    if (run.value().exitCode != 0) {
        if (files.empty()) {
            return Error{ErrorCode::ExtractionFailed,
                         fmt::format("{} extract exited with {} for {}", executable_,
                                     run.value().exitCode, document.filename().string())};
        }
        spdlog::warn("{} extract exited with {} for {}; keeping {} partial object(s)", executable_,
                     run.value().exitCode, document.filename().string(), files.size());
    }
    return files;
}

// ---------------------------------------------------------------------------
// ToolMetadataProvider

ToolMetadataProvider::ToolMetadataProvider(std::string exiftool, std::string pdfsig)
    : exiftool_(std::move(exiftool)), pdfsig_(std::move(pdfsig)) {}

std::string ToolMetadataProvider::exifTag(const std::filesystem::path& document,
                                          const std::string& tag) {
    auto run = runProcess({exiftool_.name(), {"-s", "-s", "-s", "-" + tag, document.string()}, {}});
    if (!run) {
        if (run.error() == ErrorCode::ToolUnavailable) {
            exiftool_.markUnavailable();
        }
        return {};
    }
    if (run.value().exitCode != 0) {
        return {};
    }
    return firstLine(run.value().output);
}

AuthorCreator ToolMetadataProvider::authorCreator(const std::filesystem::path& document) {
    AuthorCreator out;
    if (!exiftool_.available()) {
        return out;
    }
    out.author = exifTag(document, "Author");
    out.creator = exifTag(document, "Creator");
    return out;
}

std::string ToolMetadataProvider::signatureReport(const std::filesystem::path& document) {
    if (!pdfsig_.available()) {
        return {};
    }
    auto run = runProcess({pdfsig_.name(), {document.string()}, {}});
    if (!run) {
        if (run.error() == ErrorCode::ToolUnavailable) {
            pdfsig_.markUnavailable();
        }
        return {};
    }
    // pdfsig exits non-zero for unsigned documents; whatever it printed is still parsed
    return std::move(run).value().output;
}

// ---------------------------------------------------------------------------
// ToolFontNameProvider

ToolFontNameProvider::ToolFontNameProvider(std::string otfinfo, std::string fcScan)
    : otfinfo_(std::move(otfinfo)), fcScan_(std::move(fcScan)) {}

std::string ToolFontNameProvider::fontName(const std::filesystem::path& fontFile) {
    if (otfinfo_.available()) {
        auto run = runProcess({otfinfo_.name(), {"-i", fontFile.string()}, {}});
        if (run && run.value().exitCode == 0) {
            std::istringstream in(run.value().output);
            std::string line;
            constexpr std::string_view prefix = "Full name:";
            while (std::getline(in, line)) {
                if (line.starts_with(prefix)) {
                    return config::trimmed(std::string_view(line).substr(prefix.size()));
                }
            }
        } else if (!run && run.error() == ErrorCode::ToolUnavailable) {
            otfinfo_.markUnavailable();
        }
    }

    if (fcScan_.available()) {
        auto run = runProcess({fcScan_.name(), {"--format", "%{family}\n", fontFile.string()}, {}});
        if (run && run.value().exitCode == 0) {
            return firstLine(run.value().output);
        }
        if (!run && run.error() == ErrorCode::ToolUnavailable) {
            fcScan_.markUnavailable();
        }
    }
    return {};
}

std::unique_ptr<IObjectExtractor> createObjectExtractor(const config::ToolNames& names) {
    return std::make_unique<MutoolExtractor>(names.mutool);
}

std::unique_ptr<IDocumentMetadataProvider> createMetadataProvider(const config::ToolNames& names) {
    return std::make_unique<ToolMetadataProvider>(names.exiftool, names.pdfsig);
}

std::unique_ptr<IFontNameProvider> createFontNameProvider(const config::ToolNames& names) {
    return std::make_unique<ToolFontNameProvider>(names.otfinfo, names.fcScan);
}

} // namespace pdfledger::tools
