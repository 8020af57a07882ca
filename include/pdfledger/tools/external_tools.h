#pragma once

#include <pdfledger/config/ingest_config.h>
#include <pdfledger/core/types.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pdfledger::tools {

struct AuthorCreator {
    std::string author;
    std::string creator;
};

// Explodes a document into sub-object files under a destination directory
class IObjectExtractor {
public:
    virtual ~IObjectExtractor() = default;

    // Returns the regular files the extraction added under destination, sorted. Files already
    // there beforehand are not output. Partial output of a failing tool is returned as success;
    // ExtractionFailed only when nothing was produced.
    virtual Result<std::vector<std::filesystem::path>>
    extract(const std::filesystem::path& document, const std::filesystem::path& destination) = 0;
};

// Document-level metadata. Implementations return blanks when their tool is unavailable.
class IDocumentMetadataProvider {
public:
    virtual ~IDocumentMetadataProvider() = default;

    virtual AuthorCreator authorCreator(const std::filesystem::path& document) = 0;
    virtual std::string signatureReport(const std::filesystem::path& document) = 0;
};

class IFontNameProvider {
public:
    virtual ~IFontNameProvider() = default;

    virtual std::string fontName(const std::filesystem::path& fontFile) = 0;
};

// An optional executable; logs one note the first time it is found missing
class OptionalTool {
public:
    explicit OptionalTool(std::string name);

    const std::string& name() const { return name_; }
    bool available();
    void markUnavailable();

private:
    std::string name_;
    std::atomic<int> state_{0}; // 0 unknown, 1 available, 2 missing
    std::atomic<bool> noted_{false};
};

// mutool extract, run with the destination as working directory
class MutoolExtractor : public IObjectExtractor {
public:
    explicit MutoolExtractor(std::string executable = "mutool");

    Result<std::vector<std::filesystem::path>>
    extract(const std::filesystem::path& document,
            const std::filesystem::path& destination) override;

private:
    std::string executable_;
};

// exiftool for Author/Creator, pdfsig for the signature report
class ToolMetadataProvider : public IDocumentMetadataProvider {
public:
    ToolMetadataProvider(std::string exiftool, std::string pdfsig);

    AuthorCreator authorCreator(const std::filesystem::path& document) override;
    std::string signatureReport(const std::filesystem::path& document) override;

private:
    std::string exifTag(const std::filesystem::path& document, const std::string& tag);

    OptionalTool exiftool_;
    OptionalTool pdfsig_;
};

// otfinfo "Full name", falling back to fc-scan family
class ToolFontNameProvider : public IFontNameProvider {
public:
    ToolFontNameProvider(std::string otfinfo, std::string fcScan);

    std::string fontName(const std::filesystem::path& fontFile) override;

private:
    OptionalTool otfinfo_;
    OptionalTool fcScan_;
};

// Every regular file below dir, sorted
std::vector<std::filesystem::path> listFilesRecursive(const std::filesystem::path& dir);

std::unique_ptr<IObjectExtractor> createObjectExtractor(const config::ToolNames& names);
std::unique_ptr<IDocumentMetadataProvider> createMetadataProvider(const config::ToolNames& names);
std::unique_ptr<IFontNameProvider> createFontNameProvider(const config::ToolNames& names);

} // namespace pdfledger::tools
