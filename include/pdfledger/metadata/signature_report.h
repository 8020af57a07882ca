#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace pdfledger::metadata {

inline constexpr size_t kMaxSignatureBlocks = 4;

struct SignatureBlock {
    std::string commonName;
    std::string signingTime; ///< YYYY-MM-DD HH:MM:SS, or the raw text when unparseable
    std::string byteRanges;  ///< verbatim

    bool empty() const {
        return commonName.empty() && signingTime.empty() && byteRanges.empty();
    }
};

using SignatureBlocks = std::array<SignatureBlock, kMaxSignatureBlocks>;

/**
 * @brief Line scanner for pdfsig-style signature reports.
 *
 * State is Outside or Inside(N), N in 1..4. A "Signature #N:" line enters block N; a block
 * header with any other index leaves the current block, so only the first four blocks are
 * kept. Field lines are recognized only inside a block; everything else is ignored.
 */
class SignatureReportParser {
public:
    void feedLine(std::string_view line);

    // Index of the current block (1..4), 0 when outside any block
    size_t currentBlock() const { return current_; }

    const SignatureBlocks& blocks() const { return blocks_; }

    static SignatureBlocks parse(std::string_view report);

private:
    SignatureBlocks blocks_{};
    size_t current_ = 0;
};

// Normalizes a signing time to YYYY-MM-DD HH:MM:SS; returns the trimmed input on failure.
std::string normalizeSigningTime(std::string_view raw);

} // namespace pdfledger::metadata
