#include <pdfledger/ingest/quiescence.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <thread>

namespace pdfledger::ingest {

bool waitForQuiescence(const std::filesystem::path& file, const QuiescencePolicy& policy) {
    std::optional<std::uintmax_t> last;
    for (int attempt = 0; attempt < policy.attempts; ++attempt) {
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        if (ec) {
            last.reset();
        } else if (last && *last == size) {
            return true;
        } else {
            last = size;
        }
        std::this_thread::sleep_for(policy.interval);
    }
    spdlog::debug("{} still changing after {} samples", file.filename().string(), policy.attempts);
    return false;
}

} // namespace pdfledger::ingest
