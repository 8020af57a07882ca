#pragma once

#include <pdfledger/core/types.h>

#include <chrono>
#include <ctime>
#include <string>

namespace pdfledger {

// YYYY-MM-DDTHH:MM:SSZ
inline std::string formatUtcIso(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline std::string utcNowIso() {
    return formatUtcIso(std::chrono::system_clock::now());
}

} // namespace pdfledger
