#pragma once

/**
 * Time utilities for the governor
 *
 * All core components take time as an injected Timestamp; only the trader
 * application and the live client read clocks, through these helpers.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace riskgov {
namespace util {

/**
 * Current wall-clock time in nanoseconds since Unix epoch.
 * Used for cycle timestamps so that daily boundaries line up with UTC days.
 */
inline Timestamp wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline uint64_t wall_clock_ms() {
    return wall_clock_ns() / 1'000'000ULL;
}

/**
 * UTC day number of a wall-clock timestamp (days since epoch).
 */
inline uint64_t utc_day_index(Timestamp wall_ns) {
    return wall_ns / NS_PER_DAY;
}

/**
 * Wall-clock timestamp as "YYYYmmdd_HHMMSS" in UTC, for file names.
 */
inline std::string utc_compact(Timestamp wall_ns) {
    std::time_t secs = static_cast<std::time_t>(wall_ns / NS_PER_SECOND);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf, n);
}

/**
 * Fires once each time the UTC day changes.
 *
 *   DailyBoundary boundary(now);
 *   if (boundary.crossed(now)) executor.on_daily_boundary();
 */
class DailyBoundary {
public:
    explicit DailyBoundary(Timestamp start_ns) : day_(utc_day_index(start_ns)) {}

    bool crossed(Timestamp now_ns) {
        uint64_t day = utc_day_index(now_ns);
        if (day > day_) {
            day_ = day;
            return true;
        }
        return false;
    }

    uint64_t current_day() const { return day_; }

private:
    uint64_t day_;
};

} // namespace util
} // namespace riskgov
