#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and bar-interval utilities (nanosecond epoch timestamps)
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC  = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN  = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY  = 24ULL * NS_PER_HOUR;

// Crypto markets trade around the clock, so a year is 365 full days.
constexpr double DAYS_PER_YEAR = 365.0;

// Default bar interval for annualization.
constexpr const char* DEFAULT_INTERVAL = "1h";

inline uint64_t interval_ns(const std::string& interval) {
    if (interval == "1m")  return NS_PER_MIN;
    if (interval == "5m")  return 5ULL * NS_PER_MIN;
    if (interval == "15m") return 15ULL * NS_PER_MIN;
    if (interval == "1h")  return NS_PER_HOUR;
    if (interval == "4h")  return 4ULL * NS_PER_HOUR;
    if (interval == "1d")  return NS_PER_DAY;
    throw InvalidParameterError("Unsupported bar interval: '" + interval +
                                "' (expected 1m, 5m, 15m, 1h, 4h or 1d)");
}

// Number of bars of the given interval in one year: 1h -> 24 * 365.
inline double periods_per_year(const std::string& interval) {
    double year_ns = DAYS_PER_YEAR * static_cast<double>(NS_PER_DAY);
    return year_ns / static_cast<double>(interval_ns(interval));
}

// Days between two timestamps, truncated.
inline int64_t whole_days_between(uint64_t start_ts, uint64_t end_ts) {
    if (end_ts <= start_ts) return 0;
    return static_cast<int64_t>((end_ts - start_ts) / NS_PER_DAY);
}

}  // namespace time_utils
