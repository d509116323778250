#pragma once

#include "errors.hpp"
#include "series/bar.hpp"
#include "series/price_series.hpp"
#include "time_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CSV price loader — local stand-in for the exchange data source
//
// Columns: timestamp,open,high,low,close[,volume]. A header row is optional;
// when present, columns are matched by name. Timestamps are epoch integers
// (seconds, milliseconds, microseconds or nanoseconds, told apart by
// magnitude) or ISO "YYYY-MM-DD[ T]HH:MM[:SS]" in UTC. Empty or "nan" prices
// load as NaN so the backtester can treat them as data gaps. Rows must be in
// strictly increasing time order.
// ---------------------------------------------------------------------------
namespace csv_loader {

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

inline std::vector<std::string> split(const std::string& line, char sep = ',') {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, sep)) out.push_back(trim(field));
    if (!line.empty() && line.back() == sep) out.push_back("");
    return out;
}

inline bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline bool parse_iso(const std::string& s, uint64_t& ts_ns) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    char sep = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &y, &mo, &d, &sep, &h, &mi, &sec);
    if (n != 3 && n < 6) return false;
    if (n >= 4 && sep != ' ' && sep != 'T') return false;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return false;
    int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    if (days < 0) return false;
    int64_t secs = days * 86400 + h * 3600 + mi * 60 + sec;
    if (static_cast<uint64_t>(secs) >
        std::numeric_limits<uint64_t>::max() / time_utils::NS_PER_SEC) {
        throw InvalidParameterError("Timestamp out of range: '" + s + "'");
    }
    ts_ns = static_cast<uint64_t>(secs) * time_utils::NS_PER_SEC;
    return true;
}

// Epoch integer of unknown unit, or ISO text, to nanoseconds. Throws when the
// value does not fit in uint64 nanoseconds.
inline bool parse_timestamp(const std::string& s, uint64_t& ts_ns) {
    if (all_digits(s)) {
        uint64_t v = 0;
        try {
            v = std::stoull(s);
        } catch (const std::out_of_range&) {
            throw InvalidParameterError("Timestamp out of range: '" + s + "'");
        }
        uint64_t unit = 1;
        if (v < 100'000'000'000ULL) {
            unit = time_utils::NS_PER_SEC;
        } else if (v < 100'000'000'000'000ULL) {
            unit = 1'000'000ULL;
        } else if (v < 100'000'000'000'000'000ULL) {
            unit = 1'000ULL;
        }
        if (v > std::numeric_limits<uint64_t>::max() / unit) {
            throw InvalidParameterError("Timestamp out of range: '" + s + "'");
        }
        ts_ns = v * unit;
        return true;
    }
    return parse_iso(s, ts_ns);
}

inline bool parse_price(const std::string& s, double& out) {
    if (s.empty() || s == "nan" || s == "NaN" || s == "NA") {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

inline int column_index(const std::vector<std::string>& header,
                        const std::vector<std::string>& names) {
    for (size_t i = 0; i < header.size(); ++i) {
        std::string h = header[i];
        for (auto& c : h) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        for (const auto& n : names) {
            if (h == n) return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace csv_loader

inline PriceSeries read_csv_series(std::istream& in, const std::string& source,
                                   const std::string& symbol = "",
                                   const std::string& interval = "") {
    using namespace csv_loader;

    // Default positional layout.
    int c_ts = 0, c_open = 1, c_high = 2, c_low = 3, c_close = 4, c_vol = 5;
    bool first_row = true;

    std::vector<Bar> bars;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        auto fields = split(line);

        if (first_row) {
            first_row = false;
            uint64_t first_ts = 0;
            if (!parse_timestamp(fields[0], first_ts)) {
                c_ts = column_index(fields, {"timestamp", "time", "date", "datetime", "open_time"});
                c_open = column_index(fields, {"open"});
                c_high = column_index(fields, {"high"});
                c_low = column_index(fields, {"low"});
                c_close = column_index(fields, {"close"});
                c_vol = column_index(fields, {"volume"});
                if (c_ts < 0 || c_open < 0 || c_high < 0 || c_low < 0 || c_close < 0) {
                    throw InvalidParameterError(source + ": header must name timestamp, open, "
                                                "high, low and close columns");
                }
                continue;
            }
        }

        auto need = [&](int c) -> const std::string& {
            if (c < 0 || static_cast<size_t>(c) >= fields.size()) {
                throw InvalidParameterError(source + ":" + std::to_string(line_no) +
                                            ": too few columns");
            }
            return fields[static_cast<size_t>(c)];
        };

        Bar bar{};
        if (!parse_timestamp(need(c_ts), bar.ts)) {
            throw InvalidParameterError(source + ":" + std::to_string(line_no) +
                                        ": bad timestamp '" + need(c_ts) + "'");
        }
        bool ok = parse_price(need(c_open), bar.open) && parse_price(need(c_high), bar.high) &&
                  parse_price(need(c_low), bar.low) && parse_price(need(c_close), bar.close);
        if (c_vol >= 0 && static_cast<size_t>(c_vol) < fields.size()) {
            ok = ok && parse_price(fields[static_cast<size_t>(c_vol)], bar.volume);
        }
        if (!ok) {
            throw InvalidParameterError(source + ":" + std::to_string(line_no) +
                                        ": bad price field");
        }
        if (!bars.empty() && bar.ts <= bars.back().ts) {
            throw InvalidParameterError(source + ":" + std::to_string(line_no) +
                                        ": timestamp not after previous row");
        }
        bars.push_back(bar);
    }

    return PriceSeries(std::move(bars), symbol, interval);
}

// Load a price series from a CSV file. Throws std::runtime_error when the
// file cannot be opened and InvalidParameterError for malformed content.
inline PriceSeries load_csv_series(const std::string& path, const std::string& symbol = "",
                                   const std::string& interval = "") {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open price file: " + path);
    }
    return read_csv_series(in, path, symbol, interval);
}
