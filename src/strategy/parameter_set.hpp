#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ParameterSet — named numeric strategy parameters, ordered by name
// ---------------------------------------------------------------------------
using ParameterSet = std::map<std::string, double>;

namespace params {

inline double get(const ParameterSet& p, const std::string& name, double fallback) {
    auto it = p.find(name);
    return (it == p.end()) ? fallback : it->second;
}

// Integer-valued parameter (periods, windows). Rejects fractional values and
// values outside the range of int.
inline int get_int(const ParameterSet& p, const std::string& name, int fallback) {
    auto it = p.find(name);
    if (it == p.end()) return fallback;
    double v = it->second;
    if (!std::isfinite(v) || std::floor(v) != v) {
        throw InvalidParameterError("Parameter '" + name + "' must be an integer, got " +
                                    std::to_string(v));
    }
    if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidParameterError("Parameter '" + name + "' is out of integer range, got " +
                                    std::to_string(v));
    }
    return static_cast<int>(v);
}

inline void require_positive(const std::string& name, double v) {
    if (!(v > 0.0)) {
        throw InvalidParameterError("Parameter '" + name + "' must be > 0, got " +
                                    std::to_string(v));
    }
}

inline void require_known(const ParameterSet& p, const std::vector<std::string>& accepted,
                          const std::string& owner) {
    for (const auto& [k, v] : p) {
        if (std::find(accepted.begin(), accepted.end(), k) == accepted.end()) {
            throw InvalidParameterError("Unknown parameter '" + k + "' for " + owner);
        }
    }
}

// Apply `overrides` on top of `base`.
inline ParameterSet merged(const ParameterSet& base, const ParameterSet& overrides) {
    ParameterSet out = base;
    for (const auto& [k, v] : overrides) out[k] = v;
    return out;
}

// "fast=12 slow=26 signal=9"
inline std::string to_string(const ParameterSet& p) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& [k, v] : p) {
        if (!first) ss << " ";
        first = false;
        ss << k << "=" << v;
    }
    return ss.str();
}

}  // namespace params
