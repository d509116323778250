#pragma once

#include "errors.hpp"
#include "strategy/parameter_set.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

struct ParameterAxis {
    std::string name;
    std::vector<double> values;
};

// ---------------------------------------------------------------------------
// ParameterGrid — ordered axes of candidate values
//
// Combinations enumerate the Cartesian product with the first axis varying
// slowest, so combination i is the same for every caller.
// ---------------------------------------------------------------------------
class ParameterGrid {
public:
    ParameterGrid& add(const std::string& name, std::vector<double> values) {
        axes_.push_back({name, std::move(values)});
        return *this;
    }

    // Inclusive integer-step range: add_range("period", 10, 20, 5) -> {10, 15, 20}.
    ParameterGrid& add_range(const std::string& name, double start, double stop, double step) {
        if (!(step > 0.0) || stop < start) {
            throw InvalidParameterError("Invalid range for '" + name + "'");
        }
        std::vector<double> values;
        for (int i = 0;; ++i) {
            double v = start + step * i;
            if (v > stop + step * 1e-9) break;
            values.push_back(v);
        }
        return add(name, std::move(values));
    }

    const std::vector<ParameterAxis>& axes() const { return axes_; }
    bool empty() const { return axes_.empty(); }

    size_t size() const {
        if (axes_.empty()) return 0;
        size_t n = 1;
        for (const auto& a : axes_) n *= a.values.size();
        return n;
    }

    ParameterSet at(size_t index) const {
        ParameterSet out;
        for (size_t k = axes_.size(); k-- > 0;) {
            const auto& axis = axes_[k];
            out[axis.name] = axis.values[index % axis.values.size()];
            index /= axis.values.size();
        }
        return out;
    }

    std::vector<ParameterSet> combinations() const {
        std::vector<ParameterSet> out;
        size_t n = size();
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) out.push_back(at(i));
        return out;
    }

    // Throws InvalidParameterError unless every axis is usable and named in
    // `accepted`.
    void validate(const std::vector<std::string>& accepted) const {
        if (axes_.empty()) throw InvalidParameterError("Parameter grid is empty");
        std::set<std::string> seen;
        for (const auto& axis : axes_) {
            if (!seen.insert(axis.name).second) {
                throw InvalidParameterError("Duplicate grid axis '" + axis.name + "'");
            }
            if (axis.values.empty()) {
                throw InvalidParameterError("Grid axis '" + axis.name + "' has no candidates");
            }
            for (double v : axis.values) {
                if (!std::isfinite(v)) {
                    throw InvalidParameterError("Grid axis '" + axis.name +
                                                "' has a non-finite candidate");
                }
            }
            if (std::find(accepted.begin(), accepted.end(), axis.name) == accepted.end()) {
                throw InvalidParameterError("Strategy does not accept grid parameter '" +
                                            axis.name + "'");
            }
        }
    }

    // "fast=5,10,15;slow=20:50:10" — comma lists or start:stop:step ranges.
    static ParameterGrid parse(const std::string& text) {
        ParameterGrid grid;
        std::istringstream axes(text);
        std::string item;
        while (std::getline(axes, item, ';')) {
            if (item.empty()) continue;
            auto eq = item.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw InvalidParameterError("Bad grid axis '" + item + "' (expected name=values)");
            }
            std::string name = item.substr(0, eq);
            std::string spec = item.substr(eq + 1);
            if (std::count(spec.begin(), spec.end(), ':') == 2) {
                auto a = spec.find(':');
                auto b = spec.find(':', a + 1);
                grid.add_range(name, parse_number(spec.substr(0, a)),
                               parse_number(spec.substr(a + 1, b - a - 1)),
                               parse_number(spec.substr(b + 1)));
            } else {
                std::vector<double> values;
                std::istringstream vs(spec);
                std::string v;
                while (std::getline(vs, v, ',')) values.push_back(parse_number(v));
                grid.add(name, std::move(values));
            }
        }
        return grid;
    }

private:
    std::vector<ParameterAxis> axes_;

    static double parse_number(const std::string& s) {
        try {
            size_t used = 0;
            double v = std::stod(s, &used);
            if (used != s.size()) throw std::invalid_argument(s);
            return v;
        } catch (const std::exception&) {
            throw InvalidParameterError("Bad grid value '" + s + "'");
        }
    }
};
