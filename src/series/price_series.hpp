#pragma once

#include "errors.hpp"
#include "series/bar.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// PriceSeries — immutable, timestamp-ordered sequence of bars
//
// Storage is shared, so copies and slices are cheap and safe to hand to
// concurrent backtest runs. A slice cannot reach bars outside its range.
// ---------------------------------------------------------------------------
class PriceSeries {
public:
    PriceSeries() : bars_(std::make_shared<const std::vector<Bar>>()) {}

    explicit PriceSeries(std::vector<Bar> bars, std::string symbol = "",
                         std::string interval = "")
        : symbol_(std::move(symbol)), interval_(std::move(interval)) {
        for (size_t i = 1; i < bars.size(); ++i) {
            if (bars[i].ts <= bars[i - 1].ts) {
                throw InvalidParameterError(
                    "PriceSeries timestamps must be strictly increasing (bar " +
                    std::to_string(i) + ")");
            }
        }
        end_ = bars.size();
        bars_ = std::make_shared<const std::vector<Bar>>(std::move(bars));
    }

    size_t size() const { return end_ - begin_; }
    bool empty() const { return size() == 0; }

    const Bar& operator[](size_t i) const { return (*bars_)[begin_ + i]; }

    const Bar& at(size_t i) const {
        if (i >= size()) {
            throw std::out_of_range("PriceSeries index " + std::to_string(i) +
                                    " out of range (size " + std::to_string(size()) + ")");
        }
        return (*bars_)[begin_ + i];
    }

    const Bar& front() const { return at(0); }
    const Bar& back() const { return at(size() - 1); }

    const std::string& symbol() const { return symbol_; }
    const std::string& interval() const { return interval_; }

    // Bars [begin, end) of this series as a new series.
    PriceSeries slice(size_t begin, size_t end) const {
        if (begin > end || end > size()) {
            throw std::out_of_range("PriceSeries slice [" + std::to_string(begin) + ", " +
                                    std::to_string(end) + ") out of range (size " +
                                    std::to_string(size()) + ")");
        }
        PriceSeries out(*this);
        out.begin_ = begin_ + begin;
        out.end_ = begin_ + end;
        return out;
    }

    // Bar offset of this series inside the storage it was sliced from.
    size_t offset() const { return begin_; }

    // Close prices; unusable closes (non-finite or <= 0) come back as NaN.
    std::vector<double> closes() const {
        std::vector<double> out;
        out.reserve(size());
        for (size_t i = 0; i < size(); ++i) {
            const Bar& b = (*this)[i];
            out.push_back(b.has_valid_close() ? b.close
                                              : std::numeric_limits<double>::quiet_NaN());
        }
        return out;
    }

private:
    std::shared_ptr<const std::vector<Bar>> bars_;
    size_t begin_ = 0;
    size_t end_ = 0;
    std::string symbol_;
    std::string interval_;
};

// ---------------------------------------------------------------------------
// SeriesView — bars [0..t] of a series; what a strategy may see at bar t
// ---------------------------------------------------------------------------
class SeriesView {
public:
    SeriesView(const PriceSeries& series, size_t t) : series_(series), t_(t) {
        if (t >= series.size()) {
            throw std::out_of_range("SeriesView cursor beyond end of series");
        }
    }

    size_t size() const { return t_ + 1; }
    size_t index() const { return t_; }

    const Bar& current() const { return series_[t_]; }

    const Bar& at(size_t i) const {
        if (i > t_) {
            throw std::out_of_range("Look-ahead: bar " + std::to_string(i) +
                                    " requested at cursor " + std::to_string(t_));
        }
        return series_[i];
    }

    const Bar& operator[](size_t i) const { return at(i); }

private:
    const PriceSeries& series_;
    size_t t_;
};
