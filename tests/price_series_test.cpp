// price_series_test.cpp — Tests for Bar, PriceSeries and SeriesView
//
// Covers timestamp ordering at construction, slicing, the look-ahead guard
// and close extraction with data gaps.

#include <gtest/gtest.h>

#include "errors.hpp"
#include "series/bar.hpp"
#include "series/price_series.hpp"
#include "test_series_helpers.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace test_helpers;

class PriceSeriesTest : public ::testing::Test {};

// ===========================================================================
// 1. Construction
// ===========================================================================

TEST_F(PriceSeriesTest, DefaultIsEmpty) {
    PriceSeries s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
}

TEST_F(PriceSeriesTest, KeepsBarsInOrder) {
    auto s = make_series({100.0, 101.0, 102.0});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s[0].close, 100.0);
    EXPECT_DOUBLE_EQ(s.back().close, 102.0);
    EXPECT_EQ(s.symbol(), "TEST");
    EXPECT_EQ(s.interval(), "1h");
}

TEST_F(PriceSeriesTest, RejectsDuplicateTimestamps) {
    std::vector<Bar> bars = {make_bar(100.0, 0), make_bar(101.0, 0)};
    EXPECT_THROW(PriceSeries{bars}, InvalidParameterError);
}

TEST_F(PriceSeriesTest, RejectsDecreasingTimestamps) {
    std::vector<Bar> bars = {make_bar(100.0, 2), make_bar(101.0, 1)};
    EXPECT_THROW(PriceSeries{bars}, InvalidParameterError);
}

TEST_F(PriceSeriesTest, ToleratesTimeGaps) {
    std::vector<Bar> bars = {make_bar(100.0, 0), make_bar(101.0, 5), make_bar(102.0, 6)};
    EXPECT_NO_THROW(PriceSeries{bars});
}

TEST_F(PriceSeriesTest, AtThrowsPastEnd) {
    auto s = make_series({1.0, 2.0});
    EXPECT_THROW(s.at(2), std::out_of_range);
}

// ===========================================================================
// 2. Slicing
// ===========================================================================

TEST_F(PriceSeriesTest, SliceSeesOnlyItsRange) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    auto sl = s.slice(1, 4);
    ASSERT_EQ(sl.size(), 3u);
    EXPECT_DOUBLE_EQ(sl[0].close, 2.0);
    EXPECT_DOUBLE_EQ(sl.back().close, 4.0);
    EXPECT_EQ(sl.offset(), 1u);
    EXPECT_THROW(sl.at(3), std::out_of_range);
}

TEST_F(PriceSeriesTest, SliceOfSliceIsRelative) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    auto sl = s.slice(1, 5).slice(2, 4);
    ASSERT_EQ(sl.size(), 2u);
    EXPECT_DOUBLE_EQ(sl[0].close, 4.0);
    EXPECT_EQ(sl.offset(), 3u);
}

TEST_F(PriceSeriesTest, SliceOutOfRangeThrows) {
    auto s = make_series({1.0, 2.0, 3.0});
    EXPECT_THROW(s.slice(2, 4), std::out_of_range);
    EXPECT_THROW(s.slice(2, 1), std::out_of_range);
}

TEST_F(PriceSeriesTest, SliceKeepsSymbolAndInterval) {
    auto s = make_series({1.0, 2.0, 3.0}, "4h");
    EXPECT_EQ(s.slice(0, 2).interval(), "4h");
}

// ===========================================================================
// 3. Closes and data gaps
// ===========================================================================

TEST_F(PriceSeriesTest, ClosesMapUnusablePricesToNaN) {
    auto s = make_series({100.0, NaN, 0.0, -5.0, 101.0});
    auto c = s.closes();
    ASSERT_EQ(c.size(), 5u);
    EXPECT_DOUBLE_EQ(c[0], 100.0);
    EXPECT_TRUE(std::isnan(c[1]));
    EXPECT_TRUE(std::isnan(c[2]));
    EXPECT_TRUE(std::isnan(c[3]));
    EXPECT_DOUBLE_EQ(c[4], 101.0);
}

TEST_F(PriceSeriesTest, BarValidClose) {
    EXPECT_TRUE(make_bar(1.0, 0).has_valid_close());
    EXPECT_FALSE(make_bar(NaN, 0).has_valid_close());
    EXPECT_FALSE(make_bar(0.0, 0).has_valid_close());
}

// ===========================================================================
// 4. SeriesView look-ahead guard
// ===========================================================================

TEST_F(PriceSeriesTest, ViewExposesBarsUpToCursor) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0});
    SeriesView v(s, 2);
    EXPECT_EQ(v.size(), 3u);
    EXPECT_EQ(v.index(), 2u);
    EXPECT_DOUBLE_EQ(v.current().close, 3.0);
    EXPECT_DOUBLE_EQ(v[0].close, 1.0);
}

TEST_F(PriceSeriesTest, ViewRefusesFutureBars) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0});
    SeriesView v(s, 1);
    EXPECT_THROW(v.at(2), std::out_of_range);
    EXPECT_THROW(v[3], std::out_of_range);
}

TEST_F(PriceSeriesTest, ViewCursorMustBeInsideSeries) {
    auto s = make_series({1.0, 2.0});
    EXPECT_THROW(SeriesView(s, 2), std::out_of_range);
}

// ===========================================================================
// 5. Interval utilities
// ===========================================================================

TEST_F(PriceSeriesTest, PeriodsPerYearByInterval) {
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("1m"), 525600.0);
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("5m"), 105120.0);
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("15m"), 35040.0);
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("1h"), 8760.0);
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("4h"), 2190.0);
    EXPECT_DOUBLE_EQ(time_utils::periods_per_year("1d"), 365.0);
}

TEST_F(PriceSeriesTest, UnknownIntervalThrows) {
    EXPECT_THROW(time_utils::interval_ns("2h"), InvalidParameterError);
}
