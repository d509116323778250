// parameter_grid_test.cpp — Tests for ParameterGrid enumeration, validation and parsing

#include <gtest/gtest.h>

#include "errors.hpp"
#include "optimize/parameter_grid.hpp"

#include <limits>
#include <set>
#include <string>
#include <vector>

class ParameterGridTest : public ::testing::Test {
protected:
    ParameterGrid grid;
    const std::vector<std::string> ma_params = {"fast", "slow", "use_ema"};
};

// ===========================================================================
// 1. Enumeration
// ===========================================================================

TEST_F(ParameterGridTest, EmptyGridHasNoCombinations) {
    EXPECT_TRUE(grid.empty());
    EXPECT_EQ(grid.size(), 0u);
    EXPECT_TRUE(grid.combinations().empty());
}

TEST_F(ParameterGridTest, SizeIsProductOfAxes) {
    grid.add("fast", {5, 10, 15}).add("slow", {20, 30, 40, 50});
    EXPECT_EQ(grid.size(), 12u);
    EXPECT_EQ(grid.combinations().size(), 12u);
}

TEST_F(ParameterGridTest, FirstAxisVariesSlowest) {
    grid.add("fast", {5, 10, 15}).add("slow", {20, 30, 40, 50});
    auto c0 = grid.at(0);
    EXPECT_DOUBLE_EQ(c0.at("fast"), 5.0);
    EXPECT_DOUBLE_EQ(c0.at("slow"), 20.0);
    auto c1 = grid.at(1);
    EXPECT_DOUBLE_EQ(c1.at("fast"), 5.0);
    EXPECT_DOUBLE_EQ(c1.at("slow"), 30.0);
    auto c4 = grid.at(4);
    EXPECT_DOUBLE_EQ(c4.at("fast"), 10.0);
    EXPECT_DOUBLE_EQ(c4.at("slow"), 20.0);
    auto c11 = grid.at(11);
    EXPECT_DOUBLE_EQ(c11.at("fast"), 15.0);
    EXPECT_DOUBLE_EQ(c11.at("slow"), 50.0);
}

TEST_F(ParameterGridTest, CombinationsAreDistinct) {
    grid.add("fast", {5, 10, 15}).add("slow", {20, 30, 40, 50});
    auto all = grid.combinations();
    std::set<ParameterSet> unique(all.begin(), all.end());
    EXPECT_EQ(unique.size(), all.size());
}

TEST_F(ParameterGridTest, AddRangeIsInclusive) {
    grid.add_range("period", 10, 20, 5);
    ASSERT_EQ(grid.axes().size(), 1u);
    EXPECT_EQ(grid.axes()[0].values, (std::vector<double>{10, 15, 20}));
}

TEST_F(ParameterGridTest, AddRangeRejectsBadStep) {
    EXPECT_THROW(grid.add_range("period", 10, 20, 0), InvalidParameterError);
    EXPECT_THROW(grid.add_range("period", 20, 10, 5), InvalidParameterError);
}

// ===========================================================================
// 2. Validation
// ===========================================================================

TEST_F(ParameterGridTest, ValidGridPasses) {
    grid.add("fast", {5, 10}).add("slow", {20});
    EXPECT_NO_THROW(grid.validate(ma_params));
}

TEST_F(ParameterGridTest, EmptyGridRejected) {
    EXPECT_THROW(grid.validate(ma_params), InvalidParameterError);
}

TEST_F(ParameterGridTest, EmptyAxisRejected) {
    grid.add("fast", {});
    EXPECT_THROW(grid.validate(ma_params), InvalidParameterError);
}

TEST_F(ParameterGridTest, DuplicateAxisRejected) {
    grid.add("fast", {5}).add("fast", {10});
    EXPECT_THROW(grid.validate(ma_params), InvalidParameterError);
}

TEST_F(ParameterGridTest, UnknownAxisRejected) {
    grid.add("period", {14});
    EXPECT_THROW(grid.validate(ma_params), InvalidParameterError);
}

TEST_F(ParameterGridTest, NonFiniteValueRejected) {
    grid.add("fast", {5, std::numeric_limits<double>::infinity()});
    EXPECT_THROW(grid.validate(ma_params), InvalidParameterError);
}

// ===========================================================================
// 3. Parsing
// ===========================================================================

TEST_F(ParameterGridTest, ParseListsAndRanges) {
    auto g = ParameterGrid::parse("fast=5,10;slow=20:40:10");
    ASSERT_EQ(g.axes().size(), 2u);
    EXPECT_EQ(g.axes()[0].name, "fast");
    EXPECT_EQ(g.axes()[0].values, (std::vector<double>{5, 10}));
    EXPECT_EQ(g.axes()[1].name, "slow");
    EXPECT_EQ(g.axes()[1].values, (std::vector<double>{20, 30, 40}));
    EXPECT_EQ(g.size(), 6u);
}

TEST_F(ParameterGridTest, ParseChildKeys) {
    auto g = ParameterGrid::parse("0.period=10,14;quorum=2");
    EXPECT_EQ(g.axes()[0].name, "0.period");
    EXPECT_EQ(g.size(), 2u);
}

TEST_F(ParameterGridTest, ParseRejectsMalformedInput) {
    EXPECT_THROW(ParameterGrid::parse("fast"), InvalidParameterError);
    EXPECT_THROW(ParameterGrid::parse("=5"), InvalidParameterError);
    EXPECT_THROW(ParameterGrid::parse("fast=5,x"), InvalidParameterError);
    EXPECT_THROW(ParameterGrid::parse("fast=5abc"), InvalidParameterError);
}
