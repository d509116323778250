// backtester_test.cpp — Tests for the bar-by-bar simulation engine
//
// Uses scripted strategies on short hand-computed series to pin down fills,
// fees, sizing, forced exits, risk exits, data gaps and warm-up handling.

#include <gtest/gtest.h>

#include "backtest/backtest_config.hpp"
#include "backtest/backtester.hpp"
#include "backtest/performance_metrics.hpp"
#include "backtest/trade_record.hpp"
#include "errors.hpp"
#include "strategy/rsi_strategy.hpp"
#include "strategy/strategy_spec.hpp"
#include "test_series_helpers.hpp"

#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace test_helpers;

// ===========================================================================
// Fixture
// ===========================================================================
class BacktesterTest : public ::testing::Test {
protected:
    BacktestConfig cfg;

    void SetUp() override {
        cfg.initial_capital = 1000.0;
        cfg.costs.fee_rate = 0.0;
    }

    BacktestRun run_script(const std::vector<double>& closes,
                           std::map<size_t, Signal> script, bool risk_exits = true) {
        Backtester bt(cfg);
        return bt.run(ScriptedStrategy(std::move(script), risk_exits), make_series(closes));
    }

    static std::vector<double> equities(const BacktestRun& run) {
        std::vector<double> out;
        for (const auto& p : run.equity_curve) out.push_back(p.equity);
        return out;
    }
};

// ===========================================================================
// 1. Fills and fees
// ===========================================================================

TEST_F(BacktesterTest, RoundTripWithFees) {
    cfg.costs.fee_rate = 0.01;
    auto run = run_script({100, 110, 90, 120, 130}, {{1, Signal::BUY}, {3, Signal::SELL}});

    ASSERT_EQ(run.trades.size(), 1u);
    const auto& t = run.trades[0];
    EXPECT_DOUBLE_EQ(t.quantity, 9.0);
    EXPECT_DOUBLE_EQ(t.entry_price, 110.0);
    EXPECT_DOUBLE_EQ(t.exit_price, 120.0);
    EXPECT_DOUBLE_EQ(t.gross_pnl, 90.0);
    EXPECT_NEAR(t.fee_paid, 20.7, 1e-9);
    EXPECT_NEAR(t.net_pnl, 69.3, 1e-9);
    EXPECT_EQ(t.entry_bar_idx, 1);
    EXPECT_EQ(t.exit_bar_idx, 3);
    EXPECT_EQ(t.bars_held, 2);
    EXPECT_EQ(t.exit_reason, exit_reason::SIGNAL);
    EXPECT_FALSE(t.is_forced_exit());

    auto eq = equities(run);
    ASSERT_EQ(eq.size(), 5u);
    EXPECT_NEAR(eq[0], 1000.0, 1e-9);
    EXPECT_NEAR(eq[1], 990.1, 1e-9);
    EXPECT_NEAR(eq[2], 810.1, 1e-9);
    EXPECT_NEAR(eq[3], 1069.3, 1e-9);
    EXPECT_NEAR(eq[4], 1069.3, 1e-9);
    EXPECT_NEAR(run.final_cash, 1069.3, 1e-9);
    EXPECT_NEAR(run.final_equity(), 1069.3, 1e-9);
}

TEST_F(BacktesterTest, HoldOnlyKeepsEquityFlat) {
    auto run = run_script({100, 50, 200, 80}, {});
    EXPECT_TRUE(run.trades.empty());
    for (double e : equities(run)) EXPECT_DOUBLE_EQ(e, 1000.0);
    EXPECT_EQ(run.buy_signals, 0);
    EXPECT_EQ(run.sell_signals, 0);
}

TEST_F(BacktesterTest, OpenPositionForcedClosedAtEnd) {
    cfg.costs.fee_rate = 0.01;
    auto run = run_script({100, 110, 90, 120, 130}, {{1, Signal::BUY}});

    ASSERT_EQ(run.trades.size(), 1u);
    const auto& t = run.trades[0];
    EXPECT_EQ(t.exit_reason, exit_reason::END_OF_DATA);
    EXPECT_TRUE(t.is_forced_exit());
    EXPECT_EQ(t.exit_bar_idx, 4);
    EXPECT_DOUBLE_EQ(t.exit_price, 130.0);
    EXPECT_NEAR(run.final_equity(), 1158.4, 1e-9);
    EXPECT_NEAR(run.final_cash, 1158.4, 1e-9);
}

TEST_F(BacktesterTest, RedundantSignalsAreNoOps) {
    auto run = run_script({100, 101, 102, 103, 104},
                          {{0, Signal::SELL}, {1, Signal::BUY}, {2, Signal::BUY},
                           {3, Signal::SELL}, {4, Signal::SELL}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].entry_bar_idx, 1);
    EXPECT_EQ(run.trades[0].exit_bar_idx, 3);
    EXPECT_EQ(run.buy_signals, 2);
    EXPECT_EQ(run.sell_signals, 3);
}

TEST_F(BacktesterTest, TradesNeverOverlap) {
    auto run = run_script({100, 101, 102, 103, 104, 105, 106},
                          {{0, Signal::BUY}, {2, Signal::SELL}, {3, Signal::BUY},
                           {5, Signal::SELL}});
    ASSERT_EQ(run.trades.size(), 2u);
    EXPECT_LE(run.trades[0].exit_bar_idx, run.trades[1].entry_bar_idx);
    for (const auto& t : run.trades) EXPECT_LT(t.entry_bar_idx, t.exit_bar_idx);
}

// ===========================================================================
// 2. Sizing
// ===========================================================================

TEST_F(BacktesterTest, WholeUnitsRoundDown) {
    auto run = run_script({300, 310}, {{0, Signal::BUY}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(run.trades[0].quantity, 3.0);
}

TEST_F(BacktesterTest, CapitalFractionLimitsEntry) {
    cfg.capital_fraction = 0.5;
    auto run = run_script({100, 100}, {{0, Signal::BUY}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(run.trades[0].quantity, 5.0);
    EXPECT_DOUBLE_EQ(run.equity_curve[0].equity, 1000.0);
}

TEST_F(BacktesterTest, FractionalSizingSpendsBudget) {
    cfg.sizing = SizingPolicy::FRACTIONAL;
    cfg.costs.fee_rate = 0.001;
    auto run = run_script({300, 300}, {{0, Signal::BUY}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_NEAR(run.trades[0].quantity, 1000.0 / (300.0 * 1.001), 1e-9);
    EXPECT_NEAR(run.equity_curve[0].equity + run.trades[0].quantity * 300.0 * 0.001,
                1000.0, 1e-6);
}

TEST_F(BacktesterTest, InsufficientCapitalRejectsBuy) {
    std::ostringstream log;
    cfg.initial_capital = 50.0;
    cfg.log = &log;
    auto run = run_script({100, 100, 100}, {{0, Signal::BUY}});
    EXPECT_TRUE(run.trades.empty());
    EXPECT_EQ(run.rejected_buys, 1);
    EXPECT_EQ(run.buy_signals, 1);
    EXPECT_DOUBLE_EQ(run.final_equity(), 50.0);
    EXPECT_NE(log.str().find("ignored"), std::string::npos);
}

// ===========================================================================
// 3. Risk exits
// ===========================================================================

TEST_F(BacktesterTest, StopLossExitsAtTriggerBar) {
    cfg.stop_loss_pct = 0.04;
    auto run = run_script({100, 97, 95, 90}, {{0, Signal::BUY}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, exit_reason::STOP_LOSS);
    EXPECT_EQ(run.trades[0].exit_bar_idx, 2);
    EXPECT_DOUBLE_EQ(run.trades[0].exit_price, 95.0);
    EXPECT_NEAR(run.final_equity(), 950.0, 1e-9);
}

TEST_F(BacktesterTest, TakeProfitExitsAtTriggerBar) {
    cfg.take_profit_pct = 0.05;
    auto run = run_script({100, 103, 106, 110}, {{0, Signal::BUY}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, exit_reason::TAKE_PROFIT);
    EXPECT_EQ(run.trades[0].exit_bar_idx, 2);
    EXPECT_DOUBLE_EQ(run.trades[0].exit_price, 106.0);
}

TEST_F(BacktesterTest, RiskExitPreemptsSignal) {
    cfg.stop_loss_pct = 0.05;
    auto run = run_script({100, 90, 100}, {{0, Signal::BUY}, {1, Signal::SELL}});
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, exit_reason::STOP_LOSS);
    EXPECT_EQ(run.sell_signals, 0);
}

TEST_F(BacktesterTest, RiskExitsSkippedWhenStrategyOptsOut) {
    cfg.stop_loss_pct = 0.04;
    auto run = run_script({100, 97, 95, 90}, {{0, Signal::BUY}}, false);
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, exit_reason::END_OF_DATA);
    EXPECT_EQ(run.trades[0].exit_bar_idx, 3);
}

// ===========================================================================
// 4. Data gaps
// ===========================================================================

TEST_F(BacktesterTest, GapBarsSkippedAndMarkedAtLastClose) {
    auto run = run_script({100, NaN, 110, NaN}, {{0, Signal::BUY}, {1, Signal::SELL}});

    EXPECT_EQ(run.data_gap_bars, 2);
    EXPECT_EQ(run.sell_signals, 0);
    auto eq = equities(run);
    ASSERT_EQ(eq.size(), 4u);
    EXPECT_DOUBLE_EQ(eq[0], 1000.0);
    EXPECT_DOUBLE_EQ(eq[1], 1000.0);
    EXPECT_DOUBLE_EQ(eq[2], 1100.0);
    EXPECT_DOUBLE_EQ(eq[3], 1100.0);

    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, exit_reason::END_OF_DATA);
    EXPECT_EQ(run.trades[0].exit_bar_idx, 2);
    EXPECT_DOUBLE_EQ(run.trades[0].exit_price, 110.0);
}

TEST_F(BacktesterTest, GapsAreLogged) {
    std::ostringstream log;
    cfg.log = &log;
    auto run = run_script({100, NaN, 101}, {});
    EXPECT_EQ(run.data_gap_bars, 1);
    EXPECT_NE(log.str().find("data gap"), std::string::npos);
}

TEST_F(BacktesterTest, AllGapSeriesProducesNoTrades) {
    auto run = run_script({NaN, NaN}, {{0, Signal::BUY}});
    EXPECT_TRUE(run.trades.empty());
    EXPECT_EQ(run.data_gap_bars, 2);
    EXPECT_EQ(run.equity_curve.size(), 2u);
}

// ===========================================================================
// 5. Warm-up, lifecycle and errors
// ===========================================================================

TEST_F(BacktesterTest, ShortSeriesStaysInWarmup) {
    Backtester bt(cfg);
    auto run = bt.run(RsiStrategy(), make_series(ramp(100, 50, 10)));
    EXPECT_TRUE(run.trades.empty());
    EXPECT_EQ(run.buy_signals, 0);
    EXPECT_DOUBLE_EQ(run.final_equity(), 1000.0);

    auto report = PerformanceMetrics::compute(run);
    EXPECT_EQ(report.num_trades, 0);
    EXPECT_DOUBLE_EQ(report.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(report.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(report.total_return_pct, 0.0);
}

TEST_F(BacktesterTest, OneEquityPointPerBar) {
    Backtester bt(cfg);
    auto series = make_series(wave(120));
    StrategySpec spec;
    spec.kind = StrategyKind::MACD;
    auto run = bt.run(spec, series);
    ASSERT_EQ(run.equity_curve.size(), series.size());
    for (size_t i = 0; i < series.size(); ++i) {
        EXPECT_EQ(run.equity_curve[i].ts, series[i].ts);
    }
    EXPECT_EQ(run.bars, 120);
}

TEST_F(BacktesterTest, RunsAreIdempotent) {
    Backtester bt(cfg);
    auto series = make_series(wave(200));
    StrategySpec spec;
    spec.kind = StrategyKind::RSI;
    spec.params = {{"period", 5}};
    auto a = bt.run(spec, series);
    auto b = bt.run(spec, series);
    ASSERT_EQ(a.trades.size(), b.trades.size());
    for (size_t i = 0; i < a.trades.size(); ++i) {
        EXPECT_EQ(a.trades[i].entry_bar_idx, b.trades[i].entry_bar_idx);
        EXPECT_DOUBLE_EQ(a.trades[i].net_pnl, b.trades[i].net_pnl);
    }
    EXPECT_EQ(equities(a), equities(b));
}

TEST_F(BacktesterTest, EmptySeriesThrows) {
    Backtester bt(cfg);
    EXPECT_THROW(bt.run(ScriptedStrategy(std::map<size_t, Signal>{}), PriceSeries()), EmptySeriesError);
}

TEST_F(BacktesterTest, InvalidConfigRejectedAtConstruction) {
    cfg.costs.fee_rate = 1.5;
    EXPECT_THROW(Backtester bt(cfg), InvalidParameterError);
}

TEST_F(BacktesterTest, InvalidSpecRejectedBeforeSimulation) {
    Backtester bt(cfg);
    StrategySpec spec;
    spec.kind = StrategyKind::RSI;
    spec.params = {{"period", 0}};
    EXPECT_THROW(bt.run(spec, make_series({1, 2, 3})), InvalidParameterError);
}

TEST_F(BacktesterTest, RunCarriesStrategyIdentity) {
    Backtester bt(cfg);
    StrategySpec spec;
    spec.kind = StrategyKind::RSI;
    spec.params = {{"period", 7}};
    auto run = bt.run(spec, make_series(wave(50)));
    EXPECT_EQ(run.strategy_name, "RSI");
    EXPECT_DOUBLE_EQ(run.parameters.at("period"), 7.0);
    EXPECT_DOUBLE_EQ(run.parameters.at("overbought"), 70.0);
    EXPECT_DOUBLE_EQ(run.periods_per_year, 8760.0);
}
