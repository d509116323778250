#pragma once

#include "backtest/backtest_config.hpp"
#include "backtest/portfolio.hpp"
#include "backtest/trade_record.hpp"
#include "errors.hpp"
#include "indicators/technical_indicators.hpp"
#include "series/price_series.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_factory.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestRun — everything one simulation produced
// ---------------------------------------------------------------------------
struct BacktestRun {
    std::string strategy_name;
    ParameterSet parameters;
    std::vector<TradeRecord> trades;
    std::vector<EquityPoint> equity_curve;
    double initial_capital = 0.0;
    double final_cash = 0.0;
    double periods_per_year = 0.0;
    int bars = 0;
    int buy_signals = 0;
    int sell_signals = 0;
    int data_gap_bars = 0;   // bars skipped for an unusable close
    int rejected_buys = 0;   // BUYs with too little cash for one unit

    double final_equity() const {
        return equity_curve.empty() ? initial_capital : equity_curve.back().equity;
    }
};

// ---------------------------------------------------------------------------
// Backtester — replays a series bar by bar through a strategy
//
// Long-only, one position at a time. Fills happen at the bar's close and the
// fee is taken from cash on each fill. Runs share no mutable state, so one
// Backtester may be used from several threads at once.
// ---------------------------------------------------------------------------
class Backtester {
public:
    explicit Backtester(const BacktestConfig& cfg,
                        std::shared_ptr<const IndicatorProvider> provider =
                            std::make_shared<TechnicalIndicators>())
        : cfg_(cfg), provider_(std::move(provider)) {
        cfg_.validate();
        if (!provider_) throw InvalidParameterError("Backtester needs an indicator provider");
    }

    const BacktestConfig& config() const { return cfg_; }

    BacktestRun run(const StrategySpec& spec, const PriceSeries& series) const {
        auto strategy = StrategyFactory::create(spec);
        return run(*strategy, series);
    }

    BacktestRun run(const Strategy& strategy, const PriceSeries& series) const {
        if (series.empty()) {
            throw EmptySeriesError("Cannot backtest " + strategy.name() +
                                   " on an empty price series");
        }

        BacktestRun out;
        out.strategy_name = strategy.name();
        out.parameters = strategy.parameters();
        out.initial_capital = cfg_.initial_capital;
        out.periods_per_year = cfg_.annualization(series);
        out.bars = static_cast<int>(series.size());

        PortfolioState state;
        state.cash = cfg_.initial_capital;
        state.equity_curve.reserve(series.size());

        PreparedIndicators prepared = strategy.prepare(series, *provider_);
        const size_t warmup = strategy.warmup_bars();
        const size_t n = series.size();

        double last_close = std::nan("");
        size_t last_valid = 0;

        for (size_t t = 0; t < n; ++t) {
            const Bar& bar = series[t];

            if (!bar.has_valid_close()) {
                ++out.data_gap_bars;
                if (cfg_.log) {
                    *cfg_.log << "[backtest] data gap at bar " << t << " (ts=" << bar.ts
                              << "), signal skipped\n";
                }
            } else {
                last_close = bar.close;
                last_valid = t;
                step(strategy, series, prepared, warmup, t, state, out);
            }

            if (t + 1 == n && state.position.is_long()) {
                close_position(state, series[last_valid], static_cast<int>(last_valid),
                               exit_reason::END_OF_DATA, out);
            }

            // Before the first usable close there is nothing to mark.
            double mark = std::isnan(last_close) ? 0.0 : last_close;
            state.record(bar.ts, mark);
        }

        out.equity_curve = std::move(state.equity_curve);
        out.final_cash = state.cash;
        return out;
    }

private:
    BacktestConfig cfg_;
    std::shared_ptr<const IndicatorProvider> provider_;

    void step(const Strategy& strategy, const PriceSeries& series,
              const PreparedIndicators& prepared, size_t warmup, size_t t,
              PortfolioState& state, BacktestRun& out) const {
        const Bar& bar = series[t];

        if (state.position.is_long() && strategy.uses_risk_exits()) {
            double move = bar.close / state.position.entry_price - 1.0;
            if (cfg_.stop_loss_pct > 0.0 && move <= -cfg_.stop_loss_pct) {
                close_position(state, bar, static_cast<int>(t), exit_reason::STOP_LOSS, out);
                return;
            }
            if (cfg_.take_profit_pct > 0.0 && move >= cfg_.take_profit_pct) {
                close_position(state, bar, static_cast<int>(t), exit_reason::TAKE_PROFIT, out);
                return;
            }
        }

        if (t < warmup) return;

        Signal signal = strategy.generate_signal(SeriesView(series, t),
                                                 IndicatorView(prepared, t));
        if (signal == Signal::BUY) {
            ++out.buy_signals;
            if (!state.position.is_long()) open_position(state, bar, static_cast<int>(t), out);
        } else if (signal == Signal::SELL) {
            ++out.sell_signals;
            if (state.position.is_long()) {
                close_position(state, bar, static_cast<int>(t), exit_reason::SIGNAL, out);
            }
        }
    }

    double order_quantity(double cash, double price) const {
        double budget = cash * cfg_.capital_fraction;
        double qty = budget / (price * (1.0 + cfg_.costs.fee_rate));
        if (cfg_.sizing == SizingPolicy::WHOLE_UNITS) qty = std::floor(qty);
        return qty;
    }

    void open_position(PortfolioState& state, const Bar& bar, int idx,
                       BacktestRun& out) const {
        double qty = order_quantity(state.cash, bar.close);
        if (!(qty > 0.0)) {
            ++out.rejected_buys;
            if (cfg_.log) {
                *cfg_.log << "[backtest] BUY at bar " << idx << " ignored: cash "
                          << state.cash << " cannot buy one unit at " << bar.close << "\n";
            }
            return;
        }

        double notional = qty * bar.close;
        double fee = cfg_.costs.fee(notional);
        // Fractional sizing spends the whole budget; clamp rounding residue.
        state.cash = std::max(0.0, state.cash - notional - fee);

        Position& pos = state.position;
        pos.side = PositionSide::LONG;
        pos.quantity = qty;
        pos.entry_price = bar.close;
        pos.entry_ts = bar.ts;
        pos.entry_index = idx;
        pos.entry_fee = fee;
    }

    void close_position(PortfolioState& state, const Bar& bar, int idx, int reason,
                        BacktestRun& out) const {
        Position& pos = state.position;
        double notional = pos.quantity * bar.close;
        double fee = cfg_.costs.fee(notional);
        state.cash += notional - fee;

        TradeRecord trade{};
        trade.entry_ts = pos.entry_ts;
        trade.exit_ts = bar.ts;
        trade.entry_price = pos.entry_price;
        trade.exit_price = bar.close;
        trade.quantity = pos.quantity;
        trade.gross_pnl = (bar.close - pos.entry_price) * pos.quantity;
        trade.fee_paid = pos.entry_fee + fee;
        trade.net_pnl = trade.gross_pnl - trade.fee_paid;
        trade.entry_bar_idx = pos.entry_index;
        trade.exit_bar_idx = idx;
        trade.bars_held = idx - pos.entry_index;
        trade.exit_reason = reason;
        out.trades.push_back(trade);

        pos = Position{};
    }
};
