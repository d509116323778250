#pragma once

#include "errors.hpp"
#include "strategy/bollinger_strategy.hpp"
#include "strategy/buy_and_hold_strategy.hpp"
#include "strategy/combined_strategy.hpp"
#include "strategy/ma_cross_strategy.hpp"
#include "strategy/macd_strategy.hpp"
#include "strategy/rsi_strategy.hpp"
#include "strategy/strategy_spec.hpp"

#include <memory>
#include <string>
#include <vector>

class StrategyFactory {
public:
    // Builds and validates the strategy a spec describes. Throws
    // InvalidParameterError for bad or unknown parameters.
    static std::unique_ptr<Strategy> create(const StrategySpec& spec) {
        switch (spec.kind) {
            case StrategyKind::RSI:
                return std::make_unique<RsiStrategy>(spec.params);
            case StrategyKind::MACD:
                return std::make_unique<MacdStrategy>(spec.params);
            case StrategyKind::BOLLINGER:
                return std::make_unique<BollingerStrategy>(spec.params);
            case StrategyKind::MA_CROSS:
                return std::make_unique<MovingAverageCrossStrategy>(spec.params);
            case StrategyKind::BUY_AND_HOLD:
                return std::make_unique<BuyAndHoldStrategy>(spec.params);
            case StrategyKind::COMBINED: {
                std::vector<std::unique_ptr<Strategy>> children;
                for (const auto& child : spec.children) children.push_back(create(child));
                return std::make_unique<CombinedStrategy>(std::move(children), spec.voting,
                                                          spec.params);
            }
        }
        throw InvalidParameterError("Unsupported strategy kind");
    }

    // Parameter names a grid may sweep for this spec.
    static std::vector<std::string> accepted_parameters(const StrategySpec& spec) {
        switch (spec.kind) {
            case StrategyKind::RSI:          return RsiStrategy::parameter_names();
            case StrategyKind::MACD:         return MacdStrategy::parameter_names();
            case StrategyKind::BOLLINGER:    return BollingerStrategy::parameter_names();
            case StrategyKind::MA_CROSS:     return MovingAverageCrossStrategy::parameter_names();
            case StrategyKind::BUY_AND_HOLD: return {};
            case StrategyKind::COMBINED: {
                std::vector<std::string> out = {"quorum"};
                for (size_t i = 0; i < spec.children.size(); ++i) {
                    for (const auto& name : accepted_parameters(spec.children[i])) {
                        out.push_back(std::to_string(i) + "." + name);
                    }
                }
                return out;
            }
        }
        return {};
    }

    // Default parameter values for a single-strategy kind.
    static ParameterSet defaults(StrategyKind kind) {
        switch (kind) {
            case StrategyKind::RSI:       return RsiStrategy::defaults();
            case StrategyKind::MACD:      return MacdStrategy::defaults();
            case StrategyKind::BOLLINGER: return BollingerStrategy::defaults();
            case StrategyKind::MA_CROSS:  return MovingAverageCrossStrategy::defaults();
            default: return {};
        }
    }
};
