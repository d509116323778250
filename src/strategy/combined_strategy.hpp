#pragma once

#include "errors.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_spec.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CombinedStrategy — votes over child strategies
// ---------------------------------------------------------------------------
class CombinedStrategy : public Strategy {
public:
    static constexpr int DEFAULT_QUORUM = 2;

    CombinedStrategy(std::vector<std::unique_ptr<Strategy>> children, VotingRule rule,
                     const ParameterSet& overrides = {})
        : children_(std::move(children)), rule_(rule) {
        if (children_.empty()) {
            throw InvalidParameterError("COMBINED strategy needs at least one child");
        }
        for (const auto& c : children_) {
            if (!c) throw InvalidParameterError("COMBINED strategy child is null");
        }
        params::require_known(overrides, {"quorum"}, "COMBINED");
        quorum_ = params::get_int(overrides, "quorum", DEFAULT_QUORUM);
        if (rule_ == VotingRule::QUORUM) {
            if (quorum_ < 1 || quorum_ > static_cast<int>(children_.size())) {
                throw InvalidParameterError(
                    "COMBINED quorum must lie within [1, " +
                    std::to_string(children_.size()) + "], got " + std::to_string(quorum_));
            }
        }
    }

    std::string name() const override {
        std::string out = "COMBINED[" + voting_rule_str(rule_);
        for (const auto& c : children_) out += " " + c->name();
        return out + "]";
    }

    ParameterSet parameters() const override {
        ParameterSet out;
        out["quorum"] = static_cast<double>(quorum_);
        for (size_t i = 0; i < children_.size(); ++i) {
            for (const auto& [k, v] : children_[i]->parameters()) {
                out[std::to_string(i) + "." + k] = v;
            }
        }
        return out;
    }

    size_t warmup_bars() const override {
        size_t w = 0;
        for (const auto& c : children_) w = std::max(w, c->warmup_bars());
        return w;
    }

    PreparedIndicators prepare(const PriceSeries& series,
                               const IndicatorProvider& provider) const override {
        PreparedIndicators out;
        out.children.reserve(children_.size());
        for (const auto& c : children_) out.children.push_back(c->prepare(series, provider));
        return out;
    }

    Signal generate_signal(const SeriesView& bars,
                           const IndicatorView& ind) const override {
        std::vector<Signal> votes;
        votes.reserve(children_.size());
        for (size_t i = 0; i < children_.size(); ++i) {
            votes.push_back(children_[i]->generate_signal(bars, ind.child(i)));
        }
        return vote(votes);
    }

    Signal vote(const std::vector<Signal>& votes) const {
        int n = static_cast<int>(votes.size());
        int b = static_cast<int>(std::count(votes.begin(), votes.end(), Signal::BUY));
        int s = static_cast<int>(std::count(votes.begin(), votes.end(), Signal::SELL));

        switch (rule_) {
            case VotingRule::MAJORITY:
                if (b > s && 2 * b >= n) return Signal::BUY;
                if (s > b && 2 * s >= n) return Signal::SELL;
                return Signal::HOLD;
            case VotingRule::UNANIMOUS:
                if (b == n) return Signal::BUY;
                if (s == n) return Signal::SELL;
                return Signal::HOLD;
            case VotingRule::QUORUM:
                if (b >= quorum_ && s < quorum_) return Signal::BUY;
                if (s >= quorum_ && b < quorum_) return Signal::SELL;
                return Signal::HOLD;
        }
        return Signal::HOLD;
    }

    VotingRule rule() const { return rule_; }
    int quorum() const { return quorum_; }
    size_t child_count() const { return children_.size(); }

private:
    std::vector<std::unique_ptr<Strategy>> children_;
    VotingRule rule_;
    int quorum_ = DEFAULT_QUORUM;
};
