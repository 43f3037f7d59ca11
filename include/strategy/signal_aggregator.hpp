#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/module.hpp"
#include "indicators/engine.hpp"
#include "strategy/decision.hpp"
#include "strategy/market_regime.hpp"

namespace strategy {

struct SignalConsensus {
    std::map<std::string, core::Vote> votes;
    int buy_count{0};
    int sell_count{0};
    int hold_count{0};
    std::optional<core::Side> decision;   // empty = HOLD
};

struct AggregatorConfig {
    std::string confirming_indicator{"CMF"};
    double base_threshold{0.5};
    double net_margin{0.1};
    double trend_veto_strength{60.0};
};

class SignalAggregator {
public:
    explicit SignalAggregator(AggregatorConfig cfg={},
                              ind::IndicatorEngine engine=ind::IndicatorEngine::with_default_modules());

    std::vector<core::IndicatorReading> readings(const core::Candles& c) const { return engine_.evaluate(c); }

    // Runs the engine and tallies
    SignalConsensus evaluate(const core::Candles& c, int min_confirmation) const;

    // Long iff buy_count >= min_confirmation and the confirming indicator votes Buy; Short mirrors
    static SignalConsensus tally(const std::vector<core::IndicatorReading>& r, int min_confirmation,
                                 const std::string& confirming="CMF");

    // Base weights adjusted by regime, volatility and volume, normalized to sum 1
    static Weights adaptive_weights(const MarketAnalysis& a);

    WeightedSignal weigh(const std::vector<core::IndicatorReading>& r, const MarketAnalysis& a) const;

    const ind::IndicatorEngine& engine() const { return engine_; }
    const AggregatorConfig& config() const { return cfg_; }

private:
    AggregatorConfig cfg_;
    ind::IndicatorEngine engine_;
};

// "Buy: RSI, MACD; Sell: BB; Hold: ...\nBTCUSDT: 2 buy, 1 sell, 9 hold"
std::string format_signal_log(const std::string& symbol, const std::vector<core::IndicatorReading>& r,
                              const SignalConsensus& s);

} // namespace strategy
