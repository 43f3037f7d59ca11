#include "strategy/signal_aggregator.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace strategy {

namespace {

using Adjust = std::unordered_map<std::string, double>;

const Adjust& regime_adjustment(Regime r){
    static const Adjust trending{{"MACD", 1.3}, {"EMA", 1.2}, {"ADX", 1.4}, {"RSI", 0.8}, {"STOCH", 0.7}};
    static const Adjust sideways{{"RSI", 1.4}, {"STOCH", 1.3}, {"WILLIAMS", 1.2}, {"BB", 1.3}, {"MACD", 0.7}};
    static const Adjust high_vol{{"ATR", 1.5}, {"BB", 1.3}, {"RSI", 1.2}, {"SMA", 0.8}, {"EMA", 0.8}};
    static const Adjust consolidation{{"RSI", 1.3}, {"STOCH", 1.2}, {"BB", 1.4}, {"MACD", 0.8}, {"ADX", 0.7}};
    static const Adjust breakout{{"OBV", 1.5}, {"MFI", 1.4}, {"ATR", 1.3}, {"MACD", 1.2}, {"RSI", 0.9}};
    static const Adjust none;
    switch (r){
        case Regime::TrendingUp:
        case Regime::TrendingDown:   return trending;
        case Regime::Sideways:       return sideways;
        case Regime::HighVolatility: return high_vol;
        case Regime::Consolidation:  return consolidation;
        case Regime::Breakout:       return breakout;
        default:                     return none;
    }
}

void scale(Weights& w, const std::string& id, double k){
    auto it = w.w.find(id);
    if (it!=w.w.end()) it->second *= k;
}

} // namespace

SignalAggregator::SignalAggregator(AggregatorConfig cfg, ind::IndicatorEngine engine)
    : cfg_(std::move(cfg)), engine_(std::move(engine)) {}

SignalConsensus SignalAggregator::evaluate(const core::Candles& c, int min_confirmation) const {
    return tally(engine_.evaluate(c), min_confirmation, cfg_.confirming_indicator);
}

SignalConsensus SignalAggregator::tally(const std::vector<core::IndicatorReading>& r, int min_confirmation,
                                        const std::string& confirming){
    SignalConsensus s;
    for (auto& x : r){
        s.votes[x.name] = x.vote;
        if (x.vote==core::Vote::Buy) ++s.buy_count;
        else if (x.vote==core::Vote::Sell) ++s.sell_count;
        else if (x.vote==core::Vote::Hold) ++s.hold_count;
    }
    auto it = s.votes.find(confirming);
    const core::Vote conf = it!=s.votes.end() ? it->second : core::Vote::Hold;
    if (s.buy_count>=min_confirmation && conf==core::Vote::Buy) s.decision = core::Side::Long;
    else if (s.sell_count>=min_confirmation && conf==core::Vote::Sell) s.decision = core::Side::Short;
    return s;
}

Weights SignalAggregator::adaptive_weights(const MarketAnalysis& a){
    Weights w = base_weights();
    for (auto& kv : regime_adjustment(a.regime)) scale(w, kv.first, kv.second);
    if (a.volatility.is_high){
        scale(w, "ATR", 1.3);
        scale(w, "BB", 1.2);
        scale(w, "SMA", 0.8);
        scale(w, "EMA", 0.8);
    }
    if (a.volume.is_high){
        scale(w, "OBV", 1.4);
        scale(w, "MFI", 1.3);
    }
    double total=0.0;
    for (auto& kv : w.w) total += kv.second;
    if (total>0.0) for (auto& kv : w.w) kv.second /= total;
    return w;
}

WeightedSignal SignalAggregator::weigh(const std::vector<core::IndicatorReading>& r, const MarketAnalysis& a) const {
    WeightedSignal s;
    s.weights = adaptive_weights(a);

    // Hold and None both land in the hold bucket
    for (auto& x : r){
        auto it = s.weights.w.find(x.name);
        if (it==s.weights.w.end()) continue;
        if (x.vote==core::Vote::Buy) s.buy_score += it->second;
        else if (x.vote==core::Vote::Sell) s.sell_score += it->second;
        else s.hold_score += it->second;
    }
    const double total = s.buy_score + s.sell_score + s.hold_score;
    if (total>0.0){
        s.buy_score /= total; s.sell_score /= total; s.hold_score /= total;
    }
    s.net_score = s.buy_score - s.sell_score;
    s.strength = std::max(s.buy_score, s.sell_score);

    s.threshold = cfg_.base_threshold;
    if (a.market_score>70.0) s.threshold *= 0.9;
    else if (a.market_score<30.0) s.threshold *= 1.2;
    if (a.volatility.is_high) s.threshold *= 1.1;
    s.passes_filter = s.strength >= s.threshold;

    if (!s.passes_filter){
        s.reason = "signal too weak to pass filter";
        return s;
    }

    if (s.buy_score>s.sell_score && s.net_score>cfg_.net_margin) s.action = Action::Buy;
    else if (s.sell_score>s.buy_score && s.net_score<-cfg_.net_margin) s.action = Action::Sell;

    s.confidence = confidence_from_strength(s.strength);
    if (a.market_score<30.0) s.confidence = downgrade(s.confidence);
    if (a.volatility.is_high) s.confidence = downgrade(s.confidence);

    if (s.action==Action::Buy && a.regime==Regime::TrendingDown && a.trend_strength>cfg_.trend_veto_strength){
        s.action = Action::Hold;
        s.confidence = Confidence::Low;
        s.reason = "strong downtrend detected";
    } else if (s.action==Action::Sell && a.regime==Regime::TrendingUp && a.trend_strength>cfg_.trend_veto_strength){
        s.action = Action::Hold;
        s.confidence = Confidence::Low;
        s.reason = "strong uptrend detected";
    } else {
        s.reason = fmt::format("confirmed by {} market", to_string(a.regime));
    }
    return s;
}

std::string format_signal_log(const std::string& symbol, const std::vector<core::IndicatorReading>& r,
                              const SignalConsensus& s){
    std::vector<std::string> buy, sell, hold;
    for (auto& x : r){
        if (x.vote==core::Vote::Buy) buy.push_back(x.name);
        else if (x.vote==core::Vote::Sell) sell.push_back(x.name);
        else hold.push_back(x.name);
    }
    std::vector<std::string> parts;
    if (!buy.empty())  parts.push_back(fmt::format("Buy: {}", fmt::join(buy, ", ")));
    if (!sell.empty()) parts.push_back(fmt::format("Sell: {}", fmt::join(sell, ", ")));
    if (!hold.empty()) parts.push_back(fmt::format("Hold: {}", fmt::join(hold, ", ")));
    return fmt::format("{}\n{}: {} buy, {} sell, {} hold", fmt::join(parts, "; "), symbol,
                       s.buy_count, s.sell_count, s.hold_count);
}

} // namespace strategy
