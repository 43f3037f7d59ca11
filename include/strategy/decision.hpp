#pragma once
#include <unordered_map>
#include <string>
#include "core/types.hpp"

namespace strategy {

enum class Action { Buy, Sell, Hold };
enum class Confidence { Low, Medium, High, VeryHigh };

inline const char* to_string(Action a){
    switch (a){
        case Action::Buy:  return "BUY";
        case Action::Sell: return "SELL";
        default:           return "HOLD";
    }
}

inline const char* to_string(Confidence c){
    switch (c){
        case Confidence::VeryHigh: return "very_high";
        case Confidence::High:     return "high";
        case Confidence::Medium:   return "medium";
        default:                   return "low";
    }
}

inline Confidence downgrade(Confidence c){
    return c==Confidence::Low ? c : static_cast<Confidence>(static_cast<int>(c)-1);
}

inline Confidence confidence_from_strength(double s){
    if (s>=0.7) return Confidence::VeryHigh;
    if (s>=0.6) return Confidence::High;
    if (s>=0.5) return Confidence::Medium;
    return Confidence::Low;
}

struct Weights { std::unordered_map<std::string, double> w; };

// Static per-indicator weights before regime adjustment
inline Weights base_weights(){
    return Weights{{
        {"RSI", 0.12}, {"MACD", 0.15}, {"SMA", 0.10}, {"EMA", 0.13}, {"BB", 0.11},
        {"STOCH", 0.08}, {"WILLIAMS", 0.07}, {"ATR", 0.06}, {"ADX", 0.10},
        {"MFI", 0.04}, {"OBV", 0.04}
    }};
}

// Regime-weighted consensus. Scores are normalized so buy+sell+hold == 1 when any weight applied.
struct WeightedSignal {
    double buy_score{0.0};
    double sell_score{0.0};
    double hold_score{0.0};
    double net_score{0.0};
    double strength{0.0};
    double threshold{0.5};
    bool passes_filter{false};
    Action action{Action::Hold};
    Confidence confidence{Confidence::Low};
    std::string reason;
    Weights weights;
};

inline bool should_trade(const WeightedSignal& s){
    return s.action!=Action::Hold && s.passes_filter && s.confidence!=Confidence::Low;
}

inline core::Side to_side(Action a){ return a==Action::Sell ? core::Side::Short : core::Side::Long; }

} // namespace strategy
