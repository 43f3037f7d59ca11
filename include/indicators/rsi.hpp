#pragma once
#include <algorithm>
#include "indicators/sma_ema.hpp"

namespace ind {

// Wilder RSI series. Entries before `period` are NaN; a 0/0 ratio is filled with 0.
Series rsi_series(const Series& closes, size_t period);
double compute_rsi(const Series& closes, size_t period);

class RsiModule final : public core::IModule {
    size_t period; double oversold, overbought;
public:
    explicit RsiModule(size_t p=14, double os=30.0, double ob=70.0): period(p), oversold(os), overbought(ob) {}
    std::string id() const override { return "RSI"; }
    size_t warmup_bars() const override { return period+1; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
