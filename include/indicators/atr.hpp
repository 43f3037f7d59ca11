#pragma once
#include "indicators/sma_ema.hpp"

namespace ind {

// max(high-low, |high-prev_close|, |low-prev_close|); the first bar uses high-low
Series true_range(const core::Candles& c);
// Rolling mean of true range. min_periods < period fills the head with partial means.
Series atr_series(const core::Candles& c, size_t period=14, size_t min_periods=0);
double compute_atr(const core::Candles& c, size_t period=14);

// Magnitude only: never votes
class AtrModule final : public core::IModule {
    size_t period;
public:
    explicit AtrModule(size_t p=14): period(p) {}
    std::string id() const override { return "ATR"; }
    size_t warmup_bars() const override { return period+1; }
    core::Vote idle_vote() const override { return core::Vote::None; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
