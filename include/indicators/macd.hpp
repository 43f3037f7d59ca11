#pragma once
#include "indicators/sma_ema.hpp"

namespace ind {

struct MacdLines {
    Series line;    // EMA(fast) - EMA(slow)
    Series signal;  // EMA(signal) of line
    Series hist;
};

MacdLines compute_macd(const Series& closes, size_t fast=12, size_t slow=26, size_t signal=9);

// Crossover vote: the line has to cross the signal between the last two bars
class MacdModule final : public core::IModule {
    size_t fast_p, slow_p, signal_p;
public:
    MacdModule(size_t f=12, size_t s=26, size_t sig=9): fast_p(f), slow_p(s), signal_p(sig) {}
    std::string id() const override { return "MACD"; }
    size_t warmup_bars() const override { return slow_p + signal_p; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
