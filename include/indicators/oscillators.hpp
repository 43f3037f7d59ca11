#pragma once
#include "indicators/sma_ema.hpp"

namespace ind {

struct Stoch { double k, d; };
// %K(k_period) and %D = SMA(d_period) of %K for the last bar
Stoch compute_stochastic(const core::Candles& c, size_t k_period=14, size_t d_period=3);
// Williams %R in [-100, 0]
double compute_williams_r(const core::Candles& c, size_t period=14);
// Money Flow Index over typical price
double compute_mfi(const core::Candles& c, size_t period=14);

class StochasticModule final : public core::IModule {
    size_t k_p, d_p;
public:
    StochasticModule(size_t k=14, size_t d=3): k_p(k), d_p(d) {}
    std::string id() const override { return "STOCH"; }
    size_t warmup_bars() const override { return k_p + d_p - 1; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

class WilliamsModule final : public core::IModule {
    size_t period;
public:
    explicit WilliamsModule(size_t p=14): period(p) {}
    std::string id() const override { return "WILLIAMS"; }
    size_t warmup_bars() const override { return period; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

class MfiModule final : public core::IModule {
    size_t period;
public:
    explicit MfiModule(size_t p=14): period(p) {}
    std::string id() const override { return "MFI"; }
    size_t warmup_bars() const override { return period+1; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
