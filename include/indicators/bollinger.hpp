#pragma once
#include <algorithm>
#include "indicators/sma_ema.hpp"

namespace ind {

struct BB { double mid, upper, lower; };
// Bands for the last bar; all NaN when the series is shorter than p
BB compute_bb(const Series& v, size_t p=20, double k=2.0);

class BollModule final : public core::IModule {
    size_t period; double k_;
public:
    BollModule(size_t p=20, double k=2.0): period(p), k_(k) {}
    std::string id() const override { return "BB"; }
    size_t warmup_bars() const override { return period; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
