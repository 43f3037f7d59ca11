#pragma once
#include "indicators/sma_ema.hpp"

namespace ind {

// On-balance volume; starts at the first bar's volume
Series obv_series(const core::Candles& c);
// Chaikin money flow series; the money-flow multiplier is 0 on a flat bar
Series cmf_series(const core::Candles& c, size_t period=20);

// Votes from the slope of SMA(smooth) of OBV
class ObvModule final : public core::IModule {
    size_t smooth;
public:
    explicit ObvModule(size_t s=5): smooth(s) {}
    std::string id() const override { return "OBV"; }
    size_t warmup_bars() const override { return smooth+1; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

class CmfModule final : public core::IModule {
    size_t period; double threshold;
public:
    CmfModule(size_t p=20, double thr=0.05): period(p), threshold(thr) {}
    std::string id() const override { return "CMF"; }
    size_t warmup_bars() const override { return period; }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
