#pragma once
#include <vector>
#include <cmath>
#include <limits>
#include <algorithm>
#include "core/module.hpp"

namespace ind {

using Series = std::vector<double>;

inline double nan() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool is_num(double v) { return !std::isnan(v) && !std::isinf(v); }

// Column extraction
Series closes(const core::Candles& c);
Series highs(const core::Candles& c);
Series lows(const core::Candles& c);
Series volumes(const core::Candles& c);

// Rolling mean; the first p-1 entries are NaN
Series sma_series(const Series& v, size_t p);
// Recursive EMA (alpha = 2/(p+1)) seeded with the first value
Series ema_series(const Series& v, size_t p);
// Rolling sample standard deviation (ddof = 1); the first p-1 entries are NaN
Series rolling_std(const Series& v, size_t p);
// Rolling sum/min/max; the first p-1 entries are NaN
Series rolling_sum(const Series& v, size_t p);
Series rolling_min(const Series& v, size_t p);
Series rolling_max(const Series& v, size_t p);

// Last value helpers (NaN when not enough data)
double compute_sma(const Series& v, size_t p);
double compute_ema(const Series& v, size_t p);

// SMA(short) vs SMA(long) crossover state
class SmaModule final : public core::IModule {
    size_t short_p, long_p;
public:
    SmaModule(size_t sp=20, size_t lp=50): short_p(sp), long_p(lp) {}
    std::string id() const override { return "SMA"; }
    size_t warmup_bars() const override { return std::max(short_p, long_p); }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

// EMA(fast) vs EMA(slow)
class EmaModule final : public core::IModule {
    size_t fast_p, slow_p;
public:
    EmaModule(size_t fp=12, size_t sp=26): fast_p(fp), slow_p(sp) {}
    std::string id() const override { return "EMA"; }
    size_t warmup_bars() const override { return std::max(fast_p, slow_p); }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

// ADX proxy: |EMA(short) - EMA(long)| as % of EMA(long); directional vote above the threshold
class AdxProxyModule final : public core::IModule {
    size_t short_p, long_p; double threshold_pct;
public:
    AdxProxyModule(size_t sp=10, size_t lp=20, double thr=2.0): short_p(sp), long_p(lp), threshold_pct(thr) {}
    std::string id() const override { return "ADX"; }
    size_t warmup_bars() const override { return std::max(short_p, long_p); }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
