#include "indicators/atr.hpp"
#include <cmath>

namespace ind {

Series true_range(const core::Candles& c){
    Series tr(c.size(), 0.0);
    for (size_t i=0;i<c.size();++i){
        const double hl = c[i].high - c[i].low;
        if (i==0){ tr[i] = hl; continue; }
        const double pc = c[i-1].close;
        tr[i] = std::max({hl, std::abs(c[i].high - pc), std::abs(c[i].low - pc)});
    }
    return tr;
}

Series atr_series(const core::Candles& c, size_t p, size_t min_periods){
    const auto tr = true_range(c);
    if (min_periods==0 || min_periods>=p) return sma_series(tr, p);
    Series out(tr.size(), nan());
    double s=0.0;
    for (size_t i=0;i<tr.size();++i){
        s += tr[i];
        if (i>=p) s -= tr[i-p];
        const size_t n = std::min(i+1, p);
        if (n>=min_periods) out[i] = s/static_cast<double>(n);
    }
    return out;
}

double compute_atr(const core::Candles& c, size_t p){
    if (c.size()<p+1) return nan();
    return atr_series(c, p).back();
}

core::IndicatorReading AtrModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const double atr = compute_atr(c, period);
    if (!is_num(atr)) return unavailable();
    return {id(), atr, core::Vote::None};
}

} // namespace ind
