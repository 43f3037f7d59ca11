#include "indicators/bollinger.hpp"
#include <cmath>

namespace ind {

BB compute_bb(const Series& v, size_t p, double k){
    if (p<2 || v.size()<p) return {nan(), nan(), nan()};
    double mid=0.0;
    for (size_t i=v.size()-p;i<v.size();++i) mid += v[i];
    mid/=p;
    double var=0.0;
    for (size_t i=v.size()-p;i<v.size();++i){ const double d=v[i]-mid; var+=d*d; }
    const double sd = std::sqrt(std::max(0.0, var/(p-1)));
    return {mid, mid + k*sd, mid - k*sd};
}

core::IndicatorReading BollModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto bb = compute_bb(closes(c), period, k_);
    if (!is_num(bb.mid)) return unavailable();
    const double close = c.back().close;
    // %B position inside the bands
    const double pos = (bb.upper==bb.lower? 50.0 : (close - bb.lower) / (bb.upper - bb.lower) * 100.0);
    const core::Vote v = (close<bb.lower? core::Vote::Buy : close>bb.upper? core::Vote::Sell : core::Vote::Hold);
    return {id(), pos, v};
}

} // namespace ind
