#include "indicators/oscillators.hpp"

namespace ind {

namespace {

// %K per bar; a flat window reads 50
Series stoch_k_series(const core::Candles& c, size_t p){
    const auto lo = rolling_min(lows(c), p);
    const auto hi = rolling_max(highs(c), p);
    Series k(c.size(), nan());
    for (size_t i=0;i<c.size();++i){
        if (!is_num(lo[i]) || !is_num(hi[i])) continue;
        const double range = hi[i]-lo[i];
        k[i] = range>0.0 ? 100.0*(c[i].close-lo[i])/range : 50.0;
    }
    return k;
}

} // namespace

Stoch compute_stochastic(const core::Candles& c, size_t k_period, size_t d_period){
    if (k_period==0 || d_period==0 || c.size() < k_period + d_period - 1) return {nan(), nan()};
    const auto k = stoch_k_series(c, k_period);
    double d=0.0;
    for (size_t i=c.size()-d_period;i<c.size();++i) d += k[i];
    return {k.back(), d/static_cast<double>(d_period)};
}

double compute_williams_r(const core::Candles& c, size_t p){
    if (p==0 || c.size()<p) return nan();
    double hi=c[c.size()-p].high, lo=c[c.size()-p].low;
    for (size_t i=c.size()-p;i<c.size();++i){ hi=std::max(hi, c[i].high); lo=std::min(lo, c[i].low); }
    if (hi==lo) return -50.0;
    return -100.0*(hi - c.back().close)/(hi - lo);
}

double compute_mfi(const core::Candles& c, size_t p){
    if (p==0 || c.size()<p+1) return nan();
    double pos=0.0, neg=0.0;
    for (size_t i=c.size()-p;i<c.size();++i){
        const double tp  = (c[i].high + c[i].low + c[i].close)/3.0;
        const double ptp = (c[i-1].high + c[i-1].low + c[i-1].close)/3.0;
        const double flow = tp * c[i].volume;
        if (tp>ptp) pos += flow;
        else if (tp<ptp) neg += flow;
    }
    if (neg==0.0) return pos>0.0 ? 100.0 : 50.0;
    return 100.0 - 100.0/(1.0 + pos/neg);
}

core::IndicatorReading StochasticModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto s = compute_stochastic(c, k_p, d_p);
    if (!is_num(s.k) || !is_num(s.d)) return unavailable();
    core::Vote v = core::Vote::Hold;
    if (s.k<20.0 && s.d<20.0) v = core::Vote::Buy;
    else if (s.k>80.0 && s.d>80.0) v = core::Vote::Sell;
    return {id(), s.k, v};
}

core::IndicatorReading WilliamsModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const double w = compute_williams_r(c, period);
    const core::Vote v = (w<-80.0? core::Vote::Buy : w>-20.0? core::Vote::Sell : core::Vote::Hold);
    return {id(), w, v};
}

core::IndicatorReading MfiModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const double m = compute_mfi(c, period);
    const core::Vote v = (m<20.0? core::Vote::Buy : m>80.0? core::Vote::Sell : core::Vote::Hold);
    return {id(), m, v};
}

} // namespace ind
