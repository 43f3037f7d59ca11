#include "indicators/rsi.hpp"
#include <cmath>

namespace ind {

Series rsi_series(const Series& c, size_t p){
    Series out(c.size(), nan());
    if (p==0 || c.size() <= p) return out;

    auto to_rsi = [](double g, double l){
        if (l==0.0) return g>0.0 ? 100.0 : 0.0; // 0/0 -> 0
        const double rs = g/l;
        return 100.0 - (100.0/(1.0+rs));
    };

    double g=0.0, l=0.0;
    for (size_t i=1;i<=p;++i){
        const double d = c[i]-c[i-1];
        if (d>=0) g+=d; else l-=d;
    }
    g/=p; l/=p;
    out[p] = to_rsi(g, l);
    for (size_t i=p+1;i<c.size();++i){
        const double d = c[i]-c[i-1];
        const double up = d>0? d : 0.0;
        const double dn = d<0? -d : 0.0;
        g = (g*(p-1) + up)/p;
        l = (l*(p-1) + dn)/p;
        out[i] = to_rsi(g, l);
    }
    return out;
}

double compute_rsi(const Series& c, size_t p){
    if (c.size() <= p) return nan();
    return rsi_series(c, p).back();
}

core::IndicatorReading RsiModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const double rsi = compute_rsi(closes(c), period);
    if (!is_num(rsi)) return unavailable();
    const core::Vote v = (rsi<oversold? core::Vote::Buy : rsi>overbought? core::Vote::Sell : core::Vote::Hold);
    return {id(), rsi, v};
}

} // namespace ind
