#include "indicators/sma_ema.hpp"
#include <numeric>
#include <cmath>

namespace ind {

Series closes(const core::Candles& c){
    Series out; out.reserve(c.size());
    for (const auto& b : c) out.push_back(b.close);
    return out;
}
Series highs(const core::Candles& c){
    Series out; out.reserve(c.size());
    for (const auto& b : c) out.push_back(b.high);
    return out;
}
Series lows(const core::Candles& c){
    Series out; out.reserve(c.size());
    for (const auto& b : c) out.push_back(b.low);
    return out;
}
Series volumes(const core::Candles& c){
    Series out; out.reserve(c.size());
    for (const auto& b : c) out.push_back(b.volume);
    return out;
}

Series sma_series(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (p==0 || v.size()<p) return out;
    double s=0.0;
    for (size_t i=0;i<v.size();++i){
        s += v[i];
        if (i>=p) s -= v[i-p];
        if (i+1>=p) out[i] = s/static_cast<double>(p);
    }
    return out;
}

Series ema_series(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (v.empty() || p==0) return out;
    const double k = 2.0/(p+1.0);
    double e = v[0];
    out[0] = e;
    for (size_t i=1;i<v.size();++i){ e = v[i]*k + e*(1.0-k); out[i] = e; }
    return out;
}

Series rolling_std(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (p<2 || v.size()<p) return out;
    for (size_t i=p-1;i<v.size();++i){
        double mean=0.0;
        for (size_t j=i+1-p;j<=i;++j) mean += v[j];
        mean /= static_cast<double>(p);
        double var=0.0;
        for (size_t j=i+1-p;j<=i;++j){ const double d=v[j]-mean; var+=d*d; }
        out[i] = std::sqrt(std::max(0.0, var/static_cast<double>(p-1)));
    }
    return out;
}

Series rolling_sum(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (p==0 || v.size()<p) return out;
    double s=0.0;
    for (size_t i=0;i<v.size();++i){
        s += v[i];
        if (i>=p) s -= v[i-p];
        if (i+1>=p) out[i] = s;
    }
    return out;
}

Series rolling_min(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (p==0 || v.size()<p) return out;
    for (size_t i=p-1;i<v.size();++i)
        out[i] = *std::min_element(v.begin()+(i+1-p), v.begin()+i+1);
    return out;
}

Series rolling_max(const Series& v, size_t p){
    Series out(v.size(), nan());
    if (p==0 || v.size()<p) return out;
    for (size_t i=p-1;i<v.size();++i)
        out[i] = *std::max_element(v.begin()+(i+1-p), v.begin()+i+1);
    return out;
}

double compute_sma(const Series& v, size_t p){
    if (p==0 || v.size()<p) return nan();
    double s=0; for (size_t i=v.size()-p;i<v.size();++i) s+=v[i];
    return s/static_cast<double>(p);
}

double compute_ema(const Series& v, size_t p){
    if (v.empty()) return nan();
    return ema_series(v, p).back();
}

core::IndicatorReading SmaModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto cl = closes(c);
    const double s = compute_sma(cl, short_p);
    const double l = compute_sma(cl, long_p);
    if (!is_num(s) || !is_num(l)) return unavailable();
    const core::Vote v = (s>l? core::Vote::Buy : s<l? core::Vote::Sell : core::Vote::Hold);
    return {id(), s, v};
}

core::IndicatorReading EmaModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto cl = closes(c);
    const double f = compute_ema(cl, fast_p);
    const double s = compute_ema(cl, slow_p);
    const core::Vote v = (f>s? core::Vote::Buy : f<s? core::Vote::Sell : core::Vote::Hold);
    return {id(), f, v};
}

core::IndicatorReading AdxProxyModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto cl = closes(c);
    const double es = compute_ema(cl, short_p);
    const double el = compute_ema(cl, long_p);
    if (!is_num(el) || el==0.0) return unavailable();
    const double strength = std::abs(es - el) / el * 100.0;
    core::Vote v = core::Vote::Hold;
    if (strength > threshold_pct) v = (es>el? core::Vote::Buy : core::Vote::Sell);
    return {id(), strength, v};
}

} // namespace ind
