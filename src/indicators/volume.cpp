#include "indicators/volume.hpp"

namespace ind {

Series obv_series(const core::Candles& c){
    Series obv(c.size(), 0.0);
    if (c.empty()) return obv;
    obv[0] = c[0].volume;
    for (size_t i=1;i<c.size();++i){
        if (c[i].close > c[i-1].close)      obv[i] = obv[i-1] + c[i].volume;
        else if (c[i].close < c[i-1].close) obv[i] = obv[i-1] - c[i].volume;
        else                                obv[i] = obv[i-1];
    }
    return obv;
}

Series cmf_series(const core::Candles& c, size_t p){
    Series mfv(c.size(), 0.0);
    for (size_t i=0;i<c.size();++i){
        const double range = c[i].high - c[i].low;
        const double mfm = range!=0.0 ? ((c[i].close - c[i].low) - (c[i].high - c[i].close)) / range : 0.0;
        mfv[i] = mfm * c[i].volume;
    }
    const auto num = rolling_sum(mfv, p);
    const auto den = rolling_sum(volumes(c), p);
    Series out(c.size(), nan());
    for (size_t i=0;i<c.size();++i){
        if (is_num(num[i]) && is_num(den[i]) && den[i]!=0.0) out[i] = num[i]/den[i];
    }
    return out;
}

core::IndicatorReading ObvModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto obv = obv_series(c);
    const auto avg = sma_series(obv, smooth);
    const double a1 = avg[avg.size()-1], a0 = avg[avg.size()-2];
    if (!is_num(a1) || !is_num(a0)) return {id(), obv.back(), core::Vote::Hold};
    const core::Vote v = (a1>a0? core::Vote::Buy : a1<a0? core::Vote::Sell : core::Vote::Hold);
    return {id(), obv.back(), v};
}

core::IndicatorReading CmfModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const double cmf = cmf_series(c, period).back();
    if (!is_num(cmf)) return unavailable();
    const core::Vote v = (cmf>threshold? core::Vote::Buy : cmf<-threshold? core::Vote::Sell : core::Vote::Hold);
    return {id(), cmf, v};
}

} // namespace ind
