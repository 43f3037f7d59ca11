#include "indicators/macd.hpp"

namespace ind {

MacdLines compute_macd(const Series& c, size_t fast, size_t slow, size_t signal){
    MacdLines m;
    const auto ef = ema_series(c, fast);
    const auto es = ema_series(c, slow);
    m.line.resize(c.size());
    for (size_t i=0;i<c.size();++i) m.line[i] = ef[i]-es[i];
    m.signal = ema_series(m.line, signal);
    m.hist.resize(c.size());
    for (size_t i=0;i<c.size();++i) m.hist[i] = m.line[i]-m.signal[i];
    return m;
}

core::IndicatorReading MacdModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars() || c.size()<2) return unavailable();
    const auto m = compute_macd(closes(c), fast_p, slow_p, signal_p);
    const size_t n = m.line.size();
    const double l1 = m.line[n-1], s1 = m.signal[n-1];
    const double l0 = m.line[n-2], s0 = m.signal[n-2];
    core::Vote v = core::Vote::Hold;
    if (l1>s1 && l0<=s0) v = core::Vote::Buy;
    else if (l1<s1 && l0>=s0) v = core::Vote::Sell;
    return {id(), l1, v};
}

} // namespace ind
