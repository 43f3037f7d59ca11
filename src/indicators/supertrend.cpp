#include "indicators/supertrend.hpp"
#include "indicators/atr.hpp"
#include <limits>

namespace ind {

double median(std::vector<double> v){
    if (v.empty()) return nan();
    std::sort(v.begin(), v.end());
    const size_t n = v.size();
    return (n%2) ? v[n/2] : 0.5*(v[n/2-1] + v[n/2]);
}

std::vector<size_t> kmeans_labels(const std::vector<Point2>& pts, size_t k, size_t max_iter){
    std::vector<size_t> labels(pts.size(), 0);
    if (pts.empty() || k==0) return labels;
    k = std::min(k, pts.size());

    // seed centroids at evenly spaced quantiles of the x-sorted points
    std::vector<size_t> order(pts.size());
    for (size_t i=0;i<order.size();++i) order[i]=i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b){ return pts[a].x < pts[b].x; });
    std::vector<Point2> cent(k);
    for (size_t j=0;j<k;++j){
        const size_t q = (k==1) ? order.size()/2 : (j*(order.size()-1))/(k-1);
        cent[j] = pts[order[q]];
    }

    for (size_t it=0; it<max_iter; ++it){
        bool changed = (it==0);
        for (size_t i=0;i<pts.size();++i){
            size_t best=0; double bd=std::numeric_limits<double>::max();
            for (size_t j=0;j<k;++j){
                const double dx=pts[i].x-cent[j].x, dy=pts[i].y-cent[j].y;
                const double d=dx*dx+dy*dy;
                if (d<bd){ bd=d; best=j; }
            }
            if (labels[i]!=best){ labels[i]=best; changed=true; }
        }
        if (!changed) break;
        std::vector<Point2> sum(k, Point2{0.0, 0.0});
        std::vector<size_t> cnt(k, 0);
        for (size_t i=0;i<pts.size();++i){ sum[labels[i]].x+=pts[i].x; sum[labels[i]].y+=pts[i].y; ++cnt[labels[i]]; }
        for (size_t j=0;j<k;++j){
            // an empty cluster keeps its previous centroid
            if (cnt[j]) cent[j] = {sum[j].x/static_cast<double>(cnt[j]), sum[j].y/static_cast<double>(cnt[j])};
        }
    }
    return labels;
}

double SuperTrendAI::best_multiplier(const core::Candles& c) const {
    const auto atr = atr_series(c, window_, 1);
    std::vector<Point2> pts;
    pts.reserve(c.size());
    for (size_t i=0;i<c.size();++i){
        const double r = c[i].high - c[i].low;
        if (is_num(r) && is_num(atr[i])) pts.push_back({r, atr[i]});
    }
    if (pts.size() < clusters_) return 3.0;

    const auto labels = kmeans_labels(pts, clusters_);
    std::vector<double> mults;
    for (size_t j=0;j<clusters_;++j){
        std::vector<double> ratios;
        for (size_t i=0;i<pts.size();++i)
            if (labels[i]==j) ratios.push_back(pts[i].x/(pts[i].y + 1e-8));
        if (ratios.empty()) continue;
        mults.push_back(std::max(min_mult_, std::min(max_mult_, median(ratios))));
    }
    return mults.empty() ? 3.0 : median(mults);
}

SuperTrendResult SuperTrendAI::compute(const core::Candles& c) const {
    return compute(c, best_multiplier(c));
}

SuperTrendResult SuperTrendAI::compute(const core::Candles& c, double m) const {
    SuperTrendResult r;
    r.multiplier = m;
    r.line.assign(c.size(), nan());
    r.dir.assign(c.size(), 1);
    if (c.empty()) return r;

    const auto atr = atr_series(c, window_, 1);
    Series upper(c.size()), lower(c.size());
    for (size_t i=0;i<c.size();++i){
        const double hl2 = 0.5*(c[i].high + c[i].low);
        upper[i] = hl2 + m*atr[i];
        lower[i] = hl2 - m*atr[i];
    }

    bool up = true;
    r.line[0] = upper[0];
    for (size_t i=1;i<c.size();++i){
        if (c[i].close > upper[i-1]) up = true;
        else if (c[i].close < lower[i-1]) up = false;
        r.line[i] = up ? lower[i] : upper[i];
        r.dir[i]  = up ? 1 : -1;
    }
    return r;
}

core::IndicatorReading SuperTrendModule::evaluate(const core::Candles& c) const {
    if (c.size()<warmup_bars()) return unavailable();
    const auto r = st.compute(c);
    const double line = r.line.back(), close = c.back().close;
    if (!is_num(line)) return unavailable();
    core::Vote v = core::Vote::Hold;
    if (r.dir.back()==1 && close>line) v = core::Vote::Buy;
    else if (r.dir.back()==-1 && close<line) v = core::Vote::Sell;
    return {id(), line, v};
}

} // namespace ind
