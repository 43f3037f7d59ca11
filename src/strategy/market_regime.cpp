#include "strategy/market_regime.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/atr.hpp"
#include <spdlog/spdlog.h>

namespace strategy {

using ind::Series;
using ind::is_num;

const char* to_string(Regime r){
    switch (r){
        case Regime::TrendingUp:     return "trending_up";
        case Regime::TrendingDown:   return "trending_down";
        case Regime::HighVolatility: return "high_volatility";
        case Regime::LowVolatility:  return "low_volatility";
        case Regime::Breakout:       return "breakout";
        case Regime::Consolidation:  return "consolidation";
        default:                     return "sideways";
    }
}

const char* to_string(TrendDirection d){
    return d==TrendDirection::Up ? "up" : d==TrendDirection::Down ? "down" : "sideways";
}

const char* to_string(TrendStrength s){
    switch (s){
        case TrendStrength::Strong: return "strong";
        case TrendStrength::Medium: return "medium";
        case TrendStrength::Weak:   return "weak";
        default:                    return "none";
    }
}

const char* to_string(Level l){
    switch (l){
        case Level::VeryLow:  return "very_low";
        case Level::Low:      return "low";
        case Level::High:     return "high";
        case Level::VeryHigh: return "very_high";
        default:              return "medium";
    }
}

const char* volume_label(Level l){
    return l==Level::Medium ? "normal" : to_string(l);
}

namespace {

double last(const Series& s){ return s.empty() ? ind::nan() : s.back(); }

// least-squares slope over x = 0..n-1
double slope(const Series& y){
    const double n = static_cast<double>(y.size());
    if (y.size()<2) return 0.0;
    double sx=0, sy=0, sxx=0, sxy=0;
    for (size_t i=0;i<y.size();++i){
        const double x = static_cast<double>(i);
        sx+=x; sy+=y[i]; sxx+=x*x; sxy+=x*y[i];
    }
    const double den = n*sxx - sx*sx;
    return den!=0.0 ? (n*sxy - sx*sy)/den : 0.0;
}

bool is_strong_or_medium(TrendStrength s){ return s==TrendStrength::Strong || s==TrendStrength::Medium; }

} // namespace

TrendInfo analyze_trend(const core::Candles& c){
    TrendInfo t;
    if (c.empty()) return t;
    const auto cl = ind::closes(c);
    const auto s20 = ind::sma_series(cl, 20);
    const double p = cl.back(), a = last(s20), b = last(ind::sma_series(cl, 50)), d = last(ind::sma_series(cl, 100));
    t.price = p; t.sma20 = a; t.sma50 = b; t.sma100 = d;

    if      (p>a && a>b && b>d) { t.direction=TrendDirection::Up;   t.strength=TrendStrength::Strong; }
    else if (p<a && a<b && b<d) { t.direction=TrendDirection::Down; t.strength=TrendStrength::Strong; }
    else if (p>a && a>b)        { t.direction=TrendDirection::Up;   t.strength=TrendStrength::Medium; }
    else if (p<a && a<b)        { t.direction=TrendDirection::Down; t.strength=TrendStrength::Medium; }
    else if (p>a)               { t.direction=TrendDirection::Up;   t.strength=TrendStrength::Weak; }
    else if (p<a)               { t.direction=TrendDirection::Down; t.strength=TrendStrength::Weak; }

    if (s20.size()>=10 && p!=0.0){
        Series tail(s20.end()-10, s20.end());
        if (std::all_of(tail.begin(), tail.end(), [](double v){ return is_num(v); }))
            t.angle_pct = slope(tail)/p*100.0;
    }
    return t;
}

VolatilityInfo analyze_volatility(const core::Candles& c){
    VolatilityInfo v;
    if (c.empty() || c.back().close==0.0) return v;
    const auto atr = ind::atr_series(c, 14);
    const double a = last(atr);
    if (!is_num(a)) return v;
    v.atr = a;
    v.pct = a / c.back().close * 100.0;
    if      (v.pct<=1.0) v.level = Level::VeryLow;
    else if (v.pct<=2.0) v.level = Level::Low;
    else if (v.pct<=4.0) v.level = Level::Medium;
    else if (v.pct<=8.0) v.level = Level::High;
    else                 v.level = Level::VeryHigh;
    v.is_high = v.pct > 4.0;
    if (atr.size()>=5){
        const double prev = atr[atr.size()-5];
        v.is_increasing = is_num(prev) && a > prev;
    }
    return v;
}

VolumeInfo analyze_volume(const core::Candles& c){
    VolumeInfo v;
    if (c.empty()) return v;
    const auto vol = ind::volumes(c);
    const double cur = vol.back();
    const double a20 = last(ind::sma_series(vol, 20));
    const double a50 = last(ind::sma_series(vol, 50));
    v.ratio20 = (is_num(a20) && a20>0.0) ? cur/a20 : 1.0;
    v.ratio50 = (is_num(a50) && a50>0.0) ? cur/a50 : 1.0;
    if      (v.ratio20>2.0) v.level = Level::VeryHigh;
    else if (v.ratio20>1.5) v.level = Level::High;
    else if (v.ratio20>0.8) v.level = Level::Medium;
    else if (v.ratio20>0.5) v.level = Level::Low;
    else                    v.level = Level::VeryLow;
    v.is_high = v.ratio20 > 1.5;
    if (vol.size()>=10){
        double recent=0, older=0;
        for (size_t i=vol.size()-5;i<vol.size();++i) recent += vol[i];
        for (size_t i=vol.size()-10;i<vol.size()-5;++i) older += vol[i];
        v.is_increasing = recent > older;
    }
    return v;
}

SupportResistance support_resistance(const core::Candles& c, size_t window){
    SupportResistance sr;
    if (c.empty()) return sr;
    const double price = c.back().close;
    const auto hi = ind::rolling_max(ind::highs(c), window);
    const auto lo = ind::rolling_min(ind::lows(c), window);

    std::vector<double> above, below;
    for (size_t i=0;i<c.size();++i){
        if (is_num(hi[i]) && hi[i]>price) above.push_back(hi[i]);
        if (is_num(lo[i]) && lo[i]<price) below.push_back(lo[i]);
    }
    // the three most recent levels on each side
    if (above.size()>3) above.erase(above.begin(), above.end()-3);
    if (below.size()>3) below.erase(below.begin(), below.end()-3);

    sr.resistances = above;
    sr.supports = below;
    sr.nearest_resistance = above.empty() ? price*1.05 : *std::min_element(above.begin(), above.end());
    sr.nearest_support    = below.empty() ? price*0.95 : *std::max_element(below.begin(), below.end());
    if (price!=0.0){
        sr.resistance_distance_pct = (sr.nearest_resistance - price)/price*100.0;
        sr.support_distance_pct    = (price - sr.nearest_support)/price*100.0;
    }
    return sr;
}

double trend_strength(const core::Candles& c){
    if (c.size()<20) return 50.0;
    Series plus(c.size(), 0.0), minus(c.size(), 0.0);
    for (size_t i=1;i<c.size();++i){
        const double d = c[i].close - c[i-1].close;
        if (d>0.0) plus[i] = d;
        else if (d<0.0) minus[i] = -d;
    }
    const auto pdi = ind::sma_series(plus, 14);
    const auto mdi = ind::sma_series(minus, 14);
    Series dx(c.size(), ind::nan());
    for (size_t i=0;i<c.size();++i){
        const double den = pdi[i] + mdi[i];
        if (is_num(den) && den>0.0) dx[i] = std::abs(pdi[i]-mdi[i])/den*100.0;
    }
    const double s = last(ind::sma_series(dx, 14));
    if (!is_num(s)) return 50.0;
    return std::max(0.0, std::min(100.0, s));
}

Regime determine_regime(const TrendInfo& t, const VolatilityInfo& v){
    const bool directional = t.direction!=TrendDirection::Sideways && is_strong_or_medium(t.strength);
    if (v.is_high) return directional ? Regime::Breakout : Regime::HighVolatility;
    if (directional) return t.direction==TrendDirection::Up ? Regime::TrendingUp : Regime::TrendingDown;
    if (v.level==Level::VeryLow || v.level==Level::Low) return Regime::Consolidation;
    return Regime::Sideways;
}

double market_score(const TrendInfo& t, const VolatilityInfo& v, const VolumeInfo& vol){
    double s = 50.0;
    if (t.strength==TrendStrength::Strong) s += 20.0;
    else if (t.strength==TrendStrength::Medium) s += 10.0;

    if (v.level==Level::High || v.level==Level::VeryHigh) s -= 10.0;
    else if (v.level==Level::Low || v.level==Level::VeryLow) s += 5.0;

    if (vol.is_high) s += 10.0;
    else if (vol.level==Level::VeryLow) s -= 5.0;
    return std::max(0.0, std::min(100.0, s));
}

Recommendation recommend(Regime r, const VolatilityInfo& v){
    Recommendation rec;
    switch (r){
        case Regime::TrendingUp:
        case Regime::TrendingDown:   rec = {"trend_following", "low", 1.2}; break;
        case Regime::HighVolatility: rec = {"scalping", "high", 0.7}; break;
        case Regime::Consolidation:  rec = {"range_trading", "medium", 0.9}; break;
        case Regime::Breakout:       rec = {"breakout", "medium", 1.1}; break;
        default: break;
    }
    if (v.is_high){
        rec.risk_level = "high";
        rec.size_multiplier *= 0.8;
    }
    return rec;
}

MarketAnalysis neutral_analysis(double price){
    MarketAnalysis a;
    a.trend.price = price;
    a.levels.nearest_support = price*0.95;
    a.levels.nearest_resistance = price*1.05;
    return a;
}

MarketRegimeClassifier::MarketRegimeClassifier(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::steady_clock::now(); })) {}

MarketAnalysis MarketRegimeClassifier::analyze(const core::Candles& c){
    if (c.size()<kMinCandles) return neutral_analysis(c.empty() ? 0.0 : c.back().close);
    MarketAnalysis a;
    a.neutral = false;
    a.trend = analyze_trend(c);
    a.volatility = analyze_volatility(c);
    a.volume = analyze_volume(c);
    a.regime = determine_regime(a.trend, a.volatility);
    a.levels = support_resistance(c);
    a.trend_strength = trend_strength(c);
    a.market_score = market_score(a.trend, a.volatility, a.volume);
    a.recommendation = recommend(a.regime, a.volatility);
    return a;
}

std::shared_ptr<const MarketAnalysis> MarketRegimeClassifier::classify(const std::string& symbol, core::Timeframe tf, const core::Candles& c){
    if (c.size()<kMinCandles){
        spdlog::debug("{} {}: {} candles, neutral market analysis", symbol, core::to_label(tf), c.size());
        return std::make_shared<const MarketAnalysis>(analyze(c));
    }
    const auto key = std::make_pair(symbol, tf);
    const auto now = clock_();
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cache_.find(key);
    if (it!=cache_.end() && now - it->second.at < ttl_) return it->second.analysis;

    auto a = std::make_shared<const MarketAnalysis>(analyze(c));
    cache_[key] = Entry{a, now};
    spdlog::info("{} {}: market regime {} score {:.0f}", symbol, core::to_label(tf), to_string(a->regime), a->market_score);
    return a;
}

void MarketRegimeClassifier::clear(){
    std::lock_guard<std::mutex> lk(mu_);
    cache_.clear();
}

size_t MarketRegimeClassifier::cached() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.size();
}

} // namespace strategy
