#include "strategy/reversal_watcher.hpp"
#include <exception>
#include "strategy/market_regime.hpp"
#include "indicators/rsi.hpp"
#include "indicators/macd.hpp"
#include "indicators/bollinger.hpp"
#include <spdlog/spdlog.h>

namespace strategy {

using core::Side;

const char* to_string(Pattern p){
    switch (p){
        case Pattern::BullishEngulfing: return "bullish_engulfing";
        case Pattern::Hammer:           return "hammer";
        case Pattern::BearishEngulfing: return "bearish_engulfing";
        case Pattern::ShootingStar:     return "shooting_star";
        default:                        return "none";
    }
}

Pattern detect_pattern(const core::Candles& c){
    if (c.size()<2) return Pattern::None;
    const auto& p = c[c.size()-2];
    const auto& b = c.back();

    if (p.close<p.open && b.close>b.open && b.open<=p.close && b.close>=p.open) return Pattern::BullishEngulfing;
    if (p.close>p.open && b.close<b.open && b.open>=p.close && b.close<=p.open) return Pattern::BearishEngulfing;

    const double range = b.high - b.low;
    if (range<=0.0) return Pattern::None;
    const double body  = std::abs(b.close - b.open);
    const double lower = std::min(b.open, b.close) - b.low;
    const double upper = b.high - std::max(b.open, b.close);
    // long wick at least twice the body, opposite wick no larger than the body or 10 % of range
    if (lower>=2.0*body && lower>=0.6*range && upper<=std::max(body, 0.1*range)) return Pattern::Hammer;
    if (upper>=2.0*body && upper>=0.6*range && lower<=std::max(body, 0.1*range)) return Pattern::ShootingStar;
    return Pattern::None;
}

int ReversalVotes::count(Side s) const {
    int n=0;
    for (auto& v : {rsi, macd, bollinger, levels, pattern}) if (v && *v==s) ++n;
    return n;
}

std::optional<Side> decide_reversal(const ReversalVotes& v){
    const int l = v.count(Side::Long), s = v.count(Side::Short);
    // majority side wins; a tie (2-2) resolves to long
    if (l>=2 && l>=s) return Side::Long;
    if (s>=2) return Side::Short;
    return std::nullopt;
}

ReversalVotes ReversalDetector::votes(const core::Candles& c) const {
    ReversalVotes v;
    if (c.empty()) return v;
    const auto cl = ind::closes(c);
    const double close = cl.back();

    if (cfg_.use_rsi){
        const double r = ind::compute_rsi(cl, 14);
        if (ind::is_num(r)){
            if (r<30.0) v.rsi = Side::Long;
            else if (r>70.0) v.rsi = Side::Short;
        }
    }
    if (cfg_.use_macd && cl.size()>=26){
        const auto m = ind::compute_macd(cl);
        const double line = m.line.back(), sig = m.signal.back();
        if (line>sig) v.macd = Side::Long;
        else if (line<sig) v.macd = Side::Short;
    }
    if (cfg_.use_bollinger){
        const auto bb = ind::compute_bb(cl, 20, 2.0);
        if (ind::is_num(bb.lower) && close<bb.lower) v.bollinger = Side::Long;
        else if (ind::is_num(bb.upper) && close>bb.upper) v.bollinger = Side::Short;
    }
    if (cfg_.use_levels && c.size()>=10){
        const auto sr = support_resistance(c);
        const bool near_sup = !sr.supports.empty() && sr.support_distance_pct<=cfg_.sr_proximity_pct;
        const bool near_res = !sr.resistances.empty() && sr.resistance_distance_pct<=cfg_.sr_proximity_pct;
        if (near_sup && (!near_res || sr.support_distance_pct<sr.resistance_distance_pct)) v.levels = Side::Long;
        else if (near_res && (!near_sup || sr.resistance_distance_pct<sr.support_distance_pct)) v.levels = Side::Short;
    }
    if (cfg_.use_pattern){
        const auto p = detect_pattern(c);
        if (p==Pattern::BullishEngulfing || p==Pattern::Hammer) v.pattern = Side::Long;
        else if (p==Pattern::BearishEngulfing || p==Pattern::ShootingStar) v.pattern = Side::Short;
    }
    return v;
}

ReversalWatcher::ReversalWatcher(exec::ExchangeGateway& gw, ReversalConfig cfg, PositionCloser closer, ReversalSink sink)
    : gw_(gw), cfg_(std::move(cfg)), detector_(cfg_), closer_(std::move(closer)), sink_(std::move(sink)) {}

std::optional<Side> ReversalWatcher::detect_for(const std::string& symbol){
    core::Candles c;
    try {
        c = gw_.get_candles(symbol, cfg_.timeframe, cfg_.candles);
    } catch (const exec::ExchangeError& e){
        spdlog::warn("reversal {}: candle fetch failed: {}", symbol, e.what());
        return std::nullopt;
    }
    if (c.size()<cfg_.min_bars){
        spdlog::warn("reversal {}: {} candles, need {}", symbol, c.size(), cfg_.min_bars);
        return std::nullopt;
    }
    const auto v = detector_.votes(c);
    const auto dir = decide_reversal(v);
    spdlog::debug("reversal {} {}: long {} short {}", symbol, core::to_label(cfg_.timeframe), v.count(Side::Long), v.count(Side::Short));
    if (!dir || !cfg_.htf_confirm) return dir;

    core::Candles h;
    try {
        h = gw_.get_candles(symbol, cfg_.htf, cfg_.candles);
    } catch (const exec::ExchangeError& e){
        spdlog::warn("reversal {}: {} fetch failed: {}", symbol, core::to_label(cfg_.htf), e.what());
        return std::nullopt;
    }
    if (h.size()<cfg_.min_bars) return std::nullopt;
    const auto hdir = detector_.detect(h);
    if (hdir!=dir){
        spdlog::info("reversal {} {} not confirmed on {}", symbol, core::to_string(*dir), core::to_label(cfg_.htf));
        return std::nullopt;
    }
    return dir;
}

bool ReversalWatcher::in_scope(const exec::Position& p, const std::string& driver) const {
    return cfg_.all_instruments || p.symbol==driver;
}

std::vector<ReversalOutcome> ReversalWatcher::check_once(){
    std::vector<ReversalOutcome> out;
    for (auto& driver : cfg_.drivers){
        std::optional<Side> dir;
        try {
            dir = detect_for(driver);
        } catch (const std::exception& e){
            spdlog::error("reversal {}: detection failed: {}", driver, e.what());
            continue;
        }
        if (!dir) continue;
        {
            std::lock_guard<std::mutex> lk(mu_);
            last_[driver] = *dir;
        }
        spdlog::info("reversal {} -> {}", driver, core::to_string(*dir));
        if (sink_) sink_(driver, *dir);

        std::vector<exec::Position> positions;
        try {
            positions = gw_.get_open_positions();
        } catch (const exec::ExchangeError& e){
            spdlog::warn("reversal {}: position fetch failed: {}", driver, e.what());
            continue;
        } catch (const std::exception& e){
            spdlog::error("reversal {}: position fetch failed: {}", driver, e.what());
            continue;
        }

        ReversalOutcome o{driver, *dir, 0};
        for (auto& p : positions){
            if (!in_scope(p, driver) || p.side!=core::opposite(*dir)) continue;
            if (p.unrealized_pnl<=0.0 && !cfg_.close_losing) continue;
            if (closer_ && closer_(p)){
                ++o.closed;
                spdlog::info("reversal {}: closed {} {} pnl {}", driver, p.symbol, core::to_string(p.side), p.unrealized_pnl);
            }
        }
        out.push_back(o);
    }
    return out;
}

std::optional<Side> ReversalWatcher::last_direction(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = last_.find(symbol);
    if (it==last_.end()) return std::nullopt;
    return it->second;
}

} // namespace strategy
