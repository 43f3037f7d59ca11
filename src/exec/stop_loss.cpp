#include "exec/stop_loss.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

namespace exec {

namespace {
inline std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}

const char* to_string(StopType t){
    switch (t){
        case StopType::Trailing: return "trailing";
        case StopType::AtrBased: return "atr_based";
        default:                 return "percentage";
    }
}

std::optional<StopType> parse_stop_type(const std::string& s){
    if (s=="trailing")   return StopType::Trailing;
    if (s=="atr_based" || s=="atr") return StopType::AtrBased;
    if (s=="percentage") return StopType::Percentage;
    return std::nullopt;
}

// ---------------- TrailingStop

TrailingStop::TrailingStop(core::PositionKey key, double entry, StopType type, double distance,
                           std::optional<double> atr, const StopConfig& cfg)
    : key_(std::move(key)), entry_(entry), type_(type), distance_(distance), atr_(atr),
      min_pct_(cfg.min_distance_pct), max_pct_(cfg.max_distance_pct), fallback_pct_(cfg.default_distance),
      best_(entry), created_ms_(now_ms())
{
    const double off = offset(entry);
    initial_stop_ = stop_ = (key_.side==core::Side::Long) ? entry - off : entry + off;
}

double TrailingStop::offset(double price) const {
    double off = 0.0;
    switch (type_){
        case StopType::Trailing:   off = distance_; break;
        case StopType::Percentage: off = price*distance_; break;
        case StopType::AtrBased:
            // no ATR seen yet: fall back to the default percentage
            off = atr_ ? (*atr_)*distance_ : price*fallback_pct_;
            break;
    }
    return std::max(min_pct_*price, std::min(max_pct_*price, off));
}

bool TrailingStop::update(double price, std::optional<double> atr){
    if (!active_) return false;
    if (atr && *atr>0.0) atr_ = atr;
    const bool is_long = key_.side==core::Side::Long;
    if (is_long ? price<=best_ : price>=best_) return false;
    best_ = price;

    const double off = offset(price);
    const double cand = is_long ? price - off : price + off;
    if (is_long ? cand>stop_ : cand<stop_){
        stop_ = cand;
        spdlog::debug("stop {} moved to {:.6f}", core::to_string(key_), stop_);
        return true;
    }
    return false;
}

bool TrailingStop::should_trigger(double price) const {
    if (!active_) return false;
    return key_.side==core::Side::Long ? price<=stop_ : price>=stop_;
}

double TrailingStop::profit_pct() const {
    if (entry_==0.0) return 0.0;
    return key_.side==core::Side::Long ? (best_-entry_)/entry_ : (entry_-best_)/entry_;
}

// ---------------- StopLossEngine

double StopLossEngine::select_distance(StopType type, double entry, const strategy::MarketAnalysis* a) const {
    if (type==StopType::AtrBased){
        double m = cfg_.atr_multiplier;
        if (a){
            const auto lvl = a->volatility.level;
            if (lvl==strategy::Level::High || lvl==strategy::Level::VeryHigh) m *= 1.25;
            else if (lvl==strategy::Level::Low || lvl==strategy::Level::VeryLow) m *= 0.8;
        }
        return m;
    }
    const double vol = a ? a->volatility.pct : 2.0;
    double d = cfg_.default_distance;
    if (vol>5.0) d *= 1.5;
    else if (vol>3.0) d *= 1.2;
    else if (vol<1.0) d *= 0.8;
    d = std::max(cfg_.min_distance_pct, std::min(cfg_.max_distance_pct, d));
    return type==StopType::Trailing ? d*entry : d;
}

TrailingStop StopLossEngine::create(const std::string& symbol, core::Side side, double entry,
                                    std::optional<StopType> type, std::optional<double> distance,
                                    std::optional<double> atr, const strategy::MarketAnalysis* analysis){
    const StopType t = type.value_or(cfg_.type);
    const double d = distance ? *distance : select_distance(t, entry, analysis);
    TrailingStop ts(core::PositionKey{symbol, side}, entry, t, d, atr, cfg_);
    {
        std::lock_guard<std::mutex> lk(mu_);
        stops_.erase(ts.key());
        stops_.emplace(ts.key(), ts);
    }
    spdlog::info("stop created {} {} entry {} stop {:.6f} distance {}", core::to_string(ts.key()), to_string(t), entry, ts.current_stop(), d);
    return ts;
}

bool StopLossEngine::ensure(const std::string& symbol, core::Side side, double entry,
                            std::optional<StopType> type, std::optional<double> atr,
                            const strategy::MarketAnalysis* analysis){
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stops_.count(core::PositionKey{symbol, side})) return false;
    }
    create(symbol, side, entry, type, std::nullopt, atr, analysis);
    return true;
}

TickResult StopLossEngine::on_tick(const core::PositionKey& key, double price, std::optional<double> atr){
    TickResult r;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = stops_.find(key);
    if (it==stops_.end()) return r;
    r.found = true;
    auto& ts = it->second;
    if (!ts.active()){
        r.triggered = true;
        r.stop = ts.current_stop();
        spdlog::warn("stop {} still pending close, price {} stop {:.6f}", core::to_string(key), price, r.stop);
        return r;
    }
    r.moved = ts.update(price, atr);
    r.stop = ts.current_stop();
    if (ts.should_trigger(price)){
        ts.deactivate();
        r.triggered = true;
        spdlog::warn("stop triggered {} price {} stop {:.6f}", core::to_string(key), price, r.stop);
    }
    return r;
}

std::vector<TriggeredStop> StopLossEngine::on_prices(const std::map<std::string, double>& prices, const AtrProvider& atr){
    std::vector<std::pair<core::PositionKey, StopType>> keys;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : stops_) keys.emplace_back(kv.first, kv.second.type());
    }
    std::vector<TriggeredStop> out;
    for (auto& [key, type] : keys){
        auto px = prices.find(key.symbol);
        if (px==prices.end()) continue;
        std::optional<double> a;
        if (type==StopType::AtrBased && atr) a = atr(key.symbol);
        const auto r = on_tick(key, px->second, a);
        if (r.triggered) out.push_back({key, px->second, r.stop});
    }
    return out;
}

bool StopLossEngine::cancel(const core::PositionKey& key){
    std::lock_guard<std::mutex> lk(mu_);
    return stops_.erase(key) > 0;
}

std::optional<TrailingStop> StopLossEngine::get(const core::PositionKey& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = stops_.find(key);
    if (it==stops_.end()) return std::nullopt;
    return it->second;
}

std::vector<TrailingStop> StopLossEngine::all() const {
    std::vector<TrailingStop> v;
    {
        std::lock_guard<std::mutex> lk(mu_);
        v.reserve(stops_.size());
        for (auto& kv : stops_) v.push_back(kv.second);
    }
    std::sort(v.begin(), v.end(), [](const TrailingStop& a, const TrailingStop& b){ return a.key() < b.key(); });
    return v;
}

std::vector<TrailingStop> StopLossEngine::active() const {
    auto v = all();
    v.erase(std::remove_if(v.begin(), v.end(), [](const TrailingStop& s){ return !s.active(); }), v.end());
    return v;
}

size_t StopLossEngine::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stops_.size();
}

} // namespace exec
