#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

namespace {

template <class T>
void read(const json& j, const char* key, T& out){
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

void read_tf(const json& j, const char* key, Timeframe& out){
    if (!j.contains(key)) return;
    const auto s = j[key].get<std::string>();
    auto tf = parse_timeframe(s);
    if (!tf) throw std::runtime_error(fmt::format("config: unknown timeframe '{}' for {}", s, key));
    out = *tf;
}

void read_range(const json& j, const char* key, Range& out){
    if (!j.contains(key)) return;
    const auto& a = j[key];
    if (a.is_number()){ out.lo = out.hi = a.get<double>(); return; }
    if (!a.is_array() || a.size()!=2) throw std::runtime_error(fmt::format("config: {} must be [lo, hi]", key));
    out.lo = a[0].get<double>();
    out.hi = a[1].get<double>();
    if (out.lo>out.hi) throw std::runtime_error(fmt::format("config: {} has lo > hi", key));
}

void read_symbols(const json& j, const char* key, std::vector<std::string>& out){
    if (!j.contains(key)) return;
    out.clear();
    for (auto& s : j[key]) out.push_back(normalize_symbol(s.get<std::string>()));
}

void apply_mode_overrides(const json& j, ModeConfig& m){
    read(j, "name", m.name);
    read_tf(j, "timeframe", m.timeframe);
    read(j, "indicators", m.indicators);
    read_range(j, "leverage_range", m.leverage_range);
    read_range(j, "tp_range", m.tp_range);
    read_range(j, "sl_range", m.sl_range);
    read(j, "min_confirmation", m.min_confirmation);
    read_symbols(j, "pairs", m.pairs);
    read(j, "loop_interval_sec", m.loop_interval_sec);
    read(j, "target_notional_usd", m.target_notional_usd);
    read(j, "notional_band", m.notional_band);
}

void validate(const BotConfig& c){
    const auto& m = c.mode;
    if (m.pairs.empty()) throw std::runtime_error("config: no trading pairs");
    if (m.min_confirmation<1) throw std::runtime_error("config: min_confirmation must be >= 1");
    if (m.leverage_range.lo<1.0) throw std::runtime_error("config: leverage must be >= 1");
    if (m.target_notional_usd<=0.0) throw std::runtime_error("config: target_notional_usd must be > 0");
    if (m.notional_band<=0.0 || m.notional_band>=1.0) throw std::runtime_error("config: notional_band must be in (0, 1)");
    if (m.tp_range.lo<=0.0 || m.sl_range.lo<=0.0) throw std::runtime_error("config: tp/sl ranges must be positive");
    if (m.loop_interval_sec<1) throw std::runtime_error("config: loop_interval_sec must be >= 1");
    if (c.stops.min_distance_pct>c.stops.max_distance_pct) throw std::runtime_error("config: stops min_distance_pct > max_distance_pct");
    if (c.sizing.max_attempts<1 || c.sizing.growth_factor<=1.0) throw std::runtime_error("config: retry needs max_attempts >= 1 and growth_factor > 1");
    if (c.reversal.enabled && c.reversal.drivers.empty()) throw std::runtime_error("config: reversal enabled without drivers");
}

} // namespace

BotConfig config_from_json(const json& j){
    BotConfig c;
    try {
        if (j.contains("api")){
            const auto& a = j["api"];
            read(a, "api_key", c.api.api_key);
            read(a, "api_secret", c.api.api_secret);
            read(a, "testnet", c.api.testnet);
            read(a, "demo", c.api.demo);
            read(a, "hedge_mode", c.api.hedge_mode);
            read(a, "timeout_ms", c.api.timeout_ms);
            read(a, "recv_window", c.api.recv_window);
        }
        if (j.contains("mode")){
            const auto s = j["mode"].get<std::string>();
            auto m = parse_mode(s);
            if (!m) throw std::runtime_error(fmt::format("config: unknown mode '{}'", s));
            c.mode = mode_preset(*m);
        }
        if (j.contains("mode_overrides")) apply_mode_overrides(j["mode_overrides"], c.mode);

        if (j.contains("sizing")){
            const auto& s = j["sizing"];
            read(s, "band_check", c.sizing.band_check);
            read(s, "margin_check", c.sizing.margin_check);
            read(s, "max_attempts", c.sizing.max_attempts);
            read(s, "growth_factor", c.sizing.growth_factor);
            read(s, "max_quantity", c.sizing.max_quantity);
        }
        if (j.contains("stops")){
            const auto& s = j["stops"];
            read(s, "enabled", c.stops.enabled);
            if (s.contains("type")){
                const auto t = s["type"].get<std::string>();
                auto st = exec::parse_stop_type(t);
                if (!st) throw std::runtime_error(fmt::format("config: unknown stop type '{}'", t));
                c.stops.type = *st;
            }
            read(s, "default_distance", c.stops.default_distance);
            read(s, "min_distance_pct", c.stops.min_distance_pct);
            read(s, "max_distance_pct", c.stops.max_distance_pct);
            read(s, "atr_multiplier", c.stops.atr_multiplier);
        }
        if (j.contains("risk")){
            read(j["risk"], "max_daily_trades", c.risk.max_daily_trades);
            read(j["risk"], "max_positions", c.risk.max_positions);
        }
        if (j.contains("reversal")){
            const auto& r = j["reversal"];
            read(r, "enabled", c.reversal.enabled);
            read_symbols(r, "drivers", c.reversal.drivers);
            read_tf(r, "timeframe", c.reversal.timeframe);
            read(r, "htf_confirm", c.reversal.htf_confirm);
            read_tf(r, "htf", c.reversal.htf);
            read(r, "all_instruments", c.reversal.all_instruments);
            read(r, "close_losing", c.reversal.close_losing);
            read(r, "interval_sec", c.reversal.interval_sec);
            read(r, "candles", c.reversal.candles);
            read(r, "min_bars", c.reversal.min_bars);
            read(r, "sr_proximity_pct", c.reversal.sr_proximity_pct);
            read(r, "use_rsi", c.reversal.use_rsi);
            read(r, "use_macd", c.reversal.use_macd);
            read(r, "use_bollinger", c.reversal.use_bollinger);
            read(r, "use_levels", c.reversal.use_levels);
            read(r, "use_pattern", c.reversal.use_pattern);
        }
        if (j.contains("aggregator")){
            const auto& a = j["aggregator"];
            read(a, "confirming_indicator", c.aggregator.confirming_indicator);
            read(a, "base_threshold", c.aggregator.base_threshold);
            read(a, "net_margin", c.aggregator.net_margin);
            read(a, "trend_veto_strength", c.aggregator.trend_veto_strength);
        }
        if (j.contains("log")){
            read(j["log"], "level", c.log.level);
            read(j["log"], "file", c.log.file);
        }
        read(j, "close_positions_on_shutdown", c.close_positions_on_shutdown);
        read(j, "use_enhanced_signals", c.use_enhanced_signals);
        read(j, "candle_limit", c.candle_limit);
    } catch (const json::exception& e){
        throw std::runtime_error(fmt::format("config: {}", e.what()));
    }
    validate(c);
    return c;
}

BotConfig load_config(const std::string& path){
    std::ifstream in(path);
    if (!in) throw std::runtime_error("config: cannot open " + path);
    json j;
    try { j = json::parse(in); }
    catch (const json::parse_error& e){
        throw std::runtime_error(fmt::format("config: {} is not valid JSON: {}", path, e.what()));
    }
    BotConfig c = config_from_json(j);
    if (const char* k = std::getenv("FUTBOT_API_KEY")) c.api.api_key = k;
    if (const char* s = std::getenv("FUTBOT_API_SECRET")) c.api.api_secret = s;
    if (c.api.api_key.empty() || c.api.api_secret.empty())
        spdlog::warn("config: API credentials missing, signed requests will fail");
    return c;
}

} // namespace core
