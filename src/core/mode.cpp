#include "core/mode.hpp"
#include <cctype>

namespace core {

const char* to_string(TradingMode m){
    switch (m){
        case TradingMode::Aggressive: return "aggressive";
        case TradingMode::Medium:     return "medium";
        default:                      return "conservative";
    }
}

std::optional<TradingMode> parse_mode(const std::string& s){
    std::string l(s);
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    if (l=="aggressive") return TradingMode::Aggressive;
    if (l=="medium" || l=="moderate") return TradingMode::Medium;
    if (l=="conservative") return TradingMode::Conservative;
    return std::nullopt;
}

ModeConfig mode_preset(TradingMode m){
    ModeConfig c;
    c.mode = m;
    c.pairs = {"BTCUSDT", "ETHUSDT", "SOLUSDT", "DOGEUSDT", "XRPUSDT"};
    switch (m){
        case TradingMode::Aggressive:
            c.name = "Aggressive";
            c.timeframe = Timeframe::M5;
            c.indicators = {"RSI", "MACD", "EMA", "STOCH", "WILLIAMS", "CMF"};
            c.leverage_range = {15.0, 25.0};
            c.tp_range = {3.0, 3.0};
            c.sl_range = {2.0, 2.0};
            c.min_confirmation = 3;
            c.loop_interval_sec = 15;
            break;
        case TradingMode::Medium:
            c.name = "Medium";
            c.timeframe = Timeframe::M5;
            c.indicators = {"RSI", "MACD", "SMA", "EMA", "BB", "ADX", "CMF"};
            c.leverage_range = {10.0, 20.0};
            c.tp_range = {2.5, 2.5};
            c.sl_range = {1.5, 1.5};
            c.min_confirmation = 4;
            c.loop_interval_sec = 30;
            break;
        case TradingMode::Conservative:
            c.name = "Conservative";
            c.timeframe = Timeframe::M15;
            c.indicators = {"SMA", "RSI", "BB", "STOCH", "OBV", "CMF"};
            c.leverage_range = {10.0, 20.0};
            c.tp_range = {4.0, 4.0};
            c.sl_range = {3.0, 3.0};
            c.min_confirmation = 6;
            c.loop_interval_sec = 30;
            break;
    }
    return c;
}

Brackets compute_brackets(const ModeConfig& m, Side side, double entry){
    const double tp = m.tp_range.mid()/100.0, sl = m.sl_range.mid()/100.0;
    if (side==Side::Long) return {entry*(1.0+tp), entry*(1.0-sl)};
    return {entry*(1.0-tp), entry*(1.0+sl)};
}

bool brackets_valid(const Brackets& b, Side side, double entry){
    if (side==Side::Long) return b.take_profit>entry && b.stop_loss<entry && b.stop_loss>0.0;
    return b.take_profit<entry && b.take_profit>0.0 && b.stop_loss>entry;
}

} // namespace core
