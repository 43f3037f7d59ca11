#include "core/types.hpp"
#include <cctype>

namespace core {

const char* to_interval(Timeframe tf){
    switch(tf){
        case Timeframe::M1: return "1";   case Timeframe::M3: return "3";   case Timeframe::M5: return "5";
        case Timeframe::M15: return "15"; case Timeframe::M30: return "30"; case Timeframe::H1: return "60";
        case Timeframe::H4: return "240"; case Timeframe::D1: return "D";   default: return "5";
    }
}

const char* to_label(Timeframe tf){
    switch(tf){
        case Timeframe::M1: return "1m";   case Timeframe::M3: return "3m";   case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m"; case Timeframe::M30: return "30m"; case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";   case Timeframe::D1: return "1d";   default: return "5m";
    }
}

std::optional<Timeframe> parse_timeframe(const std::string& s){
    static const Timeframe all[8] = {Timeframe::M1,Timeframe::M3,Timeframe::M5,Timeframe::M15,
                                     Timeframe::M30,Timeframe::H1,Timeframe::H4,Timeframe::D1};
    for (auto tf : all){
        if (s == to_label(tf) || s == to_interval(tf)) return tf;
    }
    if (s == "1d" || s == "D" || s == "1D") return Timeframe::D1;
    return std::nullopt;
}

std::string to_string(const PositionKey& k){
    return k.symbol + "/" + to_string(k.side);
}

std::string normalize_symbol(std::string s){
    s.erase(std::remove_if(s.begin(), s.end(), [](char c){ return c=='/' || c=='-' || c==' '; }), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace core
