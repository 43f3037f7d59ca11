#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>

namespace core {

// Candle interval
enum class Timeframe { M1, M3, M5, M15, M30, H1, H4, D1 };

// Bybit v5 kline interval token ("1", "5", "60", "D", ...)
const char* to_interval(Timeframe tf);
// "5m", "15m", "1h" ...
const char* to_label(Timeframe tf);
// accepts both "15m" and "15" style tokens
std::optional<Timeframe> parse_timeframe(const std::string& s);

// OHLCV bar
struct Bar {
    std::int64_t open_time_ms{}; // kline open time (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

// ascending by open_time_ms
using Candles = std::vector<Bar>;

// Position direction. Long and short on the same symbol are separate positions.
enum class Side { Long, Short };

inline Side opposite(Side s) { return s == Side::Long ? Side::Short : Side::Long; }

inline const char* to_string(Side s) { return s == Side::Long ? "long" : "short"; }

// Order direction on the exchange
enum class OrderSide { Buy, Sell };

inline const char* to_string(OrderSide s) { return s == OrderSide::Buy ? "Buy" : "Sell"; }

inline OrderSide entry_side(Side s) { return s == Side::Long ? OrderSide::Buy : OrderSide::Sell; }
inline OrderSide exit_side(Side s)  { return s == Side::Long ? OrderSide::Sell : OrderSide::Buy; }

// Per-indicator categorical vote. None = magnitude-only indicator (never votes).
enum class Vote { Buy, Sell, Hold, None };

inline const char* to_string(Vote v) {
    switch (v) {
        case Vote::Buy:  return "BUY";
        case Vote::Sell: return "SELL";
        case Vote::None: return "NONE";
        default:         return "HOLD";
    }
}

// Composite (symbol, side) key for positions and stops
struct PositionKey {
    std::string symbol;
    Side side{Side::Long};

    bool operator==(const PositionKey& o) const { return side == o.side && symbol == o.symbol; }
    bool operator!=(const PositionKey& o) const { return !(*this == o); }
    bool operator<(const PositionKey& o) const {
        return symbol != o.symbol ? symbol < o.symbol : side < o.side;
    }
};

std::string to_string(const PositionKey& k);

// "BTC/USDT" -> "BTCUSDT"
std::string normalize_symbol(std::string s);

} // namespace core

namespace std {
template <>
struct hash<core::PositionKey> {
    std::size_t operator()(const core::PositionKey& k) const noexcept {
        const std::size_t h = std::hash<std::string>{}(k.symbol);
        return h ^ (static_cast<std::size_t>(k.side) + 0x9e3779b9u + (h << 6) + (h >> 2));
    }
};
} // namespace std
