#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace strategy {

enum class Regime { TrendingUp, TrendingDown, Sideways, HighVolatility, LowVolatility, Breakout, Consolidation };
enum class TrendDirection { Up, Down, Sideways };
enum class TrendStrength { Strong, Medium, Weak, None };
enum class Level { VeryLow, Low, Medium, High, VeryHigh };

const char* to_string(Regime r);
const char* to_string(TrendDirection d);
const char* to_string(TrendStrength s);
const char* to_string(Level l);
// Volume buckets read "normal" where volatility reads "medium"
const char* volume_label(Level l);

struct TrendInfo {
    TrendDirection direction{TrendDirection::Sideways};
    TrendStrength strength{TrendStrength::None};
    double angle_pct{0.0};
    double sma20{0.0}, sma50{0.0}, sma100{0.0};
    double price{0.0};
};

struct VolatilityInfo {
    Level level{Level::Medium};
    double atr{0.0};
    double pct{0.0};
    bool is_high{false};
    bool is_increasing{false};
};

struct VolumeInfo {
    Level level{Level::Medium};
    double ratio20{1.0};
    double ratio50{1.0};
    bool is_high{false};
    bool is_increasing{false};
};

struct SupportResistance {
    double nearest_support{0.0};
    double nearest_resistance{0.0};
    double support_distance_pct{5.0};
    double resistance_distance_pct{5.0};
    std::vector<double> supports;
    std::vector<double> resistances;
};

struct Recommendation {
    std::string strategy{"neutral"};
    std::string risk_level{"medium"};
    double size_multiplier{1.0};
};

struct MarketAnalysis {
    Regime regime{Regime::Sideways};
    TrendInfo trend;
    VolatilityInfo volatility;
    VolumeInfo volume;
    SupportResistance levels;
    double trend_strength{50.0};
    double market_score{50.0};
    Recommendation recommendation;
    bool neutral{true};
};

// Building blocks of analyze(), exposed for the reversal detector and tests
TrendInfo analyze_trend(const core::Candles& c);
VolatilityInfo analyze_volatility(const core::Candles& c);
VolumeInfo analyze_volume(const core::Candles& c);
// Rolling 10-bar highs above / lows below the last close; +/-5 % when none
SupportResistance support_resistance(const core::Candles& c, size_t window=10);
// ADX-like 0..100 from close-to-close moves; 50 when undetermined
double trend_strength(const core::Candles& c);
Regime determine_regime(const TrendInfo& t, const VolatilityInfo& v);
double market_score(const TrendInfo& t, const VolatilityInfo& v, const VolumeInfo& vol);
Recommendation recommend(Regime r, const VolatilityInfo& v);

MarketAnalysis neutral_analysis(double price=0.0);

class MarketRegimeClassifier {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static constexpr size_t kMinCandles = 50;

    explicit MarketRegimeClassifier(std::chrono::seconds ttl=std::chrono::seconds(60), Clock clock={});

    // Pure analysis. Fewer than kMinCandles bars gives the neutral analysis.
    static MarketAnalysis analyze(const core::Candles& c);

    // Cached per (symbol, timeframe). A hit within the TTL returns the same object.
    std::shared_ptr<const MarketAnalysis> classify(const std::string& symbol, core::Timeframe tf, const core::Candles& c);

    void clear();
    size_t cached() const;

private:
    struct Entry { std::shared_ptr<const MarketAnalysis> analysis; TimePoint at; };

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mu_;
    std::map<std::pair<std::string, core::Timeframe>, Entry> cache_;
};

} // namespace strategy
