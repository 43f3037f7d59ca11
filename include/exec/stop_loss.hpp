#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"
#include "strategy/market_regime.hpp"

namespace exec {

enum class StopType { Trailing, AtrBased, Percentage };

const char* to_string(StopType t);
std::optional<StopType> parse_stop_type(const std::string& s);

struct StopConfig {
    bool enabled{true};
    StopType type{StopType::Percentage};
    double default_distance{0.02};   // fraction of price
    double min_distance_pct{0.005};
    double max_distance_pct{0.05};
    double atr_multiplier{2.0};
};

// One trailing stop. Long stops only rise, short stops only fall.
class TrailingStop {
public:
    TrailingStop(core::PositionKey key, double entry, StopType type, double distance,
                 std::optional<double> atr, const StopConfig& cfg);

    // Moves only on a new best favorable price; true when the stop moved
    bool update(double price, std::optional<double> atr=std::nullopt);
    bool should_trigger(double price) const;

    // Best-price PnL as a fraction of entry
    double profit_pct() const;

    const core::PositionKey& key() const { return key_; }
    core::Side side() const { return key_.side; }
    double entry() const { return entry_; }
    double initial_stop() const { return initial_stop_; }
    double current_stop() const { return stop_; }
    double best_price() const { return best_; }
    double distance() const { return distance_; }
    StopType type() const { return type_; }
    bool active() const { return active_; }
    std::int64_t created_ms() const { return created_ms_; }

    void deactivate() { active_ = false; }

private:
    // Offset in price units at a given price, clamped to [min, max] * price
    double offset(double price) const;

    core::PositionKey key_;
    double entry_;
    StopType type_;
    double distance_;
    std::optional<double> atr_;
    double min_pct_, max_pct_, fallback_pct_;
    double initial_stop_{0.0};
    double stop_{0.0};
    double best_{0.0};
    bool active_{true};
    std::int64_t created_ms_{0};
};

struct TickResult {
    bool found{false};
    bool moved{false};
    bool triggered{false};
    double stop{0.0};
};

struct TriggeredStop {
    core::PositionKey key;
    double price{0.0};
    double stop{0.0};
};

using AtrProvider = std::function<std::optional<double>(const std::string& symbol)>;

class StopLossEngine {
public:
    explicit StopLossEngine(StopConfig cfg={}) : cfg_(cfg) {}

    // Distance for a stop type; percentage/trailing widen with volatility, ATR scales by regime
    double select_distance(StopType type, double entry, const strategy::MarketAnalysis* analysis=nullptr) const;

    // Replaces any existing stop for (symbol, side)
    TrailingStop create(const std::string& symbol, core::Side side, double entry,
                        std::optional<StopType> type=std::nullopt,
                        std::optional<double> distance=std::nullopt,
                        std::optional<double> atr=std::nullopt,
                        const strategy::MarketAnalysis* analysis=nullptr);

    // Creates a stop only when none exists; true when one was created
    bool ensure(const std::string& symbol, core::Side side, double entry,
                std::optional<StopType> type=std::nullopt,
                std::optional<double> atr=std::nullopt,
                const strategy::MarketAnalysis* analysis=nullptr);

    // Update then trigger check. A triggered stop is deactivated and kept, pending close:
    // later ticks report it triggered again until cancel() removes it.
    TickResult on_tick(const core::PositionKey& key, double price, std::optional<double> atr=std::nullopt);

    // Sweeps every stop whose symbol has a price; atr is only asked for ATR-based stops
    std::vector<TriggeredStop> on_prices(const std::map<std::string, double>& prices, const AtrProvider& atr={});

    bool cancel(const core::PositionKey& key);
    std::optional<TrailingStop> get(const core::PositionKey& key) const;
    // Armed stops only, sorted by key
    std::vector<TrailingStop> active() const;
    // Armed and pending-close stops, sorted by key
    std::vector<TrailingStop> all() const;
    size_t size() const;

    const StopConfig& config() const { return cfg_; }

private:
    StopConfig cfg_;
    mutable std::mutex mu_;
    std::unordered_map<core::PositionKey, TrailingStop> stops_;
};

} // namespace exec
