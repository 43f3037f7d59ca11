#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "exec/exchange_gateway.hpp"

namespace strategy {

struct ReversalConfig {
    bool enabled{true};
    std::vector<std::string> drivers{"BTCUSDT"};
    core::Timeframe timeframe{core::Timeframe::M1};
    bool htf_confirm{false};
    core::Timeframe htf{core::Timeframe::M15};
    bool all_instruments{true};     // false: only positions on the driver's own symbol
    bool close_losing{false};
    int interval_sec{60};
    int candles{100};
    size_t min_bars{50};
    double sr_proximity_pct{0.5};
    bool use_rsi{true};
    bool use_macd{true};
    bool use_bollinger{true};
    bool use_levels{true};
    bool use_pattern{true};
};

enum class Pattern { None, BullishEngulfing, Hammer, BearishEngulfing, ShootingStar };

const char* to_string(Pattern p);

// Last-bar candlestick pattern (engulfing looks at the last two bars)
Pattern detect_pattern(const core::Candles& c);

// Per-signal directions; nullopt = no opinion or disabled
struct ReversalVotes {
    std::optional<core::Side> rsi;
    std::optional<core::Side> macd;
    std::optional<core::Side> bollinger;
    std::optional<core::Side> levels;
    std::optional<core::Side> pattern;

    int count(core::Side s) const;
};

// Reversal iff at least 2 votes agree; the side with more votes wins, long on a tie
std::optional<core::Side> decide_reversal(const ReversalVotes& v);

class ReversalDetector {
public:
    explicit ReversalDetector(ReversalConfig cfg={}) : cfg_(std::move(cfg)) {}

    ReversalVotes votes(const core::Candles& c) const;
    std::optional<core::Side> detect(const core::Candles& c) const { return decide_reversal(votes(c)); }

private:
    ReversalConfig cfg_;
};

// Returns true when the position was closed
using PositionCloser = std::function<bool(const exec::Position&)>;
using ReversalSink = std::function<void(const std::string& symbol, core::Side direction)>;

struct ReversalOutcome {
    std::string symbol;
    core::Side direction{core::Side::Long};
    int closed{0};
};

// Watches driver symbols and closes opposite-side positions on a reversal
class ReversalWatcher {
public:
    ReversalWatcher(exec::ExchangeGateway& gw, ReversalConfig cfg, PositionCloser closer, ReversalSink sink={});

    // One pass over all drivers
    std::vector<ReversalOutcome> check_once();

    std::optional<core::Side> last_direction(const std::string& symbol) const;
    const ReversalConfig& config() const { return cfg_; }

private:
    std::optional<core::Side> detect_for(const std::string& symbol);
    bool in_scope(const exec::Position& p, const std::string& driver) const;

    exec::ExchangeGateway& gw_;
    ReversalConfig cfg_;
    ReversalDetector detector_;
    PositionCloser closer_;
    ReversalSink sink_;
    mutable std::mutex mu_;
    std::map<std::string, core::Side> last_;
};

} // namespace strategy
