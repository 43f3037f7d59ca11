#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace core {

enum class TradingMode { Aggressive, Medium, Conservative };

const char* to_string(TradingMode m);
// "moderate" is accepted as medium
std::optional<TradingMode> parse_mode(const std::string& s);

struct Range {
    double lo{0.0};
    double hi{0.0};
    double mid() const { return 0.5*(lo+hi); }
};

// Resolved per-mode trading parameters. Percent ranges are in percent (2.0 == 2 %).
struct ModeConfig {
    TradingMode mode{TradingMode::Conservative};
    std::string name;
    Timeframe timeframe{Timeframe::M15};
    std::vector<std::string> indicators;
    Range leverage_range{10.0, 20.0};
    Range tp_range{4.0, 4.0};
    Range sl_range{3.0, 3.0};
    int min_confirmation{6};
    std::vector<std::string> pairs;
    int loop_interval_sec{30};
    double target_notional_usd{100.0};
    double notional_band{0.2};

    // The low end of the range is used for orders
    int leverage() const { return static_cast<int>(leverage_range.lo); }
};

ModeConfig mode_preset(TradingMode m);

// TP/SL prices from the mode's midpoint percentages
struct Brackets { double take_profit; double stop_loss; };
Brackets compute_brackets(const ModeConfig& m, Side side, double entry);

// TP above and SL below entry for longs, mirrored for shorts
bool brackets_valid(const Brackets& b, Side side, double entry);

} // namespace core
