#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <fmt/format.h>

#include "core/types.hpp"
#include "core/module.hpp"
#include "indicators/engine.hpp"
#include "strategy/market_regime.hpp"
#include "strategy/reversal_watcher.hpp"
#include "strategy/signal_aggregator.hpp"

// time,open,high,low,close,volume with a header line
static bool load_csv(const std::string& path, core::Candles& out){
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    std::getline(f, line);
    while (std::getline(f, line)){
        if (line.empty()) continue;
        std::stringstream ss(line);
        std::string x; core::Bar b{};
        try {
            if (!std::getline(ss,x,',')) continue; b.open_time_ms = std::stoll(x);
            if (!std::getline(ss,x,',')) continue; b.open = std::stod(x);
            if (!std::getline(ss,x,',')) continue; b.high = std::stod(x);
            if (!std::getline(ss,x,',')) continue; b.low = std::stod(x);
            if (!std::getline(ss,x,',')) continue; b.close = std::stod(x);
            if (!std::getline(ss,x,',')) continue; b.volume = std::stod(x);
        } catch (const std::logic_error&){
            fmt::print(stderr, "skipping bad row: {}\n", line);
            continue;
        }
        out.push_back(b);
    }
    return !out.empty();
}

static std::string fmt_value(const core::IndicatorReading& r){
    return r.value ? fmt::format("{:.6f}", *r.value) : std::string("n/a");
}

static std::string fmt_side(const std::optional<core::Side>& s){
    return s ? core::to_string(*s) : "-";
}

int main(int argc, char** argv){
    if (argc<2){
        fmt::print("usage: futbot_report <csv_path> [min_confirmation] [symbol]\n");
        return 1;
    }
    const std::string path = argv[1];
    const int min_conf = argc>=3 ? std::max(1, std::atoi(argv[2])) : 6;
    const std::string symbol = argc>=4 ? core::normalize_symbol(argv[3]) : "CSV";

    core::Candles c;
    if (!load_csv(path, c)){
        fmt::print(stderr, "cannot load candles from {}\n", path);
        return 2;
    }
    fmt::print("{}: {} bars, last close {}\n\n", symbol, c.size(), c.back().close);

    strategy::SignalAggregator agg;
    const auto readings = agg.readings(c);
    fmt::print("{:<14} {:>18}  {}\n", "indicator", "value", "vote");
    for (auto& r : readings) fmt::print("{:<14} {:>18}  {}\n", r.name, fmt_value(r), core::to_string(r.vote));

    const auto consensus = strategy::SignalAggregator::tally(readings, min_conf, agg.config().confirming_indicator);
    fmt::print("\n{}\n", strategy::format_signal_log(symbol, readings, consensus));
    fmt::print("consensus (min {}): {}\n", min_conf, consensus.decision ? core::to_string(*consensus.decision) : "hold");

    const auto a = strategy::MarketRegimeClassifier::analyze(c);
    fmt::print("\nregime {} | trend {} {} ({:+.3f} %) | volatility {} ({:.2f} %) | volume {} (x{:.2f})\n",
               strategy::to_string(a.regime), strategy::to_string(a.trend.direction), strategy::to_string(a.trend.strength),
               a.trend.angle_pct, strategy::to_string(a.volatility.level), a.volatility.pct,
               strategy::volume_label(a.volume.level), a.volume.ratio20);
    fmt::print("support {:.4f} ({:.2f} %) | resistance {:.4f} ({:.2f} %)\n",
               a.levels.nearest_support, a.levels.support_distance_pct,
               a.levels.nearest_resistance, a.levels.resistance_distance_pct);
    fmt::print("trend strength {:.1f} | market score {:.1f} | {} / risk {} / size x{:.2f}\n",
               a.trend_strength, a.market_score, a.recommendation.strategy, a.recommendation.risk_level,
               a.recommendation.size_multiplier);

    const auto ws = agg.weigh(readings, a);
    fmt::print("weighted: {} net {:+.3f} strength {:.3f} confidence {} trade {}\n",
               strategy::to_string(ws.action), ws.net_score, ws.strength, strategy::to_string(ws.confidence),
               strategy::should_trade(ws) ? "yes" : "no");

    const strategy::ReversalDetector det;
    const auto v = det.votes(c);
    fmt::print("\nreversal votes: rsi {} macd {} bb {} levels {} pattern {} ({})\n",
               fmt_side(v.rsi), fmt_side(v.macd), fmt_side(v.bollinger), fmt_side(v.levels), fmt_side(v.pattern),
               strategy::to_string(strategy::detect_pattern(c)));
    fmt::print("reversal: {}\n", fmt_side(strategy::decide_reversal(v)));
    return 0;
}
