#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/logging.hpp"
#include "core/mode.hpp"
#include "exec/bybit_rest.hpp"
#include "exec/order_executor.hpp"
#include "exec/risk.hpp"
#include "exec/stop_loss.hpp"
#include "strategy/reversal_watcher.hpp"
#include "strategy/signal_aggregator.hpp"

namespace core {

struct BotConfig {
    exec::ApiConfig api;
    ModeConfig mode{mode_preset(TradingMode::Conservative)};
    exec::SizingConfig sizing;
    exec::StopConfig stops;
    exec::RiskLimits risk;
    strategy::ReversalConfig reversal;
    strategy::AggregatorConfig aggregator;
    LogConfig log;
    bool close_positions_on_shutdown{false};
    bool use_enhanced_signals{false};
    int candle_limit{200};
};

// Builds a config from parsed JSON. Missing fields keep their defaults. Throws std::runtime_error on bad values.
BotConfig config_from_json(const nlohmann::json& j);

// Reads the file, then applies FUTBOT_API_KEY / FUTBOT_API_SECRET from the environment
BotConfig load_config(const std::string& path);

} // namespace core
