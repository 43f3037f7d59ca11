#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/config.hpp"
#include "exec/exchange_gateway.hpp"
#include "exec/order_executor.hpp"
#include "exec/position_ledger.hpp"
#include "exec/risk.hpp"
#include "exec/stop_loss.hpp"
#include "strategy/market_regime.hpp"
#include "strategy/reversal_watcher.hpp"
#include "strategy/signal_aggregator.hpp"

namespace engine {

struct BroadcastEvent {
    enum class Kind { Reversal, Signal };

    Kind kind{Kind::Signal};
    std::string symbol;
    std::optional<core::Side> direction;   // set for reversals
    std::string text;                      // signal summary line
};

using BroadcastSink = std::function<void(const BroadcastEvent&)>;

// Trading loop (signals -> orders -> stop sweep) and reversal loop on two threads
class TradingBot {
public:
    TradingBot(core::BotConfig cfg, exec::ExchangeGateway& gw, BroadcastSink sink={});
    ~TradingBot();

    TradingBot(const TradingBot&) = delete;
    TradingBot& operator=(const TradingBot&) = delete;

    // Initial reconcile, stop rebuild, then the worker threads. false when the exchange is unreachable.
    bool start();
    // Wakes and joins the workers
    void stop();
    // stop() plus close_all() when close_positions_on_shutdown is set
    void shutdown();
    bool running() const { return running_.load(); }

    // One pass of the trading loop over every pair, then the stop sweep
    void run_cycle();

    // Signal -> risk gate -> open. Returns the side opened. Throws ExchangeError on a failed candle fetch.
    std::optional<core::Side> process_symbol(const std::string& symbol);

    // Updates every stop with current prices and closes triggered positions
    std::vector<exec::TriggeredStop> sweep_stops();

    std::vector<strategy::ReversalOutcome> check_reversals() { return watcher_.check_once(); }

    const core::BotConfig& config() const { return cfg_; }
    exec::PositionLedger& ledger() { return ledger_; }
    exec::StopLossEngine& stops() { return stops_; }
    exec::OrderExecutor& executor() { return executor_; }
    exec::RiskGate& risk() { return risk_; }

private:
    void trading_loop();
    void reversal_loop();
    // false when woken by stop()
    bool sleep_for(std::chrono::seconds d);
    void publish(const BroadcastEvent& ev) const;
    void rebuild_stops();
    std::optional<double> atr_for(const std::string& symbol);

    core::BotConfig cfg_;
    exec::ExchangeGateway& gw_;
    BroadcastSink sink_;

    exec::PositionLedger ledger_;
    exec::StopLossEngine stops_;
    exec::OrderExecutor executor_;
    strategy::SignalAggregator aggregator_;
    strategy::MarketRegimeClassifier classifier_;
    exec::RiskGate risk_;
    strategy::ReversalWatcher watcher_;

    std::atomic<bool> running_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    std::thread trading_thread_;
    std::thread reversal_thread_;
};

} // namespace engine
