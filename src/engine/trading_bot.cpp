#include "engine/trading_bot.hpp"
#include <exception>
#include <map>
#include <spdlog/spdlog.h>
#include "indicators/atr.hpp"
#include "indicators/engine.hpp"

namespace engine {

TradingBot::TradingBot(core::BotConfig cfg, exec::ExchangeGateway& gw, BroadcastSink sink)
    : cfg_(std::move(cfg)), gw_(gw), sink_(std::move(sink)),
      stops_(cfg_.stops),
      executor_(gw_, ledger_, stops_, cfg_.mode, cfg_.sizing),
      aggregator_(cfg_.aggregator),
      risk_(cfg_.risk),
      watcher_(gw_, cfg_.reversal,
               [this](const exec::Position& p){ return executor_.close_position(p).success; },
               [this](const std::string& symbol, core::Side dir){
                   BroadcastEvent ev;
                   ev.kind = BroadcastEvent::Kind::Reversal;
                   ev.symbol = symbol;
                   ev.direction = dir;
                   publish(ev);
               })
{}

TradingBot::~TradingBot(){
    stop();
}

void TradingBot::publish(const BroadcastEvent& ev) const {
    if (!sink_) return;
    try { sink_(ev); }
    catch (const std::exception& e){ spdlog::warn("broadcast {} failed: {}", ev.symbol, e.what()); }
}

bool TradingBot::start(){
    if (running_.load()) return true;
    try {
        const auto rep = executor_.sync();
        spdlog::info("start: {} open positions ({} new)", ledger_.size(), rep.added.size());
    } catch (const exec::ExchangeError& e){
        spdlog::error("start: initial reconcile failed: {}", e.what());
        return false;
    }
    rebuild_stops();

    running_.store(true);
    spdlog::info("start: mode {} tf {} pairs {} leverage x{}", cfg_.mode.name, core::to_label(cfg_.mode.timeframe),
                 cfg_.mode.pairs.size(), cfg_.mode.leverage());
    trading_thread_ = std::thread(&TradingBot::trading_loop, this);
    if (cfg_.reversal.enabled) reversal_thread_ = std::thread(&TradingBot::reversal_loop, this);
    return true;
}

void TradingBot::stop(){
    {
        std::lock_guard<std::mutex> lk(mu_);
        running_.store(false);
    }
    cv_.notify_all();
    if (trading_thread_.joinable()) trading_thread_.join();
    if (reversal_thread_.joinable()) reversal_thread_.join();
}

void TradingBot::shutdown(){
    stop();
    if (!cfg_.close_positions_on_shutdown) return;
    spdlog::info("shutdown: closing all positions");
    executor_.close_all();
}

bool TradingBot::sleep_for(std::chrono::seconds d){
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [this]{ return !running_.load(); });
    return running_.load();
}

void TradingBot::trading_loop(){
    const std::chrono::seconds interval(cfg_.mode.loop_interval_sec);
    do {
        try {
            run_cycle();
        } catch (const std::exception& e){
            spdlog::error("trading cycle aborted: {}", e.what());
        }
    } while (sleep_for(interval));
    spdlog::info("trading loop stopped");
}

void TradingBot::reversal_loop(){
    const std::chrono::seconds interval(cfg_.reversal.interval_sec);
    while (sleep_for(interval)){
        try {
            check_reversals();
        } catch (const std::exception& e){
            spdlog::error("reversal pass aborted: {}", e.what());
        }
    }
    spdlog::info("reversal loop stopped");
}

void TradingBot::run_cycle(){
    for (auto& symbol : cfg_.mode.pairs){
        try {
            process_symbol(symbol);
        } catch (const exec::ExchangeError& e){
            spdlog::warn("{}: skipped this cycle: {}", symbol, e.what());
        } catch (const std::exception& e){
            spdlog::error("{}: skipped this cycle, unexpected error: {}", symbol, e.what());
        }
    }
    sweep_stops();
}

std::optional<core::Side> TradingBot::process_symbol(const std::string& symbol){
    const auto c = gw_.get_candles(symbol, cfg_.mode.timeframe, cfg_.candle_limit);
    if (c.empty()){
        spdlog::warn("{}: no candles", symbol);
        return std::nullopt;
    }

    const auto readings = aggregator_.readings(c);
    const auto consensus = strategy::SignalAggregator::tally(readings, cfg_.mode.min_confirmation,
                                                             cfg_.aggregator.confirming_indicator);
    BroadcastEvent ev;
    ev.symbol = symbol;
    ev.text = strategy::format_signal_log(symbol, readings, consensus);
    publish(ev);
    spdlog::debug("{}", ev.text);

    const auto analysis = classifier_.classify(symbol, cfg_.mode.timeframe, c);
    std::optional<core::Side> decision = consensus.decision;
    if (cfg_.use_enhanced_signals){
        const auto ws = aggregator_.weigh(readings, *analysis);
        spdlog::debug("{}: weighted {} net {:.3f} strength {:.3f} conf {} ({})", symbol, strategy::to_string(ws.action),
                      ws.net_score, ws.strength, strategy::to_string(ws.confidence), ws.reason);
        decision.reset();
        if (strategy::should_trade(ws)) decision = strategy::to_side(ws.action);
    }
    if (!decision) return std::nullopt;

    const auto blocked = risk_.check(ledger_.size());
    if (!blocked.empty()){
        spdlog::info("{}: {} signal skipped, {}", symbol, core::to_string(*decision), blocked);
        return std::nullopt;
    }

    std::optional<double> atr;
    if (const auto* r = ind::find_reading(readings, "ATR")) atr = r->value;

    const auto res = executor_.open_position(symbol, *decision, analysis.get(), atr);
    if (!res.success) return std::nullopt;
    risk_.record_trade();
    return decision;
}

std::optional<double> TradingBot::atr_for(const std::string& symbol){
    try {
        const auto c = gw_.get_candles(symbol, cfg_.mode.timeframe, 50);
        const double atr = ind::compute_atr(c);
        if (ind::is_num(atr) && atr>0.0) return atr;
    } catch (const exec::ExchangeError& e){
        spdlog::warn("{}: ATR candles unavailable: {}", symbol, e.what());
    }
    return std::nullopt;
}

void TradingBot::rebuild_stops(){
    if (!cfg_.stops.enabled) return;
    int created = 0;
    for (auto& p : ledger_.snapshot()){
        std::optional<double> atr;
        if (cfg_.stops.type==exec::StopType::AtrBased) atr = atr_for(p.symbol);
        if (stops_.ensure(p.symbol, p.side, p.entry_price, std::nullopt, atr)) ++created;
    }
    if (created>0) spdlog::info("stops: rebuilt {} from open positions", created);
}

std::vector<exec::TriggeredStop> TradingBot::sweep_stops(){
    if (!cfg_.stops.enabled) return {};
    try {
        executor_.sync();
    } catch (const exec::ExchangeError& e){
        spdlog::warn("stop sweep: reconcile failed: {}", e.what());
        return {};
    }
    for (auto& s : stops_.all()){
        if (!ledger_.has(s.key())) stops_.cancel(s.key());
    }
    rebuild_stops();

    std::map<std::string, double> prices;
    for (auto& p : ledger_.snapshot()){
        if (prices.count(p.symbol)) continue;
        try {
            prices[p.symbol] = gw_.get_current_price(p.symbol);
        } catch (const exec::ExchangeError& e){
            spdlog::warn("stop sweep {}: price unavailable: {}", p.symbol, e.what());
        }
    }

    auto triggered = stops_.on_prices(prices, [this](const std::string& s){ return atr_for(s); });
    for (auto& t : triggered){
        const auto p = ledger_.get(t.key);
        if (!p) continue;
        spdlog::warn("stop hit {} @ {} (stop {})", core::to_string(t.key), t.price, t.stop);
        // a failed close leaves the stop pending; the next sweep retries
        if (!executor_.close_position(*p).success)
            spdlog::error("stop {}: close failed, retrying next sweep", core::to_string(t.key));
    }
    for (auto& s : stops_.active()){
        spdlog::debug("stop {} {} at {:.6f} best {} profit {:.2f}%", core::to_string(s.key()), exec::to_string(s.type()),
                      s.current_stop(), s.best_price(), s.profit_pct()*100.0);
    }
    return triggered;
}

} // namespace engine
