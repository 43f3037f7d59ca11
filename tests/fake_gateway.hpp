#pragma once
#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "exec/exchange_gateway.hpp"

namespace fake {

// Bars around each close: high/low +/- spread, open at the previous close
inline core::Candles candles_from_closes(const std::vector<double>& closes, double spread=0.5, double volume=1000.0){
    core::Candles c;
    c.reserve(closes.size());
    for (size_t i=0;i<closes.size();++i){
        core::Bar b;
        b.open_time_ms = static_cast<std::int64_t>(i)*60000;
        b.open = i ? closes[i-1] : closes[i];
        b.close = closes[i];
        b.high = std::max(b.open, b.close) + spread;
        b.low = std::min(b.open, b.close) - spread;
        b.volume = volume;
        c.push_back(b);
    }
    return c;
}

inline std::vector<double> line(size_t n, double start, double step){
    std::vector<double> v(n);
    for (size_t i=0;i<n;++i) v[i] = start + step*static_cast<double>(i);
    return v;
}

inline core::Candles trend(size_t n, double start, double step, double spread=0.5){
    return candles_from_closes(line(n, start, step), spread);
}

// Scripted in-memory exchange
class FakeGateway final : public exec::ExchangeGateway {
public:
    std::map<std::string, core::Candles> candles;
    std::map<std::pair<std::string, core::Timeframe>, core::Candles> candles_tf;   // wins over `candles`
    std::vector<exec::Position> positions;
    std::map<std::string, double> prices;
    std::map<std::string, exec::LotConstraints> lots;
    double balance{10000.0};

    // Consumed front-first by submit_order; empty = accept
    std::deque<exec::OrderResult> scripted;
    std::vector<exec::OrderRequest> submitted;
    std::vector<std::pair<std::string, int>> leverage_calls;

    bool fail_candles{false};
    bool fail_positions{false};
    bool fail_prices{false};
    bool fail_balance{false};
    bool track_positions{true};   // accepted orders open/close positions
    std::set<std::string> malformed;   // get_candles throws a json type_error for these

    int candle_calls{0};

    core::Candles get_candles(const std::string& symbol, core::Timeframe tf, int limit) override {
        ++candle_calls;
        if (fail_candles) throw exec::ExchangeError("candles unavailable", 10016);
        if (malformed.count(symbol)) (void)nlohmann::json().value("retCode", -1);
        const core::Candles* src = nullptr;
        auto it = candles_tf.find({symbol, tf});
        if (it!=candles_tf.end()) src = &it->second;
        else {
            auto jt = candles.find(symbol);
            if (jt==candles.end()) throw exec::ExchangeError("unknown symbol " + symbol, 10001);
            src = &jt->second;
        }
        const size_t n = std::min(src->size(), static_cast<size_t>(std::max(limit, 0)));
        return core::Candles(src->end()-static_cast<std::ptrdiff_t>(n), src->end());
    }

    std::vector<exec::Position> get_open_positions() override {
        if (fail_positions) throw exec::ExchangeError("positions unavailable", 10016);
        return positions;
    }

    double get_current_price(const std::string& symbol) override {
        if (fail_prices) throw exec::ExchangeError("ticker unavailable", 10016);
        auto it = prices.find(symbol);
        if (it==prices.end()) throw exec::ExchangeError("no ticker for " + symbol, 10001);
        return it->second;
    }

    exec::LotConstraints get_lot_constraints(const std::string& symbol) override {
        auto it = lots.find(symbol);
        return it==lots.end() ? exec::LotConstraints{} : it->second;
    }

    exec::OrderResult submit_order(const exec::OrderRequest& req) override {
        submitted.push_back(req);
        exec::OrderResult r;
        if (!scripted.empty()){
            r = scripted.front();
            scripted.pop_front();
            if (!r.success) return r;
        } else {
            r.success = true;
        }
        r.order_id = "fake-" + std::to_string(submitted.size());
        if (track_positions) apply(req);
        return r;
    }

    double get_balance() override {
        if (fail_balance) throw exec::ExchangeError("wallet unavailable", 10016);
        return balance;
    }

    bool set_leverage(const std::string& symbol, int leverage) override {
        leverage_calls.emplace_back(symbol, leverage);
        return true;
    }

    void add_position(const std::string& symbol, core::Side side, double size, double entry, double pnl=0.0){
        exec::Position p;
        p.symbol = symbol; p.side = side; p.size = size; p.entry_price = entry; p.unrealized_pnl = pnl;
        positions.push_back(p);
    }

    bool has_position(const std::string& symbol, core::Side side) const {
        return std::any_of(positions.begin(), positions.end(),
                           [&](const exec::Position& p){ return p.symbol==symbol && p.side==side; });
    }

private:
    void apply(const exec::OrderRequest& req){
        auto it = std::find_if(positions.begin(), positions.end(), [&](const exec::Position& p){
            return p.symbol==req.symbol && p.side==req.position;
        });
        if (req.reduce_only){
            if (it!=positions.end()) positions.erase(it);
            return;
        }
        if (it!=positions.end()){ it->size += req.qty; return; }
        const auto pt = prices.find(req.symbol);
        add_position(req.symbol, req.position, req.qty, pt==prices.end() ? 0.0 : pt->second);
    }
};

} // namespace fake
