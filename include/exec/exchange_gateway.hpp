#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace exec {

// Transport or API failure on a fetch. code = exchange retCode when one was returned.
class ExchangeError : public std::runtime_error {
public:
    explicit ExchangeError(const std::string& what, int code=0) : std::runtime_error(what), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

// Open position as reported by the exchange (or the local ledger)
struct Position {
    std::string symbol;
    core::Side side{core::Side::Long};
    double size{0.0};
    double entry_price{0.0};
    double unrealized_pnl{0.0};
    std::int64_t created_ms{0};
    std::optional<double> take_profit;
    std::optional<double> stop_loss;

    core::PositionKey key() const { return {symbol, side}; }
};

// Lot filters per symbol
struct LotConstraints {
    double qty_step{0.001};
    double min_order_qty{0.001};
    double min_notional{5.0};
};

struct OrderRequest {
    std::string symbol;
    core::OrderSide side{core::OrderSide::Buy};
    core::Side position{core::Side::Long};   // position being opened or reduced
    double qty{0.0};
    bool reduce_only{false};
    std::optional<double> take_profit;
    std::optional<double> stop_loss;
    std::string order_type{"Market"};
};

struct OrderResult {
    bool success{false};
    std::string order_id;
    int error_code{0};
    std::string error;
    double qty{0.0};

    static OrderResult fail(std::string msg, int code=0){
        OrderResult r; r.error = std::move(msg); r.error_code = code; return r;
    }
};

// Exchange capability the bot needs. Fetches throw ExchangeError; submit_order never throws.
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    virtual core::Candles get_candles(const std::string& symbol, core::Timeframe tf, int limit) = 0;
    virtual std::vector<Position> get_open_positions() = 0;
    virtual double get_current_price(const std::string& symbol) = 0;
    virtual LotConstraints get_lot_constraints(const std::string& symbol) = 0;
    virtual OrderResult submit_order(const OrderRequest& req) = 0;
    // Available USDT
    virtual double get_balance() = 0;
    // "not modified" counts as success
    virtual bool set_leverage(const std::string& /*symbol*/, int /*leverage*/) { return true; }
};

} // namespace exec
