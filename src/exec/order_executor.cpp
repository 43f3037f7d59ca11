#include "exec/order_executor.hpp"
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace exec {

namespace {
inline std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}

OrderExecutor::OrderExecutor(ExchangeGateway& gw, PositionLedger& ledger, StopLossEngine& stops,
                             core::ModeConfig mode, SizingConfig sizing)
    : gw_(gw), ledger_(ledger), stops_(stops), mode_(std::move(mode)), sizing_(sizing), sizer_(mode_.notional_band)
{
    retry_.max_attempts = sizing_.max_attempts;
    retry_.growth_factor = sizing_.growth_factor;
    retry_.max_quantity = sizing_.max_quantity;
}

OrderResult OrderExecutor::reject(const std::string& symbol, core::Side side, const std::string& why, int code) const {
    spdlog::warn("open {} {} rejected: {}", symbol, core::to_string(side), why);
    return OrderResult::fail(why, code);
}

ReconcileReport OrderExecutor::sync(){
    return ledger_.reconcile(gw_.get_open_positions());
}

OrderResult OrderExecutor::open_position(const std::string& symbol, core::Side side,
                                         const strategy::MarketAnalysis* analysis, std::optional<double> atr){
    // 1. reconcile
    try { sync(); }
    catch (const ExchangeError& e){ return reject(symbol, side, std::string("reconcile failed: ") + e.what(), e.code()); }

    // 2. duplicate guard
    const core::PositionKey key{symbol, side};
    if (ledger_.has(key)) return reject(symbol, side, "position already open");

    // 3. price
    double price = 0.0;
    try { price = gw_.get_current_price(symbol); }
    catch (const ExchangeError& e){ return reject(symbol, side, std::string("price unavailable: ") + e.what(), e.code()); }

    // 4. TP/SL
    const auto br = core::compute_brackets(mode_, side, price);
    if (!core::brackets_valid(br, side, price)){
        spdlog::error("open {} {}: invalid brackets tp {} sl {} entry {}", symbol, core::to_string(side), br.take_profit, br.stop_loss, price);
        return OrderResult::fail("invalid TP/SL");
    }

    // 5. size
    const int lev = mode_.leverage();
    LotConstraints lot;
    double qty = 0.0;
    try {
        lot = gw_.get_lot_constraints(symbol);
        qty = sizer_.size(mode_.target_notional_usd, price, lev, lot);
    } catch (const ExchangeError& e){
        return reject(symbol, side, std::string("lot constraints unavailable: ") + e.what(), e.code());
    } catch (const std::invalid_argument& e){
        return reject(symbol, side, e.what());
    }

    // 6. band
    if (sizing_.band_check && !sizer_.within_band(qty, price, lev, mode_.target_notional_usd)){
        spdlog::error("open {} {}: qty {} gives notional {:.2f}, target {} +/- {}%", symbol, core::to_string(side),
                      qty, qty*price*lev, mode_.target_notional_usd, sizer_.band()*100.0);
        return OrderResult::fail("size outside notional band");
    }

    // 7. margin
    if (sizing_.margin_check){
        double balance = 0.0;
        try { balance = gw_.get_balance(); }
        catch (const ExchangeError& e){ return reject(symbol, side, std::string("balance unavailable: ") + e.what(), e.code()); }
        const double margin = qty*price/lev;
        if (margin > balance) return reject(symbol, side, fmt::format("margin {:.2f} exceeds balance {:.2f}", margin, balance));
    }

    // 8. submit
    if (!gw_.set_leverage(symbol, lev)) spdlog::warn("open {}: leverage x{} not applied", symbol, lev);
    const int prec = step_precision(lot.qty_step);
    const OrderResult r = retry_.run(qty, [&](double q){
        OrderRequest req;
        req.symbol = symbol;
        req.side = core::entry_side(side);
        req.position = side;
        req.qty = round_to(q, prec);
        req.take_profit = br.take_profit;
        req.stop_loss = br.stop_loss;
        return gw_.submit_order(req);
    });
    if (!r.success){
        spdlog::error("open {} {} failed: {} (code {})", symbol, core::to_string(side), r.error, r.error_code);
        return r;
    }

    // 9. ledger + stop
    Position p;
    p.symbol = symbol;
    p.side = side;
    p.size = round_to(r.qty, prec);
    p.entry_price = price;
    p.created_ms = now_ms();
    p.take_profit = br.take_profit;
    p.stop_loss = br.stop_loss;
    ledger_.upsert(p);
    if (stops_.config().enabled) stops_.create(symbol, side, price, std::nullopt, std::nullopt, atr, analysis);

    spdlog::info("opened {} {} qty {} @ {} tp {:.6f} sl {:.6f} id {}", symbol, core::to_string(side), p.size, price,
                 br.take_profit, br.stop_loss, r.order_id);
    return r;
}

OrderResult OrderExecutor::close_position(const Position& p){
    OrderRequest req;
    req.symbol = p.symbol;
    req.side = core::exit_side(p.side);
    req.position = p.side;
    req.qty = p.size;
    req.reduce_only = true;
    auto r = gw_.submit_order(req);
    if (!r.success){
        spdlog::error("close {} {} failed: {} (code {})", p.symbol, core::to_string(p.side), r.error, r.error_code);
        return r;
    }
    ledger_.erase(p.key());
    stops_.cancel(p.key());
    spdlog::info("closed {} {} qty {} pnl {}", p.symbol, core::to_string(p.side), p.size, p.unrealized_pnl);
    return r;
}

int OrderExecutor::close_all(){
    std::vector<Position> positions;
    try {
        positions = gw_.get_open_positions();
    } catch (const ExchangeError& e){
        spdlog::warn("close_all: position fetch failed ({}), using ledger", e.what());
        positions = ledger_.snapshot();
    }
    int closed = 0;
    for (auto& p : positions){
        if (close_position(p).success) ++closed;
    }
    spdlog::info("close_all: {}/{} closed", closed, positions.size());
    return closed;
}

} // namespace exec
