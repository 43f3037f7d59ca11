#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "exec/order_executor.hpp"
#include "fake_gateway.hpp"

using namespace exec;
using core::Side;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "[PASS]\n"; \
} while(0)

static bool near(double a, double b, double eps=1e-9){ return std::abs(a-b)<eps; }

static core::ModeConfig conservative(double target=1000.0){
    auto m = core::mode_preset(core::TradingMode::Conservative);
    m.target_notional_usd = target;
    return m;
}

struct Rig {
    fake::FakeGateway gw;
    PositionLedger ledger;
    StopLossEngine stops;
    OrderExecutor ex;

    explicit Rig(core::ModeConfig m=conservative(), SizingConfig s={})
        : ex(gw, ledger, stops, std::move(m), s)
    {
        gw.prices["BTCUSDT"] = 50000.0;
        gw.prices["ETHUSDT"] = 2000.0;
    }
};

TEST(test_open_long) {
    Rig r;
    const auto res = r.ex.open_position("BTCUSDT", Side::Long);
    assert(res.success && near(res.qty, 0.002));
    assert(res.order_id=="fake-1");

    assert(r.gw.submitted.size()==1);
    const auto& req = r.gw.submitted[0];
    assert(req.side==core::OrderSide::Buy && req.position==Side::Long);
    assert(!req.reduce_only);
    assert(near(req.qty, 0.002));
    assert(near(*req.take_profit, 52000.0) && near(*req.stop_loss, 48500.0));
    assert((r.gw.leverage_calls==std::vector<std::pair<std::string, int>>{{"BTCUSDT", 10}}));

    const auto p = r.ledger.get({"BTCUSDT", Side::Long});
    assert(p && near(p->size, 0.002) && near(p->entry_price, 50000.0));
    assert(p->take_profit && near(*p->take_profit, 52000.0));
    assert(p->created_ms>0);

    const auto st = r.stops.get({"BTCUSDT", Side::Long});
    assert(st && near(st->current_stop(), 49000.0));
}

TEST(test_open_short_brackets) {
    Rig r;
    const auto res = r.ex.open_position("ETHUSDT", Side::Short);
    assert(res.success && near(res.qty, 0.05));
    const auto& req = r.gw.submitted.back();
    assert(req.side==core::OrderSide::Sell && req.position==Side::Short);
    assert(near(*req.take_profit, 1920.0) && near(*req.stop_loss, 2060.0));
    assert(near(r.stops.get({"ETHUSDT", Side::Short})->current_stop(), 2040.0));
}

TEST(test_duplicate_guard) {
    Rig r;
    assert(r.ex.open_position("BTCUSDT", Side::Long).success);
    const auto again = r.ex.open_position("BTCUSDT", Side::Long);
    assert(!again.success && again.error=="position already open");
    assert(r.gw.submitted.size()==1);

    // the guard is per side
    assert(r.ex.open_position("BTCUSDT", Side::Short).success);
    assert(r.ledger.size()==2);
}

TEST(test_guard_sees_exchange_positions) {
    Rig r;
    r.gw.add_position("BTCUSDT", Side::Long, 0.01, 48000.0);
    assert(!r.ex.open_position("BTCUSDT", Side::Long).success);
    assert(r.gw.submitted.empty());
}

TEST(test_notional_band) {
    Rig tight(conservative(100.0));
    const auto res = tight.ex.open_position("BTCUSDT", Side::Long);   // floors to 0.001 = 500 notional
    assert(!res.success && res.error=="size outside notional band");
    assert(tight.gw.submitted.empty() && tight.ledger.size()==0);

    SizingConfig loose;
    loose.band_check = false;
    Rig r(conservative(100.0), loose);
    const auto ok = r.ex.open_position("BTCUSDT", Side::Long);
    assert(ok.success && near(ok.qty, 0.001));
}

TEST(test_margin_check) {
    Rig r;
    r.gw.balance = 5.0;   // needs 10
    assert(!r.ex.open_position("BTCUSDT", Side::Long).success);
    assert(r.gw.submitted.empty());

    r.gw.balance = 10000.0;
    r.gw.fail_balance = true;
    assert(!r.ex.open_position("BTCUSDT", Side::Long).success);

    SizingConfig s;
    s.margin_check = false;
    Rig unchecked(conservative(), s);
    unchecked.gw.balance = 5.0;
    assert(unchecked.ex.open_position("BTCUSDT", Side::Long).success);
}

TEST(test_retry_grows_quantity) {
    Rig r;
    r.gw.scripted.push_back(OrderResult::fail("ab not enough for new order", kInsufficientBalance));
    r.gw.scripted.push_back(OrderResult::fail("ab not enough for new order", kInsufficientBalance));
    const auto res = r.ex.open_position("BTCUSDT", Side::Long);
    assert(res.success && near(res.qty, 0.008));

    assert(r.gw.submitted.size()==3);
    assert(near(r.gw.submitted[0].qty, 0.002));
    assert(near(r.gw.submitted[1].qty, 0.004));
    assert(near(r.gw.submitted[2].qty, 0.008));
    assert(near(r.ledger.get({"BTCUSDT", Side::Long})->size, 0.008));
}

TEST(test_non_retryable_failure) {
    Rig r;
    r.gw.scripted.push_back(OrderResult::fail("qty invalid", 10001));
    const auto res = r.ex.open_position("BTCUSDT", Side::Long);
    assert(!res.success && res.error_code==10001);
    assert(r.gw.submitted.size()==1);
    assert(r.ledger.size()==0 && r.stops.size()==0);
}

TEST(test_fetch_failures_reject) {
    Rig r;
    r.gw.fail_positions = true;
    const auto a = r.ex.open_position("BTCUSDT", Side::Long);
    assert(!a.success && a.error.rfind("reconcile failed", 0)==0);
    r.gw.fail_positions = false;

    r.gw.fail_prices = true;
    const auto b = r.ex.open_position("BTCUSDT", Side::Long);
    assert(!b.success && b.error.rfind("price unavailable", 0)==0);
    r.gw.fail_prices = false;

    assert(!r.ex.open_position("NOPEUSDT", Side::Long).success);
    assert(r.gw.submitted.empty());
}

TEST(test_invalid_brackets) {
    auto m = conservative();
    m.sl_range = {150.0, 150.0};
    Rig r(m);
    const auto res = r.ex.open_position("BTCUSDT", Side::Long);
    assert(!res.success && res.error=="invalid TP/SL");
    assert(r.gw.submitted.empty());
}

TEST(test_stops_disabled) {
    Rig r;
    StopConfig off;
    off.enabled = false;
    StopLossEngine no_stops(off);
    OrderExecutor ex(r.gw, r.ledger, no_stops, conservative());
    assert(ex.open_position("BTCUSDT", Side::Long).success);
    assert(no_stops.size()==0 && r.ledger.size()==1);
}

TEST(test_close_position) {
    Rig r;
    assert(r.ex.open_position("BTCUSDT", Side::Long).success);
    const auto p = *r.ledger.get({"BTCUSDT", Side::Long});

    const auto res = r.ex.close_position(p);
    assert(res.success);
    const auto& req = r.gw.submitted.back();
    assert(req.reduce_only && req.side==core::OrderSide::Sell && req.position==Side::Long);
    assert(near(req.qty, 0.002));
    assert(!req.take_profit && !req.stop_loss);
    assert(r.ledger.size()==0 && r.stops.size()==0);
    assert(!r.gw.has_position("BTCUSDT", Side::Long));
}

TEST(test_failed_close_keeps_state) {
    Rig r;
    assert(r.ex.open_position("BTCUSDT", Side::Short).success);
    r.gw.scripted.push_back(OrderResult::fail("reduce-only rejected", 110017));
    const auto p = *r.ledger.get({"BTCUSDT", Side::Short});
    assert(!r.ex.close_position(p).success);
    assert(r.gw.submitted.back().side==core::OrderSide::Buy);
    assert(r.ledger.size()==1 && r.stops.size()==1);
}

TEST(test_close_all) {
    Rig r;
    r.gw.add_position("BTCUSDT", Side::Long, 0.01, 50000.0);
    r.gw.add_position("ETHUSDT", Side::Short, 1.0, 2000.0);
    r.gw.add_position("SOLUSDT", Side::Long, 3.0, 150.0);
    r.gw.scripted.push_back(OrderResult{true, "", 0, "", 0.0});
    r.gw.scripted.push_back(OrderResult::fail("busy", 10006));
    assert(r.ex.close_all()==2);
    assert(r.gw.positions.size()==1 && r.gw.has_position("ETHUSDT", Side::Short));
}

TEST(test_close_all_falls_back_to_ledger) {
    Rig r;
    assert(r.ex.open_position("BTCUSDT", Side::Long).success);
    r.gw.fail_positions = true;
    assert(r.ex.close_all()==1);
    assert(r.ledger.size()==0);
}

TEST(test_sync_reconciles) {
    Rig r;
    r.gw.add_position("SOLUSDT", Side::Long, 3.0, 150.0);
    const auto rep = r.ex.sync();
    assert(rep.added.size()==1 && r.ledger.has({"SOLUSDT", Side::Long}));
    r.gw.positions.clear();
    assert(r.ex.sync().dropped.size()==1);

    r.gw.fail_positions = true;
    bool threw = false;
    try { r.ex.sync(); } catch (const ExchangeError& e) { threw = e.code()==10016; }
    assert(threw);
}

TEST(test_retry_policy_from_sizing) {
    SizingConfig s;
    s.max_attempts = 5;
    s.growth_factor = 1.5;
    s.max_quantity = 2.0;
    Rig r(conservative(), s);
    assert(r.ex.retry().max_attempts==5);
    assert(near(r.ex.retry().growth_factor, 1.5));
    assert(near(r.ex.retry().max_quantity, 2.0));
    assert(r.ex.mode().leverage()==10);
}

int main() {
    std::cout << "=== Order Executor Tests ===\n";
    RUN_TEST(test_open_long);
    RUN_TEST(test_open_short_brackets);
    RUN_TEST(test_duplicate_guard);
    RUN_TEST(test_guard_sees_exchange_positions);
    RUN_TEST(test_notional_band);
    RUN_TEST(test_margin_check);
    RUN_TEST(test_retry_grows_quantity);
    RUN_TEST(test_non_retryable_failure);
    RUN_TEST(test_fetch_failures_reject);
    RUN_TEST(test_invalid_brackets);
    RUN_TEST(test_stops_disabled);
    RUN_TEST(test_close_position);
    RUN_TEST(test_failed_close_keeps_state);
    RUN_TEST(test_close_all);
    RUN_TEST(test_close_all_falls_back_to_ledger);
    RUN_TEST(test_sync_reconciles);
    RUN_TEST(test_retry_policy_from_sizing);
    std::cout << "\nAll order executor tests PASSED!\n";
    return 0;
}
