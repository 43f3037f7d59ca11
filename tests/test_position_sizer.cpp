#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>

#include "exec/position_sizer.hpp"

using namespace exec;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "[PASS]\n"; \
} while(0)

static bool near(double a, double b, double eps=1e-12){ return std::abs(a-b)<eps; }

TEST(test_btc_scenario) {
    PositionSizer s;
    const LotConstraints lot{0.001, 0.001, 5.0};
    const double q = s.size(1000.0, 50000.0, 10.0, lot);
    assert(near(q, 0.002));
    assert(s.within_band(q, 50000.0, 10.0, 1000.0));
}

TEST(test_min_qty_floor) {
    PositionSizer s;
    const LotConstraints lot{0.001, 0.001, 5.0};
    assert(near(s.size(1.0, 50000.0, 10.0, lot), 0.001));
}

TEST(test_min_notional_raises_to_step) {
    PositionSizer s;
    const LotConstraints lot{1.0, 1.0, 5.0};
    assert(near(s.size(2.0, 1.0, 1.0, lot), 5.0));

    const LotConstraints doge{1.0, 1.0, 5.0};
    assert(near(s.size(100.0, 0.12, 10.0, doge), 83.0));   // 100 / 1.2 = 83.3
}

TEST(test_quantity_compliance_randomized) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> target(1.0, 5000.0);
    std::uniform_real_distribution<double> price(0.05, 90000.0);
    std::uniform_int_distribution<int> lev(1, 25);
    const double steps[] = {1.0, 0.1, 0.01, 0.001, 0.0001};
    PositionSizer s;
    for (int i=0;i<5000;++i){
        const double step = steps[i%5];
        const LotConstraints lot{step, step, 5.0};
        const double t = target(rng), p = price(rng), l = lev(rng);
        const double q = s.size(t, p, l, lot);
        const double k = q/step;
        assert(std::abs(k - std::round(k)) < 1e-6);
        assert(q >= lot.min_order_qty - 1e-12);
        assert(q*p >= lot.min_notional - 1e-9);
        assert(s.size(t, p, l, lot)==q);   // idempotent
    }
}

TEST(test_rejects_bad_inputs) {
    PositionSizer s;
    const LotConstraints lot;
    bool threw = false;
    try { s.size(0.0, 100.0, 10.0, lot); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { s.size(100.0, -1.0, 10.0, lot); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { s.size(100.0, 100.0, 10.0, LotConstraints{0.0, 0.001, 5.0}); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
}

TEST(test_band_check) {
    PositionSizer s(0.2);
    assert(s.within_band(0.002, 50000.0, 10.0, 1000.0));
    assert(!s.within_band(0.003, 50000.0, 10.0, 1000.0));
    assert(s.within_band(0.0023, 50000.0, 10.0, 1000.0));
    assert(!s.within_band(0.0015, 50000.0, 10.0, 1000.0));
}

TEST(test_step_precision_and_rounding) {
    assert(step_precision(0.001)==3);
    assert(step_precision(0.1)==1);
    assert(step_precision(1.0)==0);
    assert(step_precision(10.0)==0);
    assert(step_precision(0.00001)==5);
    assert(near(round_to(0.123456, 3), 0.123));
    assert(near(round_step(0.0031, 0.001), 0.003));
    assert(near(round_step(0.0038, 0.001), 0.004));
}

int main() {
    std::cout << "=== Position Sizer Tests ===\n";
    RUN_TEST(test_btc_scenario);
    RUN_TEST(test_min_qty_floor);
    RUN_TEST(test_min_notional_raises_to_step);
    RUN_TEST(test_quantity_compliance_randomized);
    RUN_TEST(test_rejects_bad_inputs);
    RUN_TEST(test_band_check);
    RUN_TEST(test_step_precision_and_rounding);
    std::cout << "\nAll position sizer tests PASSED!\n";
    return 0;
}
