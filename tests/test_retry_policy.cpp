#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "exec/retry_policy.hpp"

using namespace exec;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "[PASS]\n"; \
} while(0)

static OrderResult ok(){
    OrderResult r; r.success = true; r.order_id = "1"; return r;
}

static OrderResult no_margin(){
    return OrderResult::fail("ab not enough for new order", kInsufficientBalance);
}

TEST(test_first_attempt_succeeds) {
    RetryPolicy p;
    std::vector<double> seen;
    const auto r = p.run(0.5, [&](double q){ seen.push_back(q); return ok(); });
    assert(r.success && r.qty==0.5);
    assert(seen.size()==1);
}

TEST(test_grows_on_insufficient_balance) {
    RetryPolicy p;
    std::vector<double> seen;
    const auto r = p.run(1.0, [&](double q){
        seen.push_back(q);
        return seen.size()<3 ? no_margin() : ok();
    });
    assert(r.success);
    assert((seen==std::vector<double>{1.0, 2.0, 4.0}));
    assert(r.qty==4.0);
}

TEST(test_other_errors_surface_immediately) {
    RetryPolicy p;
    int calls = 0;
    const auto r = p.run(1.0, [&](double){ ++calls; return OrderResult::fail("qty invalid", 10001); });
    assert(!r.success && r.error_code==10001);
    assert(calls==1);
}

TEST(test_attempts_are_bounded) {
    RetryPolicy p;
    p.max_attempts = 3;
    int calls = 0;
    const auto r = p.run(1.0, [&](double){ ++calls; return no_margin(); });
    assert(!r.success && r.error_code==kInsufficientBalance);
    assert(calls==3);
}

TEST(test_quantity_ceiling_stops_growth) {
    RetryPolicy p;
    p.max_quantity = 3.0;
    std::vector<double> seen;
    const auto r = p.run(2.0, [&](double q){ seen.push_back(q); return no_margin(); });
    assert(!r.success);
    assert(seen.size()==1);   // 4.0 would exceed the ceiling
}

TEST(test_custom_retryable_predicate) {
    RetryPolicy p;
    p.growth_factor = 1.5;
    p.retryable = [](const OrderResult& r){ return r.error_code==42; };
    std::vector<double> seen;
    const auto r = p.run(2.0, [&](double q){
        seen.push_back(q);
        return seen.size()==1 ? OrderResult::fail("try again", 42) : ok();
    });
    assert(r.success && r.qty==3.0);
    assert(!p.retryable(no_margin()));
}

TEST(test_insufficient_balance_detection) {
    assert(is_insufficient_balance(OrderResult::fail("x", 110007)));
    assert(is_insufficient_balance(OrderResult::fail("ab not enough for new order", 0)));
    assert(!is_insufficient_balance(OrderResult::fail("reduce-only rejected", 110017)));
}

int main() {
    std::cout << "=== Retry Policy Tests ===\n";
    RUN_TEST(test_first_attempt_succeeds);
    RUN_TEST(test_grows_on_insufficient_balance);
    RUN_TEST(test_other_errors_surface_immediately);
    RUN_TEST(test_attempts_are_bounded);
    RUN_TEST(test_quantity_ceiling_stops_growth);
    RUN_TEST(test_custom_retryable_predicate);
    RUN_TEST(test_insufficient_balance_detection);
    std::cout << "\nAll retry policy tests PASSED!\n";
    return 0;
}
