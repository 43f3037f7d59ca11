#pragma once
#include <functional>
#include <string>
#include <spdlog/spdlog.h>
#include "exec/exchange_gateway.hpp"

namespace exec {

// Bybit "ab not enough for new order"
constexpr int kInsufficientBalance = 110007;

inline bool is_insufficient_balance(const OrderResult& r){
    return r.error_code==kInsufficientBalance
        || r.error.find("ab not enough for new order")!=std::string::npos;
}

// Resubmits with a grown quantity while the rejection is retryable
struct RetryPolicy {
    int max_attempts{3};
    double growth_factor{2.0};
    double max_quantity{1000.0};
    std::function<bool(const OrderResult&)> retryable{is_insufficient_balance};

    // submit: double qty -> OrderResult. Returns the last result; on success r.qty is the accepted quantity.
    template <class Submit>
    OrderResult run(double qty, Submit&& submit) const {
        OrderResult r = OrderResult::fail("no attempt made");
        for (int attempt=1; attempt<=max_attempts; ++attempt){
            r = submit(qty);
            if (r.success){
                r.qty = qty;
                return r;
            }
            if (!retryable || !retryable(r)) return r;
            if (attempt==max_attempts) break;
            const double next = qty*growth_factor;
            if (next>max_quantity){
                spdlog::warn("retry: qty {} would exceed ceiling {}, giving up", next, max_quantity);
                return r;
            }
            spdlog::warn("retry {}/{}: {} (code {}), qty {} -> {}", attempt, max_attempts, r.error, r.error_code, qty, next);
            qty = next;
        }
        return r;
    }
};

} // namespace exec
