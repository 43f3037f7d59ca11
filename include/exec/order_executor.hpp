#pragma once
#include <optional>
#include <string>
#include "core/mode.hpp"
#include "exec/exchange_gateway.hpp"
#include "exec/position_ledger.hpp"
#include "exec/position_sizer.hpp"
#include "exec/retry_policy.hpp"
#include "exec/stop_loss.hpp"
#include "strategy/market_regime.hpp"

namespace exec {

struct SizingConfig {
    bool band_check{true};
    bool margin_check{true};
    int max_attempts{3};
    double growth_factor{2.0};
    double max_quantity{1000.0};
};

// Entry/exit path: reconcile, guard, TP/SL, size, submit with retry, then ledger + stop
class OrderExecutor {
public:
    OrderExecutor(ExchangeGateway& gw, PositionLedger& ledger, StopLossEngine& stops,
                  core::ModeConfig mode, SizingConfig sizing={});

    // Never throws; failures come back as OrderResult{success=false}
    OrderResult open_position(const std::string& symbol, core::Side side,
                              const strategy::MarketAnalysis* analysis=nullptr,
                              std::optional<double> atr=std::nullopt);

    // Reduce-only market order on the opposite order side
    OrderResult close_position(const Position& p);

    // Best effort over every open position; returns how many closed
    int close_all();

    // Pulls positions from the exchange into the ledger. Throws ExchangeError.
    ReconcileReport sync();

    const core::ModeConfig& mode() const { return mode_; }
    const RetryPolicy& retry() const { return retry_; }
    void set_retry(RetryPolicy r) { retry_ = std::move(r); }

private:
    OrderResult reject(const std::string& symbol, core::Side side, const std::string& why, int code=0) const;

    ExchangeGateway& gw_;
    PositionLedger& ledger_;
    StopLossEngine& stops_;
    core::ModeConfig mode_;
    SizingConfig sizing_;
    PositionSizer sizer_;
    RetryPolicy retry_;
};

} // namespace exec
