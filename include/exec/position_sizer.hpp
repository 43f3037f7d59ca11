#pragma once
#include <cmath>
#include "exec/exchange_gateway.hpp"

namespace exec {

// Decimal places implied by a lot step (0.001 -> 3, 1 -> 0)
int step_precision(double step);

// Round to a decimal place count, half away from zero
double round_to(double v, int decimals);

// Nearest step multiple, ties rounding up
inline double round_step(double v, double step){
    if (step<=0) return v;
    return std::floor(v/step + 0.5)*step;
}

class PositionSizer {
public:
    explicit PositionSizer(double band=0.2) : band_(band) {}

    // Lot-compliant quantity for a target margin notional. Throws std::invalid_argument on non-positive inputs.
    double size(double target_notional, double price, double leverage, const LotConstraints& lot) const;

    // qty*price*leverage within target*(1 +/- band)
    bool within_band(double qty, double price, double leverage, double target_notional) const;

    double band() const { return band_; }

private:
    double band_;
};

} // namespace exec
