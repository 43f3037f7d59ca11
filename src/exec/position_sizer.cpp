#include "exec/position_sizer.hpp"
#include <stdexcept>
#include <fmt/format.h>

namespace exec {

int step_precision(double step){
    int d = 0;
    // scale until the step is integral (relative tolerance absorbs binary noise)
    while (d<12){
        const double scaled = step*std::pow(10.0, d);
        if (std::abs(scaled - std::round(scaled)) < 1e-9*std::max(1.0, scaled)) break;
        ++d;
    }
    return d;
}

double round_to(double v, int decimals){
    const double m = std::pow(10.0, decimals);
    return std::round(v*m)/m;
}

double PositionSizer::size(double target, double price, double leverage, const LotConstraints& lot) const {
    if (target<=0.0 || price<=0.0 || leverage<=0.0 || lot.qty_step<=0.0)
        throw std::invalid_argument(fmt::format("size: non-positive input (target={}, price={}, leverage={}, step={})",
                                                target, price, leverage, lot.qty_step));
    const int prec = step_precision(lot.qty_step);

    double qty = round_to(round_step(target/(price*leverage), lot.qty_step), prec);
    if (qty < lot.min_order_qty) qty = lot.min_order_qty;
    if (lot.min_notional>0.0 && qty*price < lot.min_notional){
        const double steps = std::ceil(round_to(lot.min_notional/price/lot.qty_step, 9));
        qty = steps*lot.qty_step;
    }
    return round_to(qty, prec);
}

bool PositionSizer::within_band(double qty, double price, double leverage, double target) const {
    const double v = qty*price*leverage;
    return v >= target*(1.0-band_) && v <= target*(1.0+band_);
}

} // namespace exec
