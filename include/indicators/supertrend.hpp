#pragma once
#include <vector>
#include "indicators/sma_ema.hpp"

namespace ind {

struct SuperTrendResult {
    Series line;             // active band per bar
    std::vector<int> dir;    // +1 up, -1 down
    double multiplier{3.0};
};

// ATR-banded SuperTrend whose multiplier is picked by clustering (range, ATR) pairs
class SuperTrendAI {
public:
    SuperTrendAI(size_t window=10, size_t clusters=3, double min_mult=1.0, double max_mult=5.0)
        : window_(window), clusters_(clusters), min_mult_(min_mult), max_mult_(max_mult) {}

    // Deterministic k-means; 3.0 when there are fewer points than clusters
    double best_multiplier(const core::Candles& c) const;
    SuperTrendResult compute(const core::Candles& c) const;
    SuperTrendResult compute(const core::Candles& c, double multiplier) const;

    size_t window() const { return window_; }

private:
    size_t window_, clusters_;
    double min_mult_, max_mult_;
};

struct Point2 { double x, y; };

// Lloyd's k-means, seeded from quantiles of x. Returns a label per point.
std::vector<size_t> kmeans_labels(const std::vector<Point2>& pts, size_t k, size_t max_iter=100);

double median(std::vector<double> v);

class SuperTrendModule final : public core::IModule {
    SuperTrendAI st;
public:
    explicit SuperTrendModule(size_t window=10, size_t clusters=3): st(window, clusters) {}
    std::string id() const override { return "SuperTrendAI"; }
    size_t warmup_bars() const override { return st.window(); }
    core::IndicatorReading evaluate(const core::Candles&) const override;
};

} // namespace ind
