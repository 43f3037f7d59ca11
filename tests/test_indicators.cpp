#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "indicators/atr.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/engine.hpp"
#include "indicators/macd.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/supertrend.hpp"
#include "indicators/volume.hpp"
#include "fake_gateway.hpp"

using namespace ind;
using core::Vote;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "[PASS]\n"; \
} while(0)

static bool near(double a, double b, double eps=1e-9){ return std::abs(a-b)<eps; }

TEST(test_sma_series_head_is_nan) {
    const auto s = sma_series({1,2,3,4,5}, 3);
    assert(std::isnan(s[0]) && std::isnan(s[1]));
    assert(near(s[2], 2.0) && near(s[3], 3.0) && near(s[4], 4.0));
    assert(std::isnan(compute_sma({1,2}, 3)));
}

TEST(test_ema_seeded_with_first_value) {
    const auto e = ema_series({5,5,5,5}, 3);
    for (double v : e) assert(near(v, 5.0));
    const auto e2 = ema_series({0,10}, 3);   // alpha 0.5
    assert(near(e2[1], 5.0));
}

TEST(test_rsi_extremes) {
    const auto up = fake::line(30, 100, 1);
    const auto down = fake::line(30, 100, -1);
    assert(near(compute_rsi(up, 14), 100.0));
    assert(near(compute_rsi(down, 14), 0.0));
    assert(near(compute_rsi(std::vector<double>(30, 100.0), 14), 0.0));   // 0/0 reads 0
    assert(std::isnan(compute_rsi(fake::line(14, 100, 1), 14)));
}

TEST(test_rsi_module_votes) {
    RsiModule m;
    auto r = m.evaluate(fake::trend(30, 100, 1));
    assert(r.available() && r.vote==Vote::Sell);
    r = m.evaluate(fake::trend(30, 100, -1));
    assert(r.available() && r.vote==Vote::Buy);
    r = m.evaluate(fake::trend(10, 100, 1));
    assert(!r.available() && r.vote==Vote::Hold && r.name=="RSI");
}

TEST(test_macd_flat_series) {
    const auto m = compute_macd(std::vector<double>(60, 100.0));
    assert(near(m.line.back(), 0.0) && near(m.signal.back(), 0.0) && near(m.hist.back(), 0.0));
    MacdModule mod;
    const auto r = mod.evaluate(fake::candles_from_closes(std::vector<double>(60, 100.0)));
    assert(r.available() && r.vote==Vote::Hold);
    assert(!mod.evaluate(fake::trend(20, 100, 1)).available());
}

TEST(test_bollinger_bands) {
    const auto bb = compute_bb(fake::line(20, 1, 1), 20, 2.0);
    assert(near(bb.mid, 10.5));
    assert(bb.upper>bb.mid && bb.lower<bb.mid && near(bb.upper-bb.mid, bb.mid-bb.lower));
    BollModule m;
    const auto r = m.evaluate(fake::candles_from_closes(std::vector<double>(25, 100.0)));
    assert(r.available() && near(*r.value, 50.0) && r.vote==Vote::Hold);

    // sharp drop below the lower band
    auto closes = std::vector<double>(24, 100.0);
    closes.push_back(80.0);
    assert(m.evaluate(fake::candles_from_closes(closes)).vote==Vote::Buy);
}

TEST(test_oscillators_in_uptrend) {
    const auto c = fake::trend(40, 100, 1);
    const auto s = compute_stochastic(c);
    assert(s.k>80.0 && s.d>80.0);
    assert(StochasticModule().evaluate(c).vote==Vote::Sell);
    assert(compute_williams_r(c)>-20.0);
    assert(WilliamsModule().evaluate(c).vote==Vote::Sell);
    assert(near(compute_mfi(c), 100.0));
    assert(MfiModule().evaluate(c).vote==Vote::Sell);
}

TEST(test_oscillators_in_downtrend) {
    const auto c = fake::trend(40, 200, -1);
    assert(StochasticModule().evaluate(c).vote==Vote::Buy);
    assert(WilliamsModule().evaluate(c).vote==Vote::Buy);
    assert(near(compute_mfi(c), 0.0));
    assert(MfiModule().evaluate(c).vote==Vote::Buy);
}

TEST(test_williams_flat_window) {
    core::Candles c(20, core::Bar{0, 100, 100, 100, 100, 1});
    assert(near(compute_williams_r(c), -50.0));
}

TEST(test_atr_constant_range) {
    const auto c = fake::candles_from_closes(std::vector<double>(30, 100.0), 1.0);
    assert(near(true_range(c)[0], 2.0));
    assert(near(compute_atr(c), 2.0));
    assert(std::isnan(compute_atr(fake::candles_from_closes(std::vector<double>(10, 100.0)))));

    const auto partial = atr_series(c, 14, 1);
    assert(near(partial[0], 2.0));   // min_periods fills the head

    AtrModule m;
    auto r = m.evaluate(c);
    assert(r.available() && near(*r.value, 2.0) && r.vote==Vote::None);
    r = m.evaluate(fake::trend(5, 100, 1));
    assert(!r.available() && r.vote==Vote::None);
}

TEST(test_trend_followers_agree_in_uptrend) {
    const auto c = fake::trend(60, 100, 1);
    assert(SmaModule().evaluate(c).vote==Vote::Buy);
    assert(EmaModule().evaluate(c).vote==Vote::Buy);
    assert(AdxProxyModule().evaluate(c).vote==Vote::Buy);
    const auto d = fake::trend(60, 200, -1);
    assert(SmaModule().evaluate(d).vote==Vote::Sell);
    assert(EmaModule().evaluate(d).vote==Vote::Sell);
}

TEST(test_obv_and_cmf) {
    const auto c = fake::trend(30, 100, 1);
    const auto obv = obv_series(c);
    assert(near(obv.back(), 30*1000.0));
    assert(ObvModule().evaluate(c).vote==Vote::Buy);

    // every bar closes on its high: money flow multiplier 1
    core::Candles h;
    for (int i=0;i<25;++i) h.push_back({i*60000, 100, 101, 99, 101, 500});
    assert(near(cmf_series(h, 20).back(), 1.0));
    assert(CmfModule().evaluate(h).vote==Vote::Buy);
    for (auto& b : h) b.close = b.low;
    assert(CmfModule().evaluate(h).vote==Vote::Sell);
}

TEST(test_median_and_kmeans) {
    assert(near(median({3,1,2}), 2.0));
    assert(near(median({4,1,3,2}), 2.5));
    assert(std::isnan(median({})));

    const std::vector<Point2> pts{{1,1},{1.1,1},{0.9,1},{10,10},{10.2,10},{9.8,10}};
    const auto l = kmeans_labels(pts, 2);
    assert(l[0]==l[1] && l[1]==l[2]);
    assert(l[3]==l[4] && l[4]==l[5]);
    assert(l[0]!=l[3]);
    assert(kmeans_labels(pts, 2)==l);   // deterministic
}

TEST(test_supertrend_uptrend) {
    const auto c = fake::trend(60, 100, 1);
    const SuperTrendAI st;
    const double m = st.best_multiplier(c);
    assert(m>=1.0 && m<=5.0);
    const auto r = st.compute(c);
    assert(r.dir.back()==1 && c.back().close>r.line.back());
    assert(SuperTrendModule().evaluate(c).vote==Vote::Buy);
    assert(near(st.best_multiplier(fake::trend(2, 100, 1)), 3.0));   // too few points
}

TEST(test_supertrend_downtrend) {
    const auto c = fake::trend(60, 400, -3);
    const auto r = SuperTrendAI().compute(c);
    assert(r.dir.back()==-1);
    assert(SuperTrendModule().evaluate(c).vote==Vote::Sell);
}

namespace {
class Throwing final : public core::IModule {
public:
    std::string id() const override { return "BROKEN"; }
    size_t warmup_bars() const override { return 1; }
    core::IndicatorReading evaluate(const core::Candles&) const override { throw std::runtime_error("boom"); }
};
}

TEST(test_engine_default_set) {
    const auto e = IndicatorEngine::with_default_modules();
    const std::vector<std::string> want{"RSI","MACD","SMA","EMA","BB","STOCH","WILLIAMS","ATR","ADX","MFI","OBV","CMF","SuperTrendAI"};
    assert(e.ids()==want);
    assert(e.max_warmup()==50);

    const auto full = e.evaluate(fake::trend(120, 100, 0.5));
    assert(full.size()==want.size());
    for (auto& r : full) assert(r.available());

    const auto shorty = e.evaluate(fake::trend(5, 100, 1));
    for (auto& r : shorty){
        assert(!r.available());
        assert(r.vote==(r.name=="ATR" ? Vote::None : Vote::Hold));
    }
    assert(find_reading(full, "CMF")!=nullptr);
    assert(find_reading(full, "NOPE")==nullptr);
}

TEST(test_engine_isolates_failing_module) {
    IndicatorEngine e;
    e.add(std::make_unique<RsiModule>());
    e.add(std::make_unique<Throwing>());
    const auto r = e.evaluate(fake::trend(30, 100, 1));
    assert(r.size()==2);
    assert(r[0].available());
    assert(r[1].name=="BROKEN" && !r[1].available() && r[1].vote==Vote::Hold);
}

int main() {
    std::cout << "=== Indicator Tests ===\n";
    RUN_TEST(test_sma_series_head_is_nan);
    RUN_TEST(test_ema_seeded_with_first_value);
    RUN_TEST(test_rsi_extremes);
    RUN_TEST(test_rsi_module_votes);
    RUN_TEST(test_macd_flat_series);
    RUN_TEST(test_bollinger_bands);
    RUN_TEST(test_oscillators_in_uptrend);
    RUN_TEST(test_oscillators_in_downtrend);
    RUN_TEST(test_williams_flat_window);
    RUN_TEST(test_atr_constant_range);
    RUN_TEST(test_trend_followers_agree_in_uptrend);
    RUN_TEST(test_obv_and_cmf);
    RUN_TEST(test_median_and_kmeans);
    RUN_TEST(test_supertrend_uptrend);
    RUN_TEST(test_supertrend_downtrend);
    RUN_TEST(test_engine_default_set);
    RUN_TEST(test_engine_isolates_failing_module);
    std::cout << "\nAll indicator tests PASSED!\n";
    return 0;
}
