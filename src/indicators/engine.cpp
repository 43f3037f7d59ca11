#include "indicators/engine.hpp"
#include "indicators/rsi.hpp"
#include "indicators/macd.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/atr.hpp"
#include "indicators/volume.hpp"
#include "indicators/supertrend.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace ind {

IndicatorEngine IndicatorEngine::with_default_modules(){
    IndicatorEngine e;
    e.add(std::make_unique<RsiModule>());
    e.add(std::make_unique<MacdModule>());
    e.add(std::make_unique<SmaModule>());
    e.add(std::make_unique<EmaModule>());
    e.add(std::make_unique<BollModule>());
    e.add(std::make_unique<StochasticModule>());
    e.add(std::make_unique<WilliamsModule>());
    e.add(std::make_unique<AtrModule>());
    e.add(std::make_unique<AdxProxyModule>());
    e.add(std::make_unique<MfiModule>());
    e.add(std::make_unique<ObvModule>());
    e.add(std::make_unique<CmfModule>());
    e.add(std::make_unique<SuperTrendModule>());
    return e;
}

std::vector<std::string> IndicatorEngine::ids() const {
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (auto& m : modules_) out.push_back(m->id());
    return out;
}

std::vector<core::IndicatorReading> IndicatorEngine::evaluate(const core::Candles& c) const {
    std::vector<core::IndicatorReading> out;
    out.reserve(modules_.size());
    for (auto& m : modules_){
        try {
            out.push_back(m->evaluate(c));
        } catch (const std::exception& e){
            spdlog::warn("indicator {} failed on {} bars: {}", m->id(), c.size(), e.what());
            out.push_back({m->id(), std::nullopt, m->idle_vote()});
        }
    }
    return out;
}

size_t IndicatorEngine::max_warmup() const {
    size_t w=0;
    for (auto& m : modules_) w = std::max(w, m->warmup_bars());
    return w;
}

const core::IndicatorReading* find_reading(const std::vector<core::IndicatorReading>& r, const std::string& name){
    for (auto& x : r) if (x.name==name) return &x;
    return nullptr;
}

} // namespace ind
