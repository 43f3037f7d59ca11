#pragma once
#include <memory>
#include <vector>
#include <string>
#include "core/module.hpp"

namespace ind {

// Owns a set of indicator modules and evaluates them against one candle series
class IndicatorEngine {
public:
    IndicatorEngine() = default;
    IndicatorEngine(IndicatorEngine&&) = default;
    IndicatorEngine& operator=(IndicatorEngine&&) = default;

    // RSI, MACD, SMA, EMA, BB, STOCH, WILLIAMS, ATR, ADX, MFI, OBV, CMF, SuperTrendAI
    static IndicatorEngine with_default_modules();

    void add(std::unique_ptr<core::IModule> m) { modules_.push_back(std::move(m)); }
    size_t size() const { return modules_.size(); }
    std::vector<std::string> ids() const;

    // One reading per module, in registration order. A module that throws reads as unavailable.
    std::vector<core::IndicatorReading> evaluate(const core::Candles& c) const;

    // Longest warm-up over all modules
    size_t max_warmup() const;

private:
    std::vector<std::unique_ptr<core::IModule>> modules_;
};

// Linear lookup by indicator name; nullptr when absent
const core::IndicatorReading* find_reading(const std::vector<core::IndicatorReading>& r, const std::string& name);

} // namespace ind
