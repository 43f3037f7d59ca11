#pragma once
#include <string>
#include <optional>
#include <algorithm>
#include "core/types.hpp"

namespace core {

// One indicator's output for the latest bar. value == nullopt -> not available.
struct IndicatorReading {
    std::string name;
    std::optional<double> value;
    Vote vote{Vote::Hold};

    bool available() const { return value.has_value(); }
};

// Indicator module interface. Modules are stateless: every call sees the whole series.
class IModule {
public:
    virtual ~IModule() = default;

    // Unique id ("RSI", "MACD", "BB", ...)
    virtual std::string id() const = 0;

    // Bars needed before the module produces a meaningful value
    virtual std::size_t warmup_bars() const = 0;

    // Vote reported while warming up (ATR reports None, every other module Hold)
    virtual Vote idle_vote() const { return Vote::Hold; }

    // Reading for the last bar of the series. Short series must not throw.
    virtual IndicatorReading evaluate(const Candles&) const = 0;

protected:
    IndicatorReading unavailable() const { return {id(), std::nullopt, idle_vote()}; }
};

inline double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace core
