#pragma once
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace exec {

struct RiskLimits {
    int max_daily_trades{20};
    int max_positions{4};
};

// Daily trade counter plus a cap on simultaneous positions. The day rolls over at local midnight.
class RiskGate {
public:
    explicit RiskGate(RiskLimits lim={}) : lim_(lim) { day_ = today_key(); }

    const RiskLimits& limits() const { return lim_; }

    // Empty string = allowed, otherwise the reason
    std::string check(size_t open_positions) {
        std::lock_guard<std::mutex> lk(mu_);
        roll();
        if (trades_today_ >= lim_.max_daily_trades) return "daily trade limit reached";
        if (static_cast<int>(open_positions) >= lim_.max_positions) return "max open positions reached";
        return {};
    }

    void record_trade(){
        std::lock_guard<std::mutex> lk(mu_);
        roll();
        ++trades_today_;
    }

    int trades_today() {
        std::lock_guard<std::mutex> lk(mu_);
        roll();
        return trades_today_;
    }

    void force_reset_day(){
        std::lock_guard<std::mutex> lk(mu_);
        trades_today_ = 0; day_ = today_key();
    }

private:
    void roll(){
        auto d = today_key();
        if (d != day_) { day_ = d; trades_today_ = 0; } // new day -> reset
    }

    static int today_key(){
        using namespace std::chrono;
        auto now = system_clock::now();
        time_t t = system_clock::to_time_t(now);
        tm lt{};
        #ifdef _WIN32
        localtime_s(&lt, &t);
        #else
        localtime_r(&t, &lt);
        #endif
        return (lt.tm_year+1900)*10000 + (lt.tm_mon+1)*100 + lt.tm_mday;
    }

    RiskLimits lim_;
    std::mutex mu_;
    int trades_today_{0};
    int day_{0};
};

} // namespace exec
