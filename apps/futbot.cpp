#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/trading_bot.hpp"
#include "exec/bybit_rest.hpp"

namespace {
std::atomic<bool> g_stop{false};
void on_signal(int){ g_stop.store(true); }
}

int main(int argc, char** argv){
    const std::string path = argc>=2 ? argv[1] : "config/futbot.json";

    core::BotConfig cfg;
    try {
        cfg = core::load_config(path);
    } catch (const std::exception& e){
        fmt::print(stderr, "futbot: {}\n", e.what());
        return 1;
    }
    core::init_logging(cfg.log);

    exec::BybitRest rest(cfg.api);
    spdlog::info("futbot: {} mode, {}", cfg.mode.name, rest.rest_base());

    engine::TradingBot bot(cfg, rest, [](const engine::BroadcastEvent& ev){
        if (ev.kind==engine::BroadcastEvent::Kind::Reversal && ev.direction)
            spdlog::info("[broadcast] reversal {} {}", ev.symbol, core::to_string(*ev.direction));
        else
            spdlog::debug("[broadcast] {}", ev.text);
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (!bot.start()){
        spdlog::error("futbot: start failed");
        return 2;
    }
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    spdlog::info("futbot: shutting down");
    bot.shutdown();
    spdlog::shutdown();
    return 0;
}
