#include "core/logging.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace core {

void init_logging(const LogConfig& cfg){
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()){
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, cfg.max_file_bytes, cfg.max_files));
        } catch (const spdlog::spdlog_ex& e){
            // console logging still works without the file
            spdlog::warn("log file {} unavailable: {}", cfg.file, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("futbot", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(spdlog::level::from_str(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace core
