#pragma once
#include <cstddef>
#include <string>

namespace core {

struct LogConfig {
    std::string level{"info"};               // trace|debug|info|warn|error
    std::string file{"logs/futbot.log"};     // empty = console only
    std::size_t max_file_bytes{5u*1024u*1024u};
    std::size_t max_files{3};
};

// Installs the default spdlog logger (colored stdout + rotating file)
void init_logging(const LogConfig& cfg);

} // namespace core
