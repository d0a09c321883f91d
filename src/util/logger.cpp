#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mycelium::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("console");
    if (!console) {
        console = spdlog::stdout_color_mt("console");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    if (name == "off") {
        return spdlog::level::off;
    }
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off) {
        return spdlog::level::info;
    }
    return level;
}

} // namespace mycelium::util
