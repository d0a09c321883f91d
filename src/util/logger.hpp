#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace mycelium::util {

// Initialize logging with console output
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Map "trace".."off" to a level; unknown names fall back to info
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace mycelium::util
