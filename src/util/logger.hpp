#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace codeact::util {

// Install the colored console logger as spdlog's default
void init_logger();

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"; unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace codeact::util
