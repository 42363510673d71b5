#pragma once
#include <chrono>
#include <string>

namespace codeact::util {

// ISO 8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

inline std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace codeact::util
