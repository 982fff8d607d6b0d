#pragma once

#include <string>

namespace modkit {

// Host severities, most to least severe.
enum class LogLevel {
  Warning = 0,
  Notice = 1,
  Verbose = 2,
  Debug = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
LogLevel parse_log_level(const std::string& level);
const char* log_level_name(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace modkit
