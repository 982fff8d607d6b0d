#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace modkit {
namespace {
std::mutex g_log_mutex;
std::atomic<LogLevel> g_level{LogLevel::Notice};
}  // namespace

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

LogLevel parse_log_level(const std::string& level) {
  if (level == "warning") return LogLevel::Warning;
  if (level == "notice") return LogLevel::Notice;
  if (level == "verbose") return LogLevel::Verbose;
  if (level == "debug") return LogLevel::Debug;
  return LogLevel::Notice;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Notice:
      return "notice";
    case LogLevel::Verbose:
      return "verbose";
    case LogLevel::Debug:
      return "debug";
  }
  return "notice";
}

void log(LogLevel level, const std::string& message) {
  if (!log_enabled(level)) {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const auto now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf {};
  localtime_r(&now_time, &tm_buf);

  std::ostringstream ts;
  ts << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << ts.str() << "] [" << log_level_name(level) << "] " << message << '\n';
}

}  // namespace modkit
