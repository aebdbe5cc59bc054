#include "paycore/common/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace paycore {
namespace common {

namespace {

std::atomic<LogLevel> g_level{LogLevel::kWarn};
std::mutex g_output_mutex;

}  // namespace

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kOff:
      return "off";
  }
  return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
  for (auto level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError,
                     LogLevel::kOff}) {
    if (name == to_string(level)) {
      return level;
    }
  }
  return std::nullopt;
}

void set_log_level(LogLevel level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) noexcept {
  return level != LogLevel::kOff && level >= log_level();
}

void log(LogLevel level, std::string_view message) {
  if (!log_enabled(level)) {
    return;
  }
  std::scoped_lock lock(g_output_mutex);
  std::cerr << "[" << to_string(level) << "] " << message << "\n";
}

}  // namespace common
}  // namespace paycore
