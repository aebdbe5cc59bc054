#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace paycore {
namespace common {

enum class LogLevel : std::uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

std::string_view to_string(LogLevel level) noexcept;
std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

// Writes one line to stderr, serialized across threads.
void log(LogLevel level, std::string_view message);

inline void log_debug(std::string_view message) { log(LogLevel::kDebug, message); }
inline void log_info(std::string_view message) { log(LogLevel::kInfo, message); }
inline void log_warn(std::string_view message) { log(LogLevel::kWarn, message); }
inline void log_error(std::string_view message) { log(LogLevel::kError, message); }

}  // namespace common
}  // namespace paycore
