#pragma once
#include <optional>
#include <sstream>
#include <string_view>

namespace cs {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Process-wide threshold. Initialised from CS_LOG_LEVEL (debug|info|warn|
// error|off), default warn.
void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel level) noexcept;

std::optional<LogLevel> parse_log_level(std::string_view s);

// Writes "[tag] message" to stderr.
void log(LogLevel level, std::string_view tag, std::string_view message);

// Streams the parts into one message; nothing is formatted when the level
// is disabled.
template <typename... Parts>
void log_at(LogLevel level, std::string_view tag, const Parts&... parts) {
  if (!log_enabled(level)) return;
  std::ostringstream os;
  (os << ... << parts);
  log(level, tag, os.str());
}

template <typename... Parts>
void log_debug(std::string_view tag, const Parts&... parts) { log_at(LogLevel::Debug, tag, parts...); }
template <typename... Parts>
void log_info(std::string_view tag, const Parts&... parts) { log_at(LogLevel::Info, tag, parts...); }
template <typename... Parts>
void log_warn(std::string_view tag, const Parts&... parts) { log_at(LogLevel::Warn, tag, parts...); }
template <typename... Parts>
void log_error(std::string_view tag, const Parts&... parts) { log_at(LogLevel::Error, tag, parts...); }

}
