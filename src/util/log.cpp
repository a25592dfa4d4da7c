#include "chunk_stream/log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace cs {

static LogLevel level_from_env() {
  const char* v = std::getenv("CS_LOG_LEVEL");
  if (!v || !*v) return LogLevel::Warn;
  return parse_log_level(v).value_or(LogLevel::Warn);
}

static std::atomic<int>& level_slot() {
  static std::atomic<int> lvl{static_cast<int>(level_from_env())};
  return lvl;
}

static std::mutex& sink_mutex() {
  static std::mutex mu;
  return mu;
}

void set_log_level(LogLevel level) noexcept { level_slot().store(static_cast<int>(level)); }

LogLevel log_level() noexcept { return static_cast<LogLevel>(level_slot().load()); }

bool log_enabled(LogLevel level) noexcept {
  return level != LogLevel::Off && static_cast<int>(level) >= level_slot().load();
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  std::string l(s);
  for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "debug") return LogLevel::Debug;
  if (l == "info")  return LogLevel::Info;
  if (l == "warn" || l == "warning") return LogLevel::Warn;
  if (l == "error") return LogLevel::Error;
  if (l == "off" || l == "none") return LogLevel::Off;
  return std::nullopt;
}

void log(LogLevel level, std::string_view tag, std::string_view message) {
  if (!log_enabled(level)) return;
  std::lock_guard<std::mutex> lk(sink_mutex());
  std::cerr << "[" << tag << "] " << message << "\n";
}

}
