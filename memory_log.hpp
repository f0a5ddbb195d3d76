// memory_log.hpp
#ifndef MEMORY_LOG_HPP
#define MEMORY_LOG_HPP

#include <optional>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Sets the minimum level that gets written. Thread-safe.
void set_log_level(LogLevel level);

LogLevel log_level();

/// Parses "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string &name);

/// Writes `[HH:MM:SS.mmm][LEVEL][component] message` to stderr if `level` is enabled.
///
/// The initial threshold is Info, or the value of CRDT_MEMORY_LOG_LEVEL when set.
void log_message(LogLevel level, const char *component, const std::string &message);

inline void log_debug(const char *component, const std::string &message) {
  log_message(LogLevel::Debug, component, message);
}

inline void log_info(const char *component, const std::string &message) {
  log_message(LogLevel::Info, component, message);
}

inline void log_warn(const char *component, const std::string &message) {
  log_message(LogLevel::Warn, component, message);
}

inline void log_error(const char *component, const std::string &message) {
  log_message(LogLevel::Error, component, message);
}

#endif // MEMORY_LOG_HPP
