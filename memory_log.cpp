// memory_log.cpp
#include "memory_log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

LogLevel initial_level() {
  if (const char *env = std::getenv("CRDT_MEMORY_LOG_LEVEL")) {
    if (auto level = parse_log_level(env)) {
      return *level;
    }
  }
  return LogLevel::Info;
}

std::atomic<int> &threshold() {
  static std::atomic<int> level{static_cast<int>(initial_level())};
  return level;
}

std::mutex &output_mutex() {
  static std::mutex mutex;
  return mutex;
}

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "?";
}

} // namespace

void set_log_level(LogLevel level) { threshold().store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(threshold().load()); }

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  return std::nullopt;
}

void log_message(LogLevel level, const char *component, const std::string &message) {
  if (static_cast<int>(level) < threshold().load()) {
    return;
  }

  // Timestamp with milliseconds
  auto now = std::chrono::system_clock::now();
  auto now_time_t = std::chrono::system_clock::to_time_t(now);
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm local_tm{};
  localtime_r(&now_time_t, &local_tm);
  char time_buf[32];
  std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

  std::ostringstream line;
  line << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count() << "][" << level_name(level)
       << "][" << component << "] " << message << "\n";

  std::lock_guard<std::mutex> lock(output_mutex());
  std::cerr << line.str();
}
