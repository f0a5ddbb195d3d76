// memory_config.cpp
#include "memory_config.hpp"
#include "memory_errors.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace {

size_t parse_size(const char *name, const std::string &text) {
  errno = 0;
  char *end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (text.empty() || text[0] == '-' || errno != 0 || *end != '\0') {
    throw ValidationError(std::string(name) + ": expected a non-negative integer, got '" + text + "'");
  }
  return static_cast<size_t>(value);
}

double parse_double(const char *name, const std::string &text) {
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (text.empty() || errno != 0 || *end != '\0' || !std::isfinite(value)) {
    throw ValidationError(std::string(name) + ": expected a number, got '" + text + "'");
  }
  return value;
}

std::chrono::milliseconds parse_seconds(const char *name, const std::string &text) {
  double seconds = parse_double(name, text);
  if (seconds < 0) {
    throw ValidationError(std::string(name) + ": must not be negative");
  }
  return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

} // namespace

void SyncOptions::validate() const {
  if (batch_size == 0) {
    throw ValidationError("sync batch size must be greater than zero");
  }
  if (interval.count() <= 0) {
    throw ValidationError("sync interval must be positive");
  }
  if (initial_backoff.count() <= 0) {
    throw ValidationError("initial backoff must be positive");
  }
  if (max_backoff < initial_backoff) {
    throw ValidationError("max backoff must not be shorter than the initial backoff");
  }
}

void MemoryConfig::validate() const {
  if (replica_id.empty()) {
    throw ValidationError("replica_id is required");
  }
  if (database_path.empty()) {
    throw ValidationError("database_path must not be empty");
  }
  if (!std::isfinite(promotion_threshold) || promotion_threshold < 0.0 || promotion_threshold > 1.0) {
    throw ValidationError("promotion_threshold must be within [0, 1]");
  }
  if (embedding_model.empty()) {
    throw ValidationError("embedding_model must not be empty");
  }
  sync_options().validate();
}

SyncOptions MemoryConfig::sync_options() const {
  SyncOptions options;
  options.batch_size = sync_batch_size;
  options.interval = sync_interval;
  options.max_backoff = max_backoff;
  if (options.initial_backoff > max_backoff) {
    options.initial_backoff = max_backoff;
  }
  return options;
}

MemoryConfig MemoryConfig::from_env(MemoryConfig base) {
  if (auto value = env_value("CRDT_MEMORY_REPLICA_ID")) {
    base.replica_id = *value;
  }
  if (auto value = env_value("CRDT_MEMORY_DB_PATH")) {
    base.database_path = *value;
  }
  if (auto value = env_value("CRDT_MEMORY_BATCH_SIZE")) {
    base.sync_batch_size = parse_size("CRDT_MEMORY_BATCH_SIZE", *value);
  }
  if (auto value = env_value("CRDT_MEMORY_SYNC_INTERVAL_S")) {
    base.sync_interval = parse_seconds("CRDT_MEMORY_SYNC_INTERVAL_S", *value);
  }
  if (auto value = env_value("CRDT_MEMORY_MAX_BACKOFF_S")) {
    base.max_backoff = parse_seconds("CRDT_MEMORY_MAX_BACKOFF_S", *value);
  }
  if (auto value = env_value("CRDT_MEMORY_PROMOTION_THRESHOLD")) {
    base.promotion_threshold = parse_double("CRDT_MEMORY_PROMOTION_THRESHOLD", *value);
  }
  if (auto value = env_value("CRDT_MEMORY_EMBEDDING_MODEL")) {
    base.embedding_model = *value;
  }
  return base;
}

MemoryConfig MemoryConfig::from_env() { return from_env(MemoryConfig()); }

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return std::nullopt;
}
