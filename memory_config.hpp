// memory_config.hpp
#ifndef MEMORY_CONFIG_HPP
#define MEMORY_CONFIG_HPP

#include "crdt.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/// Settings of the background sync loop
struct SyncOptions {
  size_t batch_size = 100;
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  std::chrono::milliseconds initial_backoff{std::chrono::seconds(1)};
  std::chrono::milliseconds max_backoff{std::chrono::seconds(300)};

  /// @throws ValidationError on a zero batch size or a non-positive duration
  void validate() const;
};

/// Typed configuration of one replica
///
/// Values are plain fields so hosts can fill them from any source. `from_env`
/// overlays the CRDT_MEMORY_* environment variables:
///
///   CRDT_MEMORY_REPLICA_ID           replica_id
///   CRDT_MEMORY_DB_PATH              database_path
///   CRDT_MEMORY_BATCH_SIZE           sync_batch_size
///   CRDT_MEMORY_SYNC_INTERVAL_S      sync_interval (seconds, fractional allowed)
///   CRDT_MEMORY_MAX_BACKOFF_S        max_backoff (seconds, fractional allowed)
///   CRDT_MEMORY_PROMOTION_THRESHOLD  promotion_threshold
///   CRDT_MEMORY_EMBEDDING_MODEL      embedding_model
struct MemoryConfig {
  CrdtReplicaId replica_id;
  std::string database_path = ":memory:";
  size_t sync_batch_size = 100;
  std::chrono::milliseconds sync_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds max_backoff{std::chrono::seconds(300)};
  double promotion_threshold = 0.8;
  std::string embedding_model = "default";

  /// @throws ValidationError naming the first invalid field
  void validate() const;

  SyncOptions sync_options() const;

  /// Returns `base` with every set CRDT_MEMORY_* variable applied.
  ///
  /// @throws ValidationError if a variable is set but cannot be parsed
  static MemoryConfig from_env(MemoryConfig base);

  /// Defaults overlaid with the environment.
  static MemoryConfig from_env();
};

/// Value of an environment variable, nullopt when unset
std::optional<std::string> env_value(const char *name);

#endif // MEMORY_CONFIG_HPP
