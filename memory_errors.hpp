// memory_errors.hpp
#ifndef MEMORY_ERRORS_HPP
#define MEMORY_ERRORS_HPP

#include <stdexcept>
#include <string>

/// Base class of every error raised by the memory store.
///
/// CRDT merges never throw; only storage, transport and input validation do.
class MemoryError : public std::runtime_error {
public:
  explicit MemoryError(const std::string &msg) : std::runtime_error(msg) {}
};

/// I/O or corruption error from the persistent store. Retryable by the caller.
class StorageError : public MemoryError {
public:
  explicit StorageError(const std::string &msg, int sqlite_code = 0) : MemoryError(msg), sqlite_code_(sqlite_code) {}

  /// Raw SQLite result code, 0 when the error did not come from SQLite.
  int sqlite_code() const { return sqlite_code_; }

  /// True when repeating the same call later can succeed (lock contention, transient I/O).
  bool retryable() const;

private:
  int sqlite_code_;
};

/// Push or pull against the sync hub failed. Non-fatal; retried next cycle.
class SyncTransportError : public MemoryError {
public:
  explicit SyncTransportError(const std::string &msg) : MemoryError(msg) {}
};

/// Malformed input rejected synchronously (empty id, mismatched merge, bad config).
class ValidationError : public MemoryError {
public:
  explicit ValidationError(const std::string &msg) : MemoryError(msg) {}
};

#endif // MEMORY_ERRORS_HPP
