// sync_manager.hpp
#ifndef SYNC_MANAGER_HPP
#define SYNC_MANAGER_HPP

#include "memory_config.hpp"
#include "memory_document.hpp"
#include "memory_sqlite.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/// Connection to the sync hub. Documents are exchanged as full CRDT snapshots.
///
/// Implementations may block on I/O and may throw SyncTransportError.
class SyncTransport {
public:
  virtual ~SyncTransport() = default;

  /// Delivers `batch` to the hub. Returns true once the hub has accepted all of it.
  virtual bool push(const std::vector<MemoryDocument> &batch) = 0;

  /// Fetches up to `k` documents relevant to `query`.
  virtual std::vector<MemoryDocument> pull(const std::string &query, size_t k) = 0;
};

/// Outcome of one sync cycle
struct SyncResult {
  bool success = false;
  size_t pushed = 0;
  size_t failed = 0;
  std::vector<std::string> errors;
  std::chrono::milliseconds duration{0};
};

struct SyncStats {
  size_t total_synced = 0;
  size_t total_failed = 0;
  size_t cycles = 0;
  size_t consecutive_failures = 0;
  size_t pending_count = 0;
  std::optional<std::chrono::system_clock::time_point> last_sync_time;
  std::chrono::milliseconds last_duration{0};
};

enum class SyncHealth { Stopped, Healthy, Degraded, Unhealthy, Backlogged };

const char *sync_health_name(SyncHealth health);

/// Pushes locally pending documents to the hub and merges documents pulled from it.
///
/// Delivery is at-least-once: a document is marked synced only after the push that
/// carried it was confirmed, and only if it was not rewritten in the meantime. A crash
/// between push and mark_synced repeats the push, which the hub absorbs by merging.
///
/// The background loop runs one cycle, then waits `interval` after a success or an
/// exponential backoff (doubling from `initial_backoff` up to `max_backoff`) after a
/// failure. A failing cycle never ends the loop.
class SyncManager {
public:
  static constexpr size_t kUnhealthyAfterFailures = 5;
  static constexpr size_t kBackloggedPending = 1000;

  using SyncCallback = std::function<void(const SyncResult &)>;

  /// @throws ValidationError if `options` is invalid
  SyncManager(MemoryStorage &storage, SyncTransport &transport, SyncOptions options = SyncOptions());

  ~SyncManager();

  SyncManager(const SyncManager &) = delete;
  SyncManager &operator=(const SyncManager &) = delete;

  /// Runs one push cycle on the calling thread.
  ///
  /// An empty queue is a successful no-op. Transport failures are reported in the
  /// result and leave the batch pending; storage failures propagate as StorageError.
  SyncResult sync();

  /// Forces an immediate cycle. Returns the number of documents pushed.
  size_t sync_now();

  /// Pulls up to `k` documents for `query` and merges each into storage.
  ///
  /// @return number of documents that changed local state
  /// @throws SyncTransportError if the pull fails
  size_t pull(const std::string &query, size_t k);

  /// Starts the background loop. No-op if already running.
  void start(std::optional<std::chrono::milliseconds> interval = std::nullopt);

  /// Wakes the loop, waits for the cycle in progress and joins the thread.
  ///
  /// From the completion callback it only asks the loop to end; the thread is
  /// joined by the next start(), stop() or the destructor.
  void stop();

  bool is_running() const { return running_; }

  /// Called after every cycle, from the thread that ran it, once the cycle lock is
  /// released. The callback may call sync_now(), start() or stop().
  void on_sync_complete(SyncCallback callback);

  SyncHealth health();

  SyncStats stats();

  const SyncOptions &options() const { return options_; }

private:
  void run_loop();

  /// One push under cycle_mutex_, without recording it
  SyncResult push_pending();

  /// Background cycle: never throws, returns whether it succeeded
  bool run_cycle();

  void record(const SyncResult &result);

  std::chrono::milliseconds backoff_delay(size_t consecutive_failures) const;

  MemoryStorage &storage_;
  SyncTransport &transport_;
  SyncOptions options_;

  std::mutex cycle_mutex_;
  std::mutex stats_mutex_;
  SyncStats stats_;
  SyncCallback callback_;

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::atomic<std::thread::id> thread_id_{};
  std::mutex lifecycle_mutex_;
  bool joining_ = false; // guarded by wake_mutex_
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::chrono::milliseconds interval_;
};

#endif // SYNC_MANAGER_HPP
