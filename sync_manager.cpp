// sync_manager.cpp
#include "sync_manager.hpp"
#include "memory_errors.hpp"
#include "memory_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

constexpr const char *kComponent = "sync";

} // namespace

const char *sync_health_name(SyncHealth health) {
  switch (health) {
  case SyncHealth::Stopped:
    return "stopped";
  case SyncHealth::Healthy:
    return "healthy";
  case SyncHealth::Degraded:
    return "degraded";
  case SyncHealth::Unhealthy:
    return "unhealthy";
  case SyncHealth::Backlogged:
    return "backlogged";
  }
  return "unknown";
}

SyncManager::SyncManager(MemoryStorage &storage, SyncTransport &transport, SyncOptions options)
    : storage_(storage), transport_(transport), options_(options), interval_(options.interval) {
  options_.validate();
}

SyncManager::~SyncManager() { stop(); }

SyncResult SyncManager::sync() {
  SyncResult result = push_pending();
  // Outside cycle_mutex_ so the callback may call sync_now() or stop()
  record(result);
  return result;
}

SyncResult SyncManager::push_pending() {
  std::lock_guard<std::mutex> cycle(cycle_mutex_);
  auto started = std::chrono::steady_clock::now();

  SyncResult result;
  auto batch = storage_.get_pending_sync(options_.batch_size);
  if (batch.empty()) {
    result.success = true;
    return result;
  }

  log_debug(kComponent, "Pushing " + std::to_string(batch.size()) + " documents");

  bool accepted = false;
  try {
    accepted = transport_.push(batch);
    if (!accepted) {
      result.errors.push_back("push rejected by hub");
    }
  } catch (const SyncTransportError &e) {
    result.errors.push_back(e.what());
  } catch (const std::exception &e) {
    result.errors.push_back(std::string("transport error: ") + e.what());
  }

  if (accepted) {
    size_t flipped = storage_.mark_synced(batch);
    result.success = true;
    result.pushed = batch.size();
    if (flipped < batch.size()) {
      log_debug(kComponent, std::to_string(batch.size() - flipped) + " documents changed during push, kept pending");
    }
  } else {
    result.failed = batch.size();
    log_warn(kComponent, "Push of " + std::to_string(batch.size()) + " documents failed: " + result.errors.back());
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  return result;
}

size_t SyncManager::sync_now() { return sync().pushed; }

size_t SyncManager::pull(const std::string &query, size_t k) {
  auto remote = transport_.pull(query, k);

  size_t changed = 0;
  for (const auto &doc : remote) {
    if (storage_.merge_remote(doc) != MergeOutcome::Unchanged) {
      changed++;
    }
  }

  log_debug(kComponent, "Pulled " + std::to_string(remote.size()) + " documents for '" + query + "', " +
                            std::to_string(changed) + " changed");
  return changed;
}

void SyncManager::start(std::optional<std::chrono::milliseconds> interval) {
  if (interval && interval->count() <= 0) {
    throw ValidationError("sync interval must be positive");
  }

  // Restarted from the callback: the current loop keeps going unless stop() is joining it
  if (std::this_thread::get_id() == thread_id_.load()) {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!joining_) {
      interval_ = interval.value_or(options_.interval);
      running_ = true;
    }
    return;
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (running_) {
    return;
  }
  // A loop ended from its own callback is still joinable
  if (thread_.joinable()) {
    thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    interval_ = interval.value_or(options_.interval);
    running_ = true;
  }
  thread_ = std::thread([this]() {
    thread_id_ = std::this_thread::get_id();
    run_loop();
    thread_id_ = std::thread::id();
  });

  log_info(kComponent, "Sync loop started for replica " + storage_.replica_id());
}

void SyncManager::stop() {
  bool on_loop_thread = std::this_thread::get_id() == thread_id_.load();
  bool was_running;
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    was_running = running_.exchange(false);
    if (!on_loop_thread) {
      joining_ = true;
    }
  }
  wake_.notify_all();

  // Called from the callback: the loop exits after this cycle and is joined later
  if (on_loop_thread) {
    return;
  }

  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (thread_.joinable()) {
      thread_.join();
    }
  }
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    joining_ = false;
  }

  if (was_running) {
    log_info(kComponent, "Sync loop stopped");
  }
}

void SyncManager::on_sync_complete(SyncCallback callback) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  callback_ = std::move(callback);
}

SyncHealth SyncManager::health() {
  if (!running_) {
    return SyncHealth::Stopped;
  }

  size_t failures;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    failures = stats_.consecutive_failures;
  }
  if (failures >= kUnhealthyAfterFailures) {
    return SyncHealth::Unhealthy;
  }
  if (failures > 0) {
    return SyncHealth::Degraded;
  }
  if (storage_.pending_count() > kBackloggedPending) {
    return SyncHealth::Backlogged;
  }
  return SyncHealth::Healthy;
}

SyncStats SyncManager::stats() {
  size_t pending = storage_.pending_count();
  std::lock_guard<std::mutex> lock(stats_mutex_);
  SyncStats snapshot = stats_;
  snapshot.pending_count = pending;
  return snapshot;
}

void SyncManager::run_loop() {
  while (running_) {
    bool ok = run_cycle();

    std::chrono::milliseconds delay;
    if (ok) {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      delay = interval_;
    } else {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      delay = backoff_delay(stats_.consecutive_failures);
    }

    if (!ok) {
      log_info(kComponent, "Retrying in " + std::to_string(delay.count()) + " ms");
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, delay, [this]() { return !running_.load(); });
  }
}

bool SyncManager::run_cycle() {
  try {
    return sync().success;
  } catch (const std::exception &e) {
    // Storage errors end this cycle only; the next one retries
    log_error(kComponent, std::string("Sync cycle failed: ") + e.what());
    SyncResult result;
    result.errors.push_back(e.what());
    record(result);
    return false;
  }
}

void SyncManager::record(const SyncResult &result) {
  SyncCallback callback;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.cycles++;
    stats_.total_synced += result.pushed;
    stats_.total_failed += result.failed;
    stats_.last_duration = result.duration;
    if (result.success) {
      stats_.consecutive_failures = 0;
      stats_.last_sync_time = std::chrono::system_clock::now();
    } else {
      stats_.consecutive_failures++;
    }
    callback = callback_;
  }

  if (callback) {
    try {
      callback(result);
    } catch (const std::exception &e) {
      log_warn(kComponent, std::string("on_sync_complete callback threw: ") + e.what());
    }
  }
}

std::chrono::milliseconds SyncManager::backoff_delay(size_t consecutive_failures) const {
  auto delay = options_.initial_backoff;
  for (size_t i = 1; i < consecutive_failures && delay < options_.max_backoff; i++) {
    delay *= 2;
  }
  return std::min(delay, options_.max_backoff);
}
