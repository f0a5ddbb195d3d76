// test_sync_manager.cpp
#include "sync_manager.hpp"
#include "memory_errors.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) \
  do { \
    std::cout << "Running test: " << #name << "..."; \
    test_##name(); \
    std::cout << " PASSED" << std::endl; \
  } while (0)

#define ASSERT_EQ(a, b) \
  do { \
    if ((a) != (b)) { \
      std::cerr << "Assertion failed: " << #a << " == " << #b \
                << " (got " << (a) << " and " << (b) << ")" << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_TRUE(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "Assertion failed: " << #cond << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

/// Sync hub kept in memory. Can be told to fail pushes or pulls.
class InMemoryHub : public SyncTransport {
public:
  bool push(const std::vector<MemoryDocument> &batch) override {
    std::lock_guard<std::mutex> lock(mutex_);
    pushes_++;
    if (push_failures_ > 0) {
      push_failures_--;
      throw SyncTransportError("hub unreachable");
    }
    if (reject_) {
      return false;
    }
    for (const auto &doc : batch) {
      documents_.put(doc);
      received_++;
    }
    return true;
  }

  std::vector<MemoryDocument> pull(const std::string &query, size_t k) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_pulls_) {
      throw SyncTransportError("hub unreachable");
    }
    std::vector<MemoryDocument> result;
    for (const auto &doc : documents_.all()) {
      if (result.size() >= k)
        break;
      if (query.empty() || doc.tags.contains(query) || doc.content_text().find(query) != std::string::npos) {
        result.push_back(doc);
      }
    }
    return result;
  }

  void fail_next_pushes(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_failures_ = count;
  }

  void set_reject(bool reject) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_ = reject;
  }

  void set_fail_pulls(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_pulls_ = fail;
  }

  size_t pushes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushes_;
  }

  size_t received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  std::optional<MemoryDocument> get(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.get(id);
  }

private:
  std::mutex mutex_;
  MemoryCollection documents_;
  size_t push_failures_ = 0;
  bool reject_ = false;
  bool fail_pulls_ = false;
  size_t pushes_ = 0;
  size_t received_ = 0;
};

template <typename Predicate> bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

SyncOptions fast_options() {
  SyncOptions options;
  options.batch_size = 10;
  options.interval = 20ms;
  options.initial_backoff = 5ms;
  options.max_backoff = 20ms;
  return options;
}

MemoryDocument make_doc(const std::string &id, const CrdtReplicaId &replica) {
  MemoryDocument doc(id, MemoryType::Semantic, replica, 1.0);
  doc.set_content("note " + id, replica, 1.0);
  return doc;
}

// Test 1: a second sync with no new writes pushes nothing
TEST(sync_idempotence) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager manager(storage, hub, fast_options());

  storage.put(make_doc("mem-1", "r1"));
  storage.put(make_doc("mem-2", "r1"));

  auto first = manager.sync();
  ASSERT_TRUE(first.success);
  ASSERT_EQ(first.pushed, 2u);
  ASSERT_EQ(storage.pending_count(), 0u);

  auto second = manager.sync();
  ASSERT_TRUE(second.success);
  ASSERT_EQ(second.pushed, 0u);
  ASSERT_EQ(hub.pushes(), 1u);
  ASSERT_EQ(hub.received(), 2u);
  ASSERT_EQ(manager.sync_now(), 0u);
}

TEST(batch_size_limits_push) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncOptions options = fast_options();
  options.batch_size = 2;
  SyncManager manager(storage, hub, options);

  for (int i = 0; i < 5; i++) {
    storage.put(make_doc("mem-" + std::to_string(i), "r1"));
  }

  ASSERT_EQ(manager.sync().pushed, 2u);
  ASSERT_EQ(storage.pending_count(), 3u);
  ASSERT_EQ(manager.sync_now(), 2u);
  ASSERT_EQ(manager.sync_now(), 1u);
  ASSERT_EQ(storage.pending_count(), 0u);
}

TEST(failed_push_keeps_documents_pending) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager manager(storage, hub, fast_options());

  storage.put(make_doc("mem-1", "r1"));
  hub.fail_next_pushes(1);

  auto failed = manager.sync();
  ASSERT_FALSE(failed.success);
  ASSERT_EQ(failed.failed, 1u);
  ASSERT_EQ(failed.errors.size(), 1u);
  ASSERT_EQ(storage.pending_count(), 1u);
  ASSERT_EQ(manager.stats().consecutive_failures, 1u);

  hub.set_reject(true);
  ASSERT_FALSE(manager.sync().success);
  ASSERT_EQ(storage.pending_count(), 1u);
  ASSERT_EQ(manager.stats().consecutive_failures, 2u);

  hub.set_reject(false);
  auto recovered = manager.sync();
  ASSERT_TRUE(recovered.success);
  ASSERT_EQ(recovered.pushed, 1u);
  ASSERT_EQ(storage.pending_count(), 0u);

  auto stats = manager.stats();
  ASSERT_EQ(stats.consecutive_failures, 0u);
  ASSERT_EQ(stats.total_failed, 2u);
  ASSERT_EQ(stats.total_synced, 1u);
  ASSERT_EQ(stats.cycles, 3u);
  ASSERT_TRUE(stats.last_sync_time.has_value());
}

TEST(pull_merges_remote_documents) {
  MemoryStorage remote_storage(":memory:", "r2");
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager remote(remote_storage, hub, fast_options());
  SyncManager local(storage, hub, fast_options());

  auto doc = make_doc("mem-1", "r2");
  doc.add_tag("preference", "r2");
  remote_storage.put(doc);
  remote_storage.put(make_doc("mem-2", "r2"));
  remote.sync();

  ASSERT_EQ(local.pull("preference", 10), 1u);
  ASSERT_TRUE(storage.contains("mem-1"));
  ASSERT_FALSE(storage.contains("mem-2"));
  ASSERT_TRUE(storage.get("mem-1")->sync_status() == SyncStatus::Synced);

  ASSERT_EQ(local.pull("", 10), 1u);
  ASSERT_EQ(local.pull("", 10), 0u);
  ASSERT_EQ(storage.count(), 2u);
  ASSERT_EQ(storage.pending_count(), 0u);

  hub.set_fail_pulls(true);
  bool thrown = false;
  try {
    local.pull("", 10);
  } catch (const SyncTransportError &) {
    thrown = true;
  }
  ASSERT_TRUE(thrown);
}

// Test 5: concurrent importance writes converge on the later timestamp
TEST(importance_scenario_converges) {
  MemoryStorage storage1(":memory:", "r1");
  MemoryStorage storage2(":memory:", "r2");
  InMemoryHub hub;
  SyncManager sync1(storage1, hub, fast_options());
  SyncManager sync2(storage2, hub, fast_options());

  auto doc = make_doc("mem-1", "r1");
  storage1.put(doc);
  sync1.sync();
  sync2.pull("", 10);

  auto at_r1 = *storage1.get("mem-1");
  at_r1.set_importance(0.9, "r1", 10.0);
  storage1.put(at_r1);

  auto at_r2 = *storage2.get("mem-1");
  at_r2.set_importance(0.7, "r2", 12.0);
  storage2.put(at_r2);

  ASSERT_TRUE(sync1.sync().success);
  ASSERT_TRUE(sync2.sync().success);
  sync1.pull("", 10);
  sync2.pull("", 10);
  // Merging the pulls may leave something the hub has not seen yet
  sync1.sync();
  sync2.sync();
  sync1.pull("", 10);
  sync2.pull("", 10);

  auto final1 = storage1.get("mem-1");
  auto final2 = storage2.get("mem-1");
  ASSERT_EQ(final1->importance.value(), 0.7);
  ASSERT_EQ(final2->importance.value(), 0.7);
  ASSERT_TRUE(*final1 == *final2);
  ASSERT_TRUE(*hub.get("mem-1") == *final1);
  ASSERT_EQ(storage1.pending_count(), 0u);
  ASSERT_EQ(storage2.pending_count(), 0u);
}

TEST(offline_tags_scenario) {
  MemoryStorage storage1(":memory:", "r1");
  MemoryStorage storage2(":memory:", "r2");
  InMemoryHub hub;
  SyncManager sync1(storage1, hub, fast_options());
  SyncManager sync2(storage2, hub, fast_options());

  auto doc = make_doc("mem-1", "r1");
  storage1.put(doc);
  sync1.sync();
  sync2.pull("", 10);

  doc.add_tag("preference", "r1");
  doc.add_tag("style", "r1");
  storage1.put(doc);
  sync1.sync();

  // r2 is offline while it tags its copy
  auto offline = *storage2.get("mem-1");
  offline.add_tag("urgent", "r2");
  storage2.put(offline);
  hub.fail_next_pushes(3);
  ASSERT_FALSE(sync2.sync().success);
  ASSERT_FALSE(sync2.sync().success);
  ASSERT_EQ(storage2.pending_count(), 1u);

  // Pull is independent of push
  hub.fail_next_pushes(0);
  sync2.pull("", 10);
  ASSERT_TRUE(sync2.sync().success);
  sync1.pull("", 10);

  auto expected = CrdtVector<std::string>{"preference", "style", "urgent"};
  ASSERT_TRUE(storage1.get("mem-1")->tags.elements() == expected);
  ASSERT_TRUE(storage2.get("mem-1")->tags.elements() == expected);
  ASSERT_TRUE(*storage1.get("mem-1") == *storage2.get("mem-1"));
}

TEST(background_loop_self_heals) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager manager(storage, hub, fast_options());

  for (int i = 0; i < 5; i++) {
    storage.put(make_doc("mem-" + std::to_string(i), "r1"));
  }
  hub.fail_next_pushes(3);

  std::atomic<int> callbacks{0};
  manager.on_sync_complete([&](const SyncResult &) { callbacks++; });

  manager.start();
  ASSERT_TRUE(manager.is_running());
  ASSERT_TRUE(wait_until([&]() { return storage.pending_count() == 0; }));

  // Writes made while the loop runs are picked up by a later cycle
  storage.put(make_doc("late", "r1"));
  ASSERT_TRUE(wait_until([&]() { return storage.pending_count() == 0; }));
  manager.stop();
  ASSERT_FALSE(manager.is_running());

  auto stats = manager.stats();
  ASSERT_EQ(stats.total_failed, 15u);
  ASSERT_EQ(stats.total_synced, 6u);
  ASSERT_EQ(stats.consecutive_failures, 0u);
  ASSERT_TRUE(callbacks.load() >= 4);
  ASSERT_TRUE(hub.get("late").has_value());
}

TEST(health) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncOptions options = fast_options();
  options.initial_backoff = 10s;
  options.max_backoff = 10s;
  options.interval = 10s;
  SyncManager manager(storage, hub, options);

  ASSERT_TRUE(manager.health() == SyncHealth::Stopped);

  storage.put(make_doc("mem-1", "r1"));
  hub.fail_next_pushes(100);
  manager.start();
  ASSERT_TRUE(wait_until([&]() { return manager.stats().cycles >= 1; }));
  ASSERT_TRUE(manager.health() == SyncHealth::Degraded);

  for (int i = 0; i < 4; i++) {
    manager.sync();
  }
  ASSERT_TRUE(manager.health() == SyncHealth::Unhealthy);

  // stop() does not wait out the backoff
  auto before_stop = std::chrono::steady_clock::now();
  manager.stop();
  ASSERT_TRUE(std::chrono::steady_clock::now() - before_stop < 5s);
  ASSERT_TRUE(manager.health() == SyncHealth::Stopped);
}

TEST(health_backlogged) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncOptions options = fast_options();
  options.batch_size = 1;
  options.interval = 10s;
  SyncManager manager(storage, hub, options);

  for (size_t i = 0; i < SyncManager::kBackloggedPending + 2; i++) {
    storage.put(make_doc("mem-" + std::to_string(i), "r1"));
  }

  manager.start();
  ASSERT_TRUE(wait_until([&]() { return manager.stats().cycles >= 1; }));
  ASSERT_TRUE(manager.health() == SyncHealth::Backlogged);
  manager.stop();
}

TEST(callback_errors_do_not_break_sync) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager manager(storage, hub, fast_options());

  manager.on_sync_complete([](const SyncResult &) { throw std::runtime_error("observer failed"); });
  storage.put(make_doc("mem-1", "r1"));

  auto result = manager.sync();
  ASSERT_TRUE(result.success);
  ASSERT_EQ(storage.pending_count(), 0u);
}

TEST(start_stop) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncManager manager(storage, hub, fast_options());

  manager.stop();
  manager.start(50ms);
  manager.start();
  ASSERT_TRUE(manager.is_running());
  manager.stop();
  manager.stop();
  ASSERT_FALSE(manager.is_running());

  // Restart after stop
  storage.put(make_doc("mem-1", "r1"));
  manager.start();
  ASSERT_TRUE(wait_until([&]() { return storage.pending_count() == 0; }));
}

TEST(stop_from_callback) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  {
    SyncManager manager(storage, hub, fast_options());
    std::atomic<int> calls{0};
    manager.on_sync_complete([&](const SyncResult &) {
      calls++;
      manager.stop();
    });

    manager.start();
    ASSERT_TRUE(wait_until([&]() { return !manager.is_running(); }));
    ASSERT_TRUE(wait_until([&]() { return calls.load() >= 1; }));

    // The loop can be started again and stopped normally
    manager.on_sync_complete(nullptr);
    storage.put(make_doc("mem-1", "r1"));
    manager.start();
    ASSERT_TRUE(manager.is_running());
    ASSERT_TRUE(wait_until([&]() { return storage.pending_count() == 0; }));
    manager.on_sync_complete([&](const SyncResult &) { manager.stop(); });
    ASSERT_TRUE(wait_until([&]() { return !manager.is_running(); }));
    // Leaving scope joins the finished loop thread
  }
  ASSERT_EQ(hub.received(), 1u);
}

TEST(sync_now_from_callback) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;
  SyncOptions options = fast_options();
  options.batch_size = 1;
  SyncManager manager(storage, hub, options);

  storage.put(make_doc("mem-1", "r1"));
  storage.put(make_doc("mem-2", "r1"));

  bool nested = false;
  size_t pushed_by_callback = 0;
  manager.on_sync_complete([&](const SyncResult &) {
    if (nested)
      return;
    nested = true;
    pushed_by_callback = manager.sync_now();
    nested = false;
  });

  ASSERT_EQ(manager.sync().pushed, 1u);
  ASSERT_EQ(pushed_by_callback, 1u);
  ASSERT_EQ(storage.pending_count(), 0u);
  ASSERT_EQ(manager.stats().cycles, 2u);
}

/// Transport failing with an error outside the SyncTransportError family
class BrokenTransport : public SyncTransport {
public:
  bool push(const std::vector<MemoryDocument> &) override { throw std::runtime_error("socket closed"); }

  std::vector<MemoryDocument> pull(const std::string &, size_t) override {
    throw std::runtime_error("socket closed");
  }
};

TEST(unexpected_transport_errors_are_counted) {
  MemoryStorage storage(":memory:", "r1");
  BrokenTransport transport;
  SyncManager manager(storage, transport, fast_options());

  storage.put(make_doc("mem-1", "r1"));
  auto result = manager.sync();
  ASSERT_FALSE(result.success);
  ASSERT_EQ(result.failed, 1u);
  ASSERT_EQ(result.errors.size(), 1u);
  ASSERT_EQ(storage.pending_count(), 1u);

  auto stats = manager.stats();
  ASSERT_EQ(stats.cycles, 1u);
  ASSERT_EQ(stats.consecutive_failures, 1u);
  ASSERT_EQ(stats.total_failed, 1u);
}

TEST(invalid_options) {
  MemoryStorage storage(":memory:", "r1");
  InMemoryHub hub;

  SyncOptions options = fast_options();
  options.batch_size = 0;
  bool thrown = false;
  try {
    SyncManager manager(storage, hub, options);
  } catch (const ValidationError &) {
    thrown = true;
  }
  ASSERT_TRUE(thrown);

  SyncManager manager(storage, hub, fast_options());
  thrown = false;
  try {
    manager.start(0ms);
  } catch (const ValidationError &) {
    thrown = true;
  }
  ASSERT_TRUE(thrown);
  ASSERT_FALSE(manager.is_running());
}

int main() {
  std::cout << "Running SyncManager tests..." << std::endl << std::endl;

  RUN_TEST(sync_idempotence);
  RUN_TEST(batch_size_limits_push);
  RUN_TEST(failed_push_keeps_documents_pending);
  RUN_TEST(pull_merges_remote_documents);
  RUN_TEST(importance_scenario_converges);
  RUN_TEST(offline_tags_scenario);
  RUN_TEST(background_loop_self_heals);
  RUN_TEST(health);
  RUN_TEST(health_backlogged);
  RUN_TEST(callback_errors_do_not_break_sync);
  RUN_TEST(start_stop);
  RUN_TEST(stop_from_callback);
  RUN_TEST(sync_now_from_callback);
  RUN_TEST(unexpected_transport_errors_are_counted);
  RUN_TEST(invalid_options);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
