// Example: two replicas syncing memories through a shared hub
#include "memory_config.hpp"
#include "memory_errors.hpp"
#include "memory_log.hpp"
#include "memory_sqlite.hpp"
#include "sync_manager.hpp"
#include <cmath>
#include <iostream>
#include <string>

// Hub backed by its own storage; pull matches a tag, or everything for an empty query
class StorageHub : public SyncTransport {
public:
  StorageHub() : hub_(":memory:", "hub") {}

  bool push(const std::vector<MemoryDocument> &batch) override {
    for (const auto &doc : batch) {
      hub_.merge_remote(doc);
    }
    return true;
  }

  std::vector<MemoryDocument> pull(const std::string &query, size_t k) override {
    auto docs = query.empty() ? hub_.all() : hub_.query_by_tag(query);
    if (docs.size() > k) {
      docs.resize(k, docs.front());
    }
    return docs;
  }

private:
  MemoryStorage hub_;
};

// Character histogram, good enough to show the embedding cache
class HistogramEmbedder : public EmbeddingProvider {
public:
  std::vector<float> embed(const std::string &content, const std::string &) override {
    std::vector<float> vector(16, 0.0f);
    for (unsigned char c : content) {
      vector[c % vector.size()] += 1.0f;
    }
    float norm = 0.0f;
    for (float v : vector) {
      norm += v * v;
    }
    if (norm > 0.0f) {
      for (float &v : vector) {
        v /= std::sqrt(norm);
      }
    }
    return vector;
  }
};

void print_document(const char *label, const MemoryDocument &doc) {
  std::cout << label << ": " << doc.id() << " [" << memory_type_name(doc.memory_type()) << "] '"
            << doc.content_text() << "' importance=" << doc.importance.value() << " tags=";
  for (const auto &tag : doc.tags.elements()) {
    std::cout << tag << " ";
  }
  std::cout << "status=" << sync_status_name(doc.sync_status()) << std::endl;
}

int main() {
  try {
    MemoryConfig base;
    base.replica_id = "laptop";
    MemoryConfig config = MemoryConfig::from_env(base);
    config.validate();

    StorageHub hub;
    MemoryStorage laptop(config.database_path.c_str(), config.replica_id);
    MemoryStorage desktop(":memory:", "desktop");
    SyncManager laptop_sync(laptop, hub, config.sync_options());
    SyncManager desktop_sync(desktop, hub, config.sync_options());

    laptop_sync.on_sync_complete([](const SyncResult &result) {
      std::cout << "laptop sync: pushed=" << result.pushed << " failed=" << result.failed << std::endl;
    });

    // Laptop writes a memory and pushes it
    auto memory = MemoryDocument::create("User prefers dark mode", MemoryType::Episodic, laptop.replica_id());
    memory.add_tag("preference", laptop.replica_id());
    memory.set_importance(0.9, laptop.replica_id());
    laptop.put(memory);
    laptop_sync.sync();

    // Desktop pulls it, edits concurrently with the laptop, and both sync
    desktop_sync.pull("preference", 10);
    auto copy = *desktop.get(memory.id());
    copy.add_tag("ui", desktop.replica_id());
    desktop.put(copy);

    auto local = *laptop.get(memory.id());
    local.set_content("User prefers dark mode in every editor", laptop.replica_id());
    local.record_access(laptop.replica_id());
    laptop.put(local);

    desktop_sync.sync();
    laptop_sync.sync();
    laptop_sync.pull("", 10);
    desktop_sync.pull("", 10);

    print_document("laptop ", *laptop.get(memory.id()));
    print_document("desktop", *desktop.get(memory.id()));
    std::cout << "converged: " << (*laptop.get(memory.id()) == *desktop.get(memory.id()) ? "yes" : "no") << std::endl;

    HistogramEmbedder embedder;
    auto embedding = laptop.ensure_embedding(*laptop.get(memory.id()), embedder, config.embedding_model);
    std::cout << "embedding " << embedding.content_hash.substr(0, 12) << "... dims=" << embedding.dimensions()
              << std::endl;

    for (const auto &candidate : laptop.promotion_candidates(config.promotion_threshold, 10)) {
      print_document("promote", candidate);
    }

    auto stats = laptop_sync.stats();
    std::cout << "laptop stats: synced=" << stats.total_synced << " cycles=" << stats.cycles
              << " pending=" << stats.pending_count << " health=" << sync_health_name(laptop_sync.health())
              << std::endl;
  } catch (const MemoryError &e) {
    log_error("demo", e.what());
    return 1;
  }
  return 0;
}
