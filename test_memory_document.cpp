// test_memory_document.cpp
#include "memory_document.hpp"
#include "memory_errors.hpp"
#include "memory_ids.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

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

#define ASSERT_THROWS(expr, type) \
  do { \
    bool thrown = false; \
    try { \
      expr; \
    } catch (const type &) { \
      thrown = true; \
    } \
    if (!thrown) { \
      std::cerr << "Expected " << #type << " from: " << #expr << std::endl; \
      std::exit(1); \
    } \
  } while (0)

MemoryDocument make_doc(const std::string &id = "mem-1") {
  MemoryDocument doc(id, MemoryType::Semantic, "r1", 1.0);
  doc.set_content("user prefers concise answers", "r1", 1.0);
  return doc;
}

TEST(create_assigns_identity) {
  auto doc = MemoryDocument::create("hello", MemoryType::Episodic, "agent-1", 100.0);
  ASSERT_EQ(doc.id().size(), 36u);
  ASSERT_EQ(doc.source_instance(), "agent-1");
  ASSERT_EQ(doc.created_at(), 100.0);
  ASSERT_EQ(doc.content_text(), "hello");
  ASSERT_TRUE(doc.memory_type() == MemoryType::Episodic);
  ASSERT_TRUE(doc.sync_status() == SyncStatus::Local);
  ASSERT_EQ(doc.version(), 1u);
  ASSERT_EQ(doc.importance.value(), MemoryDocument::kDefaultImportance);
  ASSERT_EQ(doc.confidence.value(), MemoryDocument::kDefaultConfidence);

  auto other = MemoryDocument::create("hello", MemoryType::Episodic, "agent-1", 100.0);
  ASSERT_TRUE(doc.id() != other.id());
}

TEST(validation) {
  ASSERT_THROWS(MemoryDocument("", MemoryType::Semantic, "r1", 1.0), ValidationError);
  ASSERT_THROWS(MemoryDocument("id", MemoryType::Semantic, "", 1.0), ValidationError);
  ASSERT_THROWS(MemoryDocument("id", MemoryType::Semantic, "r1", std::nan("")), ValidationError);

  auto doc = make_doc();
  ASSERT_THROWS(doc.set_content("x", ""), ValidationError);
  ASSERT_THROWS(doc.set_importance(std::nan(""), "r1"), ValidationError);
  ASSERT_THROWS(doc.set_importance(0.3, "r1", INFINITY), ValidationError);

  auto other = make_doc("mem-2");
  ASSERT_THROWS(doc.merge(other), ValidationError);
}

TEST(mutators_tick_clock) {
  auto doc = make_doc();
  uint64_t version = doc.version();
  uint64_t ticks = doc.vector_clock.get("r2");

  ASSERT_TRUE(doc.set_importance(0.8, "r2", 5.0));
  doc.add_tag("preference", "r2");
  ASSERT_TRUE(doc.add_related("mem-9", "r2"));
  ASSERT_FALSE(doc.add_related("mem-9", "r2"));
  ASSERT_TRUE(doc.add_parent("mem-0", "r2"));
  ASSERT_TRUE(doc.add_evidence("chat:42", "r2"));
  ASSERT_TRUE(doc.set_confidence(0.6, "r2", 5.0));

  ASSERT_EQ(doc.vector_clock.get("r2"), ticks + 6);
  ASSERT_EQ(doc.version(), version + 6);

  // A write that loses against a newer stored value changes nothing
  ASSERT_FALSE(doc.set_importance(0.1, "r2", 4.0));
  ASSERT_EQ(doc.importance.value(), 0.8);
  ASSERT_EQ(doc.version(), version + 6);
}

TEST(updated_at_is_latest_register) {
  auto doc = make_doc();
  ASSERT_EQ(doc.updated_at(), 1.0);
  doc.set_importance(0.7, "r1", 8.0);
  doc.record_access("r2", 6.0);
  ASSERT_EQ(doc.updated_at(), 8.0);
  doc.record_access("r2", 9.5);
  ASSERT_EQ(doc.updated_at(), 9.5);
}

TEST(record_access_counts_per_replica) {
  auto a = make_doc();
  auto b = a;
  a.record_access("r1", 2.0);
  a.record_access("r1", 3.0);
  b.record_access("r2", 4.0);

  auto joined = merged(a, b);
  ASSERT_EQ(joined.access_count.value(), 3u);
  ASSERT_EQ(joined.last_accessed.value_or(0.0), 4.0);

  // Redelivering the same copy does not double count
  joined.merge(b);
  ASSERT_EQ(joined.access_count.value(), 3u);
}

// Semilattice laws on whole documents
TEST(document_merge_laws) {
  auto base = make_doc();

  auto a = base;
  a.set_content("edited by r1", "r1", 5.0);
  a.add_tag("style", "r1");

  auto b = base;
  b.set_importance(0.9, "r2", 6.0);
  b.add_tag("style", "r2");
  b.remove_tag("style", "r2");
  b.add_evidence("doc:7", "r2");

  auto c = base;
  c.record_access("r3", 7.0);
  c.set_embedding_ref("abc", "r3", 7.0);
  c.add_related("mem-5", "r3");

  ASSERT_TRUE(merged(a, b) == merged(b, a));
  ASSERT_TRUE(merged(merged(a, b), c) == merged(a, merged(b, c)));
  ASSERT_TRUE(merged(a, a) == a);

  auto all = merged(merged(a, b), c);
  ASSERT_EQ(all.content_text(), "edited by r1");
  ASSERT_EQ(all.importance.value(), 0.9);
  // r1's add was never observed by r2's remove
  ASSERT_TRUE(all.tags.contains("style"));
  ASSERT_TRUE(all.evidence.contains("doc:7"));
  ASSERT_TRUE(all.related.contains("mem-5"));
  ASSERT_EQ(all.embedding_ref.value_or(""), "abc");
}

TEST(importance_scenario) {
  auto r1 = make_doc();
  r1.set_importance(0.9, "r1", 10.0);

  // r2 holds a merged copy and writes later
  auto r2 = r1;
  r2.set_importance(0.7, "r2", 12.0);

  auto at_r1 = merged(r1, r2);
  auto at_r2 = merged(r2, r1);
  ASSERT_EQ(at_r1.importance.value(), 0.7);
  ASSERT_EQ(at_r2.importance.value(), 0.7);
  ASSERT_TRUE(at_r1 == at_r2);
}

TEST(tag_union_scenario) {
  auto r1 = make_doc();
  auto r2 = r1;

  r1.add_tag("preference", "r1");
  r1.add_tag("style", "r1");
  r2.add_tag("urgent", "r2");

  auto joined = merged(r1, r2);
  ASSERT_TRUE(joined.tags.elements() == (CrdtVector<std::string>{"preference", "style", "urgent"}));
  ASSERT_TRUE(joined == merged(r2, r1));
}

TEST(remove_tag) {
  auto doc = make_doc();
  ASSERT_FALSE(doc.remove_tag("missing", "r1"));
  doc.add_tag("draft", "r1");
  auto stale = doc;
  ASSERT_TRUE(doc.remove_tag("draft", "r1"));
  ASSERT_FALSE(doc.tags.contains("draft"));

  doc.merge(stale);
  ASSERT_FALSE(doc.tags.contains("draft"));
}

TEST(identity_resolves_deterministically) {
  MemoryDocument a("shared", MemoryType::Episodic, "r2", 5.0);
  MemoryDocument b("shared", MemoryType::Semantic, "r1", 5.0);

  auto ab = merged(a, b);
  auto ba = merged(b, a);
  ASSERT_TRUE(ab == ba);
  ASSERT_EQ(ab.source_instance(), "r1");
  ASSERT_TRUE(ab.memory_type() == MemoryType::Semantic);
}

TEST(equality_ignores_local_bookkeeping) {
  auto a = make_doc();
  auto b = a;
  b.set_version(42);
  b.set_sync_status(SyncStatus::Synced);
  b.set_pending_seq(7);
  ASSERT_TRUE(a == b);

  a.merge(b);
  ASSERT_EQ(a.version(), 42u);
  ASSERT_TRUE(a.sync_status() == SyncStatus::Local);
}

TEST(content_hash) {
  auto doc = make_doc();
  ASSERT_EQ(doc.content_hash(), ::content_hash("user prefers concise answers"));
  ASSERT_EQ(doc.content_hash().size(), 64u);
  ASSERT_EQ(::content_hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(enum_names) {
  for (auto type : {MemoryType::Episodic, MemoryType::Semantic, MemoryType::Procedural, MemoryType::Working}) {
    ASSERT_TRUE(parse_memory_type(memory_type_name(type)) == type);
  }
  for (auto status : {SyncStatus::Local, SyncStatus::Pending, SyncStatus::Synced}) {
    ASSERT_TRUE(parse_sync_status(sync_status_name(status)) == status);
  }
  ASSERT_FALSE(parse_memory_type("dream").has_value());
  ASSERT_FALSE(parse_sync_status("").has_value());
}

TEST(embedding_document) {
  auto embedding = EmbeddingDocument::create("hello", {1.0f, 0.0f, 0.0f}, "mini");
  ASSERT_EQ(embedding.content_hash, ::content_hash("hello"));
  ASSERT_EQ(embedding.dimensions(), 3u);
  ASSERT_TRUE(embedding == EmbeddingDocument::create("hello", {1.0f, 0.0f, 0.0f}, "mini"));

  ASSERT_TRUE(std::fabs(embedding.cosine_similarity({1.0f, 0.0f, 0.0f}) - 1.0) < 1e-9);
  ASSERT_TRUE(std::fabs(embedding.cosine_similarity({0.0f, 2.0f, 0.0f})) < 1e-9);
  ASSERT_EQ(embedding.cosine_similarity({1.0f, 0.0f}), 0.0);
  ASSERT_EQ(embedding.cosine_similarity({0.0f, 0.0f, 0.0f}), 0.0);

  ASSERT_THROWS(EmbeddingDocument::create("hello", {}, "mini"), ValidationError);
  ASSERT_THROWS(EmbeddingDocument::create("hello", {1.0f}, ""), ValidationError);
}

TEST(collection) {
  MemoryCollection left;
  MemoryCollection right;

  auto doc = make_doc();
  left.put(doc);

  auto edited = doc;
  edited.set_importance(0.95, "r2", 20.0);
  edited.add_tag("urgent", "r2");
  right.put(edited);

  MemoryDocument working("mem-2", MemoryType::Working, "r2", 2.0);
  working.set_content("scratch", "r2", 3.0);
  working.set_importance(0.2, "r2", 3.0);
  right.put(working);

  ASSERT_TRUE(merged(left, right) == merged(right, left));
  left.merge(right);
  ASSERT_EQ(left.size(), 2u);
  ASSERT_TRUE(left.contains("mem-2"));
  ASSERT_EQ(left.get("mem-1")->importance.value(), 0.95);
  ASSERT_FALSE(left.get("missing").has_value());

  ASSERT_EQ(left.query_by_type(MemoryType::Working).size(), 1u);
  ASSERT_EQ(left.query_by_tag("urgent").size(), 1u);
  ASSERT_EQ(left.query_by_importance(0.9).size(), 1u);
  ASSERT_EQ(left.recent(1).front().id(), "mem-1");
  ASSERT_EQ(left.most_important(5).back().id(), "mem-2");
  ASSERT_TRUE(left.ids() == (std::vector<std::string>{"mem-1", "mem-2"}));
}

int main() {
  std::cout << "Running MemoryDocument tests..." << std::endl << std::endl;

  RUN_TEST(create_assigns_identity);
  RUN_TEST(validation);
  RUN_TEST(mutators_tick_clock);
  RUN_TEST(updated_at_is_latest_register);
  RUN_TEST(record_access_counts_per_replica);
  RUN_TEST(document_merge_laws);
  RUN_TEST(importance_scenario);
  RUN_TEST(tag_union_scenario);
  RUN_TEST(remove_tag);
  RUN_TEST(identity_resolves_deterministically);
  RUN_TEST(equality_ignores_local_bookkeeping);
  RUN_TEST(content_hash);
  RUN_TEST(enum_names);
  RUN_TEST(embedding_document);
  RUN_TEST(collection);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
