// memory_sqlite.cpp
#include "memory_sqlite.hpp"
#include "memory_ids.hpp"
#include "memory_log.hpp"
#include <cstring>
#include <type_traits>

namespace {

constexpr const char *kComponent = "storage";
constexpr int kBusyTimeoutMs = 5000;

// G-Set fields share one table, keyed by field name
constexpr const char *kRelatedField = "related";
constexpr const char *kParentsField = "parents";
constexpr const char *kEvidenceField = "evidence";

void bind_text(sqlite3_stmt *stmt, int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  if (!text) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::string statement_error(sqlite3_stmt *stmt) { return sqlite3_errmsg(sqlite3_db_handle(stmt)); }

/// Steps a query. True on a row, false when done.
bool step_row(sqlite3_stmt *stmt) {
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc != SQLITE_DONE) {
    throw StorageError("Query failed: " + statement_error(stmt), rc);
  }
  return false;
}

void step_done(sqlite3_stmt *stmt) {
  int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    throw StorageError("Statement failed: " + statement_error(stmt), rc);
  }
}

/// Binds a register as (value, timestamp, writer); an unset register stores NULL
template <typename Register> void bind_register(sqlite3_stmt *stmt, int index, const Register &reg) {
  const auto &value = reg.get();
  if (!value) {
    sqlite3_bind_null(stmt, index);
  } else if constexpr (std::is_same_v<std::decay_t<decltype(*value)>, std::string>) {
    bind_text(stmt, index, *value);
  } else {
    sqlite3_bind_double(stmt, index, *value);
  }
  sqlite3_bind_double(stmt, index + 1, reg.timestamp());
  bind_text(stmt, index + 2, reg.writer());
}

template <typename Register> void load_register(sqlite3_stmt *stmt, int col, Register &reg) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return;
  }
  double timestamp = sqlite3_column_double(stmt, col + 1);
  std::string writer = column_text(stmt, col + 2);
  using Value = std::decay_t<decltype(*reg.get())>;
  if constexpr (std::is_same_v<Value, std::string>) {
    reg.set(column_text(stmt, col), timestamp, writer);
  } else {
    reg.set(sqlite3_column_double(stmt, col), timestamp, writer);
  }
}

} // namespace

bool StorageError::retryable() const {
  switch (sqlite_code_ & 0xFF) {
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
  case SQLITE_IOERR:
  case SQLITE_FULL:
  case SQLITE_PROTOCOL:
    return true;
  default:
    return false;
  }
}

const char *merge_outcome_name(MergeOutcome outcome) {
  switch (outcome) {
  case MergeOutcome::Inserted:
    return "inserted";
  case MergeOutcome::Updated:
    return "updated";
  case MergeOutcome::Unchanged:
    return "unchanged";
  }
  return "unknown";
}

// Transaction implementation

MemoryStorage::Transaction::Transaction(MemoryStorage &storage, bool write) : storage_(storage), done_(false) {
  storage_.exec_or_throw(write ? "BEGIN IMMEDIATE" : "BEGIN");
}

MemoryStorage::Transaction::~Transaction() {
  if (done_) {
    return;
  }
  // Never throw from a destructor; a failed rollback is left to SQLite's own recovery
  int rc = sqlite3_exec(storage_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    log_warn(kComponent, "Rollback failed: " + storage_.get_error());
  }
}

void MemoryStorage::Transaction::commit() {
  storage_.exec_or_throw("COMMIT");
  done_ = true;
}

// MemoryStorage implementation

MemoryStorage::MemoryStorage(const char *path, CrdtReplicaId replica_id)
    : db_(nullptr), replica_id_(std::move(replica_id)) {
  if (replica_id_.empty()) {
    throw ValidationError("Replica id must not be empty");
  }

  int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    sqlite3_close(db_);
    throw StorageError(error, rc);
  }

  try {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    exec_or_throw("PRAGMA foreign_keys = ON");
    exec_or_throw("PRAGMA journal_mode=WAL");
    create_schema();
  } catch (const MemoryError &) {
    sqlite3_close(db_);
    throw;
  }

  log_debug(kComponent, std::string("Opened ") + path + " as replica " + replica_id_);
}

MemoryStorage::~MemoryStorage() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void MemoryStorage::create_schema() {
  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memories (
      id TEXT PRIMARY KEY,
      memory_type TEXT NOT NULL,
      source_instance TEXT NOT NULL,
      created_at REAL NOT NULL,
      content TEXT,
      content_ts REAL NOT NULL DEFAULT 0,
      content_writer TEXT NOT NULL DEFAULT '',
      importance REAL,
      importance_ts REAL NOT NULL DEFAULT 0,
      importance_writer TEXT NOT NULL DEFAULT '',
      confidence REAL,
      confidence_ts REAL NOT NULL DEFAULT 0,
      confidence_writer TEXT NOT NULL DEFAULT '',
      last_accessed REAL,
      last_accessed_ts REAL NOT NULL DEFAULT 0,
      last_accessed_writer TEXT NOT NULL DEFAULT '',
      embedding_ref TEXT,
      embedding_ref_ts REAL NOT NULL DEFAULT 0,
      embedding_ref_writer TEXT NOT NULL DEFAULT '',
      importance_value REAL NOT NULL,
      content_hash TEXT NOT NULL,
      updated_at REAL NOT NULL,
      version INTEGER NOT NULL,
      sync_status TEXT NOT NULL,
      pending_seq INTEGER NOT NULL DEFAULT 0
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memory_or_tags (
      memory_id TEXT NOT NULL REFERENCES memories(id),
      element TEXT NOT NULL,
      replica TEXT NOT NULL,
      counter INTEGER NOT NULL,
      removed INTEGER NOT NULL,
      PRIMARY KEY (memory_id, element, replica, counter)
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memory_set_elements (
      memory_id TEXT NOT NULL REFERENCES memories(id),
      field TEXT NOT NULL,
      element TEXT NOT NULL,
      PRIMARY KEY (memory_id, field, element)
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memory_counters (
      memory_id TEXT NOT NULL REFERENCES memories(id),
      replica TEXT NOT NULL,
      count INTEGER NOT NULL,
      PRIMARY KEY (memory_id, replica)
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memory_clocks (
      memory_id TEXT NOT NULL REFERENCES memories(id),
      replica TEXT NOT NULL,
      counter INTEGER NOT NULL,
      PRIMARY KEY (memory_id, replica)
    )
  )");

  // Live tags only; rebuilt from memory_or_tags on every write
  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS memory_tags (
      memory_id TEXT NOT NULL REFERENCES memories(id),
      tag TEXT NOT NULL,
      PRIMARY KEY (memory_id, tag)
    )
  )");

  exec_or_throw(R"(
    CREATE TABLE IF NOT EXISTS embeddings (
      content_hash TEXT NOT NULL,
      model TEXT NOT NULL,
      content TEXT NOT NULL,
      dimensions INTEGER NOT NULL,
      vector BLOB NOT NULL,
      PRIMARY KEY (content_hash, model)
    )
  )");

  exec_or_throw("CREATE TABLE IF NOT EXISTS sync_clock (time INTEGER NOT NULL)");
  exec_or_throw("INSERT INTO sync_clock (time) SELECT 0 WHERE NOT EXISTS (SELECT 1 FROM sync_clock)");

  exec_or_throw("CREATE INDEX IF NOT EXISTS memories_type_idx ON memories(memory_type)");
  exec_or_throw("CREATE INDEX IF NOT EXISTS memories_importance_idx ON memories(importance_value)");
  exec_or_throw("CREATE INDEX IF NOT EXISTS memories_content_hash_idx ON memories(content_hash)");
  exec_or_throw("CREATE INDEX IF NOT EXISTS memories_updated_idx ON memories(updated_at)");
  exec_or_throw("CREATE INDEX IF NOT EXISTS memories_sync_idx ON memories(sync_status, pending_seq)");
  exec_or_throw("CREATE INDEX IF NOT EXISTS memory_tags_tag_idx ON memory_tags(tag)");
}

std::optional<MemoryDocument> MemoryStorage::load_document(const std::string &id) {
  std::optional<MemoryDocument> result;

  {
    Statement stmt(prepare(R"(
      SELECT memory_type, source_instance, created_at,
             content, content_ts, content_writer,
             importance, importance_ts, importance_writer,
             confidence, confidence_ts, confidence_writer,
             last_accessed, last_accessed_ts, last_accessed_writer,
             embedding_ref, embedding_ref_ts, embedding_ref_writer,
             version, sync_status, pending_seq
      FROM memories WHERE id = ?
    )"));
    bind_text(stmt.get(), 1, id);
    if (!step_row(stmt.get())) {
      return std::nullopt;
    }

    auto memory_type = parse_memory_type(column_text(stmt.get(), 0));
    auto sync_status = parse_sync_status(column_text(stmt.get(), 19));
    if (!memory_type || !sync_status) {
      throw StorageError("Corrupt memory row: " + id);
    }

    MemoryDocument doc(id, *memory_type, column_text(stmt.get(), 1), sqlite3_column_double(stmt.get(), 2));
    load_register(stmt.get(), 3, doc.content);
    load_register(stmt.get(), 6, doc.importance);
    load_register(stmt.get(), 9, doc.confidence);
    load_register(stmt.get(), 12, doc.last_accessed);
    load_register(stmt.get(), 15, doc.embedding_ref);
    doc.set_version(static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 18)));
    doc.set_sync_status(*sync_status);
    doc.set_pending_seq(static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 20)));
    result.emplace(std::move(doc));
  }

  MemoryDocument &doc = *result;

  {
    Statement stmt(prepare("SELECT element, replica, counter, removed FROM memory_or_tags WHERE memory_id = ?"));
    bind_text(stmt.get(), 1, id);
    while (step_row(stmt.get())) {
      std::string element = column_text(stmt.get(), 0);
      OrTag tag{column_text(stmt.get(), 1), static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2))};
      if (sqlite3_column_int(stmt.get(), 3) != 0) {
        doc.tags.remove_with_tag(element, tag);
      } else {
        doc.tags.add_with_tag(element, tag);
      }
    }
  }

  {
    Statement stmt(prepare("SELECT field, element FROM memory_set_elements WHERE memory_id = ?"));
    bind_text(stmt.get(), 1, id);
    while (step_row(stmt.get())) {
      std::string field = column_text(stmt.get(), 0);
      std::string element = column_text(stmt.get(), 1);
      if (field == kRelatedField) {
        doc.related.add(element);
      } else if (field == kParentsField) {
        doc.parents.add(element);
      } else if (field == kEvidenceField) {
        doc.evidence.add(element);
      } else {
        throw StorageError("Corrupt set element for " + id + ": unknown field " + field);
      }
    }
  }

  {
    Statement stmt(prepare("SELECT replica, count FROM memory_counters WHERE memory_id = ?"));
    bind_text(stmt.get(), 1, id);
    while (step_row(stmt.get())) {
      doc.access_count.set(column_text(stmt.get(), 0), static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1)));
    }
  }

  {
    Statement stmt(prepare("SELECT replica, counter FROM memory_clocks WHERE memory_id = ?"));
    bind_text(stmt.get(), 1, id);
    while (step_row(stmt.get())) {
      doc.vector_clock.set(column_text(stmt.get(), 0), static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1)));
    }
  }

  return result;
}

void MemoryStorage::write_document(const MemoryDocument &doc) {
  const std::string &id = doc.id();

  {
    Statement stmt(prepare(R"(
      INSERT INTO memories (
        id, memory_type, source_instance, created_at,
        content, content_ts, content_writer,
        importance, importance_ts, importance_writer,
        confidence, confidence_ts, confidence_writer,
        last_accessed, last_accessed_ts, last_accessed_writer,
        embedding_ref, embedding_ref_ts, embedding_ref_writer,
        importance_value, content_hash, updated_at, version, sync_status, pending_seq)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
      ON CONFLICT(id) DO UPDATE SET
        memory_type = excluded.memory_type,
        source_instance = excluded.source_instance,
        created_at = excluded.created_at,
        content = excluded.content,
        content_ts = excluded.content_ts,
        content_writer = excluded.content_writer,
        importance = excluded.importance,
        importance_ts = excluded.importance_ts,
        importance_writer = excluded.importance_writer,
        confidence = excluded.confidence,
        confidence_ts = excluded.confidence_ts,
        confidence_writer = excluded.confidence_writer,
        last_accessed = excluded.last_accessed,
        last_accessed_ts = excluded.last_accessed_ts,
        last_accessed_writer = excluded.last_accessed_writer,
        embedding_ref = excluded.embedding_ref,
        embedding_ref_ts = excluded.embedding_ref_ts,
        embedding_ref_writer = excluded.embedding_ref_writer,
        importance_value = excluded.importance_value,
        content_hash = excluded.content_hash,
        updated_at = excluded.updated_at,
        version = excluded.version,
        sync_status = excluded.sync_status,
        pending_seq = excluded.pending_seq
    )"));
    bind_text(stmt.get(), 1, id);
    bind_text(stmt.get(), 2, memory_type_name(doc.memory_type()));
    bind_text(stmt.get(), 3, doc.source_instance());
    sqlite3_bind_double(stmt.get(), 4, doc.created_at());
    bind_register(stmt.get(), 5, doc.content);
    bind_register(stmt.get(), 8, doc.importance);
    bind_register(stmt.get(), 11, doc.confidence);
    bind_register(stmt.get(), 14, doc.last_accessed);
    bind_register(stmt.get(), 17, doc.embedding_ref);
    sqlite3_bind_double(stmt.get(), 20, doc.importance.value());
    bind_text(stmt.get(), 21, doc.content_hash());
    sqlite3_bind_double(stmt.get(), 22, doc.updated_at());
    sqlite3_bind_int64(stmt.get(), 23, static_cast<sqlite3_int64>(doc.version()));
    bind_text(stmt.get(), 24, sync_status_name(doc.sync_status()));
    sqlite3_bind_int64(stmt.get(), 25, static_cast<sqlite3_int64>(doc.pending_seq()));
    step_done(stmt.get());
  }

  // Shadow tables are rewritten in full; CRDT state only grows, so this never drops data
  for (const char *table : {"memory_or_tags", "memory_set_elements", "memory_counters", "memory_clocks", "memory_tags"}) {
    std::string sql = std::string("DELETE FROM ") + table + " WHERE memory_id = ?";
    Statement stmt(prepare(sql.c_str()));
    bind_text(stmt.get(), 1, id);
    step_done(stmt.get());
  }

  {
    Statement stmt(prepare(
        "INSERT INTO memory_or_tags (memory_id, element, replica, counter, removed) VALUES (?, ?, ?, ?, ?)"));
    doc.tags.for_each_tag([&](const std::string &element, const OrTag &tag, bool removed) {
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, id);
      bind_text(stmt.get(), 2, element);
      bind_text(stmt.get(), 3, tag.replica);
      sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(tag.counter));
      sqlite3_bind_int(stmt.get(), 5, removed ? 1 : 0);
      step_done(stmt.get());
    });
  }

  {
    Statement stmt(prepare("INSERT INTO memory_tags (memory_id, tag) VALUES (?, ?)"));
    for (const auto &tag : doc.tags.elements()) {
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, id);
      bind_text(stmt.get(), 2, tag);
      step_done(stmt.get());
    }
  }

  {
    Statement stmt(prepare("INSERT INTO memory_set_elements (memory_id, field, element) VALUES (?, ?, ?)"));
    auto insert_set = [&](const char *field, const GSet<std::string> &set) {
      for (const auto &element : set.elements()) {
        sqlite3_reset(stmt.get());
        bind_text(stmt.get(), 1, id);
        bind_text(stmt.get(), 2, field);
        bind_text(stmt.get(), 3, element);
        step_done(stmt.get());
      }
    };
    insert_set(kRelatedField, doc.related);
    insert_set(kParentsField, doc.parents);
    insert_set(kEvidenceField, doc.evidence);
  }

  {
    Statement stmt(prepare("INSERT INTO memory_counters (memory_id, replica, count) VALUES (?, ?, ?)"));
    for (const auto &[replica, count] : doc.access_count.entries()) {
      if (count == 0)
        continue;
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, id);
      bind_text(stmt.get(), 2, replica);
      sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(count));
      step_done(stmt.get());
    }
  }

  {
    Statement stmt(prepare("INSERT INTO memory_clocks (memory_id, replica, counter) VALUES (?, ?, ?)"));
    for (const auto &[replica, counter] : doc.vector_clock.entries()) {
      if (counter == 0)
        continue;
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, id);
      bind_text(stmt.get(), 2, replica);
      sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(counter));
      step_done(stmt.get());
    }
  }
}

std::vector<MemoryDocument> MemoryStorage::load_all(Statement &stmt) {
  std::vector<std::string> ids;
  while (step_row(stmt.get())) {
    ids.push_back(column_text(stmt.get(), 0));
  }

  std::vector<MemoryDocument> result;
  result.reserve(ids.size());
  for (const auto &id : ids) {
    if (auto doc = load_document(id)) {
      result.push_back(std::move(*doc));
    }
  }
  return result;
}

uint64_t MemoryStorage::next_pending_seq() {
  exec_or_throw("UPDATE sync_clock SET time = time + 1");
  Statement stmt(prepare("SELECT time FROM sync_clock"));
  if (!step_row(stmt.get())) {
    throw StorageError("sync_clock table is empty");
  }
  return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

MergeOutcome MemoryStorage::put_locked(const MemoryDocument &doc) {
  Transaction txn(*this);

  auto existing = load_document(doc.id());
  MemoryDocument merged = existing ? *existing : doc;
  if (existing) {
    merged.merge(doc);
    if (merged == *existing) {
      txn.commit();
      return MergeOutcome::Unchanged;
    }
  }

  merged.set_sync_status(SyncStatus::Pending);
  merged.set_pending_seq(next_pending_seq());
  write_document(merged);
  txn.commit();

  MergeOutcome outcome = existing ? MergeOutcome::Updated : MergeOutcome::Inserted;
  log_debug(kComponent, std::string("put ") + doc.id() + ": " + merge_outcome_name(outcome) + ", queued at " +
                            std::to_string(merged.pending_seq()));
  return outcome;
}

MergeOutcome MemoryStorage::put(const MemoryDocument &doc) {
  std::lock_guard<std::mutex> lock(mutex_);
  return put_locked(doc);
}

MergeOutcome MemoryStorage::merge_remote(const MemoryDocument &doc) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this);

  auto existing = load_document(doc.id());
  if (!existing) {
    MemoryDocument stored = doc;
    stored.set_sync_status(SyncStatus::Synced);
    stored.set_pending_seq(0);
    write_document(stored);
    txn.commit();
    log_debug(kComponent, "merge_remote " + doc.id() + ": inserted");
    return MergeOutcome::Inserted;
  }

  MemoryDocument merged = *existing;
  merged.merge(doc);
  bool hub_has_all = merged == doc;

  if (merged == *existing) {
    // Nothing new locally, but the hub may now hold what was queued
    if (hub_has_all && existing->sync_status() == SyncStatus::Pending) {
      merged.set_sync_status(SyncStatus::Synced);
      merged.set_pending_seq(0);
      write_document(merged);
    }
    txn.commit();
    return MergeOutcome::Unchanged;
  }

  if (hub_has_all) {
    merged.set_sync_status(SyncStatus::Synced);
    merged.set_pending_seq(0);
  } else if (existing->sync_status() != SyncStatus::Pending) {
    merged.set_sync_status(SyncStatus::Pending);
    merged.set_pending_seq(next_pending_seq());
  }
  write_document(merged);
  txn.commit();

  log_debug(kComponent, "merge_remote " + doc.id() + ": updated, now " + sync_status_name(merged.sync_status()));
  return MergeOutcome::Updated;
}

std::optional<MemoryDocument> MemoryStorage::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  auto doc = load_document(id);
  txn.commit();
  return doc;
}

bool MemoryStorage::contains(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare("SELECT 1 FROM memories WHERE id = ?"));
  bind_text(stmt.get(), 1, id);
  return step_row(stmt.get());
}

size_t MemoryStorage::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare("SELECT COUNT(*) FROM memories"));
  if (!step_row(stmt.get())) {
    return 0;
  }
  return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<MemoryDocument> MemoryStorage::all() {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories ORDER BY id"));
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::recent(size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories ORDER BY updated_at DESC, id LIMIT ?"));
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::query_by_type(MemoryType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories WHERE memory_type = ? ORDER BY created_at, id"));
  bind_text(stmt.get(), 1, memory_type_name(type));
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::query_by_tag(const std::string &tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT memory_id FROM memory_tags WHERE tag = ? ORDER BY memory_id"));
  bind_text(stmt.get(), 1, tag);
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::query_by_importance(double min_importance) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories WHERE importance_value >= ? ORDER BY importance_value DESC, id"));
  sqlite3_bind_double(stmt.get(), 1, min_importance);
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::query_by_content_hash(const std::string &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories WHERE content_hash = ? ORDER BY id"));
  bind_text(stmt.get(), 1, hash);
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

std::vector<MemoryDocument> MemoryStorage::promotion_candidates(double threshold, size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare(R"(
    SELECT id FROM memories
    WHERE memory_type IN (?, ?) AND importance_value >= ?
    ORDER BY importance_value DESC, id
    LIMIT ?
  )"));
  bind_text(stmt.get(), 1, memory_type_name(MemoryType::Episodic));
  bind_text(stmt.get(), 2, memory_type_name(MemoryType::Working));
  sqlite3_bind_double(stmt.get(), 3, threshold);
  sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(limit));
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

bool MemoryStorage::put_embedding(const EmbeddingDocument &embedding) {
  if (embedding.content_hash.empty()) {
    throw ValidationError("Embedding content hash must not be empty");
  }
  if (embedding.model.empty()) {
    throw ValidationError("Embedding model must not be empty");
  }
  if (embedding.vector.empty()) {
    throw ValidationError("Embedding vector must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare(
      "INSERT OR IGNORE INTO embeddings (content_hash, model, content, dimensions, vector) VALUES (?, ?, ?, ?, ?)"));
  bind_text(stmt.get(), 1, embedding.content_hash);
  bind_text(stmt.get(), 2, embedding.model);
  bind_text(stmt.get(), 3, embedding.content);
  sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(embedding.dimensions()));
  sqlite3_bind_blob(stmt.get(), 5, embedding.vector.data(),
                    static_cast<int>(embedding.vector.size() * sizeof(float)), SQLITE_TRANSIENT);
  step_done(stmt.get());
  return sqlite3_changes(db_) > 0;
}

std::optional<EmbeddingDocument> MemoryStorage::get_embedding_by_hash(const std::string &hash,
                                                                     const std::optional<std::string> &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare(model ? "SELECT content_hash, model, content, dimensions, vector FROM embeddings "
                                 "WHERE content_hash = ? AND model = ?"
                               : "SELECT content_hash, model, content, dimensions, vector FROM embeddings "
                                 "WHERE content_hash = ? ORDER BY model LIMIT 1"));
  bind_text(stmt.get(), 1, hash);
  if (model) {
    bind_text(stmt.get(), 2, *model);
  }
  if (!step_row(stmt.get())) {
    return std::nullopt;
  }

  EmbeddingDocument embedding;
  embedding.content_hash = column_text(stmt.get(), 0);
  embedding.model = column_text(stmt.get(), 1);
  embedding.content = column_text(stmt.get(), 2);
  auto dimensions = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 3));
  const void *blob = sqlite3_column_blob(stmt.get(), 4);
  auto bytes = static_cast<size_t>(sqlite3_column_bytes(stmt.get(), 4));
  if (bytes != dimensions * sizeof(float) || (bytes > 0 && !blob)) {
    throw StorageError("Corrupt embedding vector for " + hash);
  }
  embedding.vector.resize(dimensions);
  if (bytes > 0) {
    std::memcpy(embedding.vector.data(), blob, bytes);
  }
  return embedding;
}

MemoryDocument MemoryStorage::merged_with_stored(const MemoryDocument &doc) {
  MemoryDocument current = doc;
  Transaction txn(*this, false);
  if (auto stored = load_document(doc.id())) {
    current.merge(*stored);
  }
  txn.commit();
  return current;
}

EmbeddingDocument MemoryStorage::ensure_embedding(const MemoryDocument &doc, EmbeddingProvider &provider,
                                                  const std::string &model) {
  MemoryDocument current = doc;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = merged_with_stored(doc);
  }

  // The stored content may move on while the provider runs; embed again until it holds still
  while (true) {
    std::string hash = current.content_hash();

    EmbeddingDocument embedding;
    if (auto cached = get_embedding_by_hash(hash, model)) {
      embedding = std::move(*cached);
    } else {
      log_debug(kComponent, "Computing " + model + " embedding for " + doc.id());
      embedding =
          EmbeddingDocument::create(current.content_text(), provider.embed(current.content_text(), model), model);
      put_embedding(embedding);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    MemoryDocument latest = merged_with_stored(current);
    if (latest.content_hash() != hash) {
      current = std::move(latest);
      continue;
    }
    if (latest.embedding_ref.get() != std::optional<std::string>(hash)) {
      latest.set_embedding_ref(hash, replica_id_);
    }
    put_locked(latest);
    return embedding;
  }
}

std::vector<MemoryDocument> MemoryStorage::get_pending_sync(size_t batch_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this, false);
  Statement stmt(prepare("SELECT id FROM memories WHERE sync_status = ? ORDER BY pending_seq ASC, id ASC LIMIT ?"));
  bind_text(stmt.get(), 1, sync_status_name(SyncStatus::Pending));
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(batch_size));
  auto result = load_all(stmt);
  txn.commit();
  return result;
}

size_t MemoryStorage::pending_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare("SELECT COUNT(*) FROM memories WHERE sync_status = ?"));
  bind_text(stmt.get(), 1, sync_status_name(SyncStatus::Pending));
  if (!step_row(stmt.get())) {
    return 0;
  }
  return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

size_t MemoryStorage::mark_synced(const std::vector<std::string> &ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this);

  size_t flipped = 0;
  Statement stmt(prepare("UPDATE memories SET sync_status = ?, pending_seq = 0 WHERE id = ? AND sync_status = ?"));
  for (const auto &id : ids) {
    sqlite3_reset(stmt.get());
    bind_text(stmt.get(), 1, sync_status_name(SyncStatus::Synced));
    bind_text(stmt.get(), 2, id);
    bind_text(stmt.get(), 3, sync_status_name(SyncStatus::Pending));
    step_done(stmt.get());
    flipped += static_cast<size_t>(sqlite3_changes(db_));
  }

  txn.commit();
  return flipped;
}

size_t MemoryStorage::mark_synced(const std::vector<MemoryDocument> &pushed) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(*this);

  size_t flipped = 0;
  Statement stmt(prepare(
      "UPDATE memories SET sync_status = ?, pending_seq = 0 WHERE id = ? AND sync_status = ? AND pending_seq = ?"));
  for (const auto &doc : pushed) {
    sqlite3_reset(stmt.get());
    bind_text(stmt.get(), 1, sync_status_name(SyncStatus::Synced));
    bind_text(stmt.get(), 2, doc.id());
    bind_text(stmt.get(), 3, sync_status_name(SyncStatus::Pending));
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(doc.pending_seq()));
    step_done(stmt.get());
    if (sqlite3_changes(db_) > 0) {
      flipped++;
    } else {
      log_debug(kComponent, doc.id() + " changed after push, left pending");
    }
  }

  txn.commit();
  return flipped;
}

size_t MemoryStorage::merge_collection(const MemoryCollection &collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t changed = 0;
  for (const auto &doc : collection.all()) {
    if (put_locked(doc) != MergeOutcome::Unchanged) {
      changed++;
    }
  }
  return changed;
}

MemoryCollection MemoryStorage::export_collection() {
  MemoryCollection collection;
  for (const auto &doc : all()) {
    collection.put(doc);
  }
  return collection;
}

sqlite3_stmt *MemoryStorage::prepare(const char *sql) {
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw StorageError("Failed to prepare statement: " + get_error(), rc);
  }
  return stmt;
}

void MemoryStorage::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw StorageError(error, rc);
  }
}

std::string MemoryStorage::get_error() const { return sqlite3_errmsg(db_); }
