// memory_sqlite.hpp
#ifndef MEMORY_SQLITE_HPP
#define MEMORY_SQLITE_HPP

#include "crdt.hpp"
#include "memory_document.hpp"
#include "memory_errors.hpp"
#include <sqlite3.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/// What a storage write did to the stored copy of a document.
enum class MergeOutcome { Inserted, Updated, Unchanged };

const char *merge_outcome_name(MergeOutcome outcome);

/// SQLite-backed store of memory documents and embeddings
///
/// Every CRDT field is kept in normalized shadow tables (OR-Set tags, G-Set elements,
/// counter slots, vector clock entries) so that a document loaded from disk is equal
/// to the one that was written. Scalar registers and secondary index columns (type,
/// effective importance, content hash, updated_at) live in the `memories` row.
///
/// Writes are read-merge-write: the incoming document is merged into the stored copy
/// and the result is persisted, so two writers never lose each other's updates.
///
/// Example usage:
/// ```
/// MemoryStorage storage("memory.db", "agent-1");
/// auto doc = MemoryDocument::create("likes dark mode", MemoryType::Semantic, "agent-1");
/// doc.add_tag("preference", "agent-1");
/// storage.put(doc);
///
/// for (const auto &pending : storage.get_pending_sync(100)) {
///   // ... push to the hub ...
/// }
/// ```
///
/// Thread Safety:
/// All public methods lock an internal mutex, and every read-merge-write runs inside a
/// `BEGIN IMMEDIATE` transaction. Several MemoryStorage objects may open the same file
/// (one per thread or process); SQLite's busy timeout serializes their writers.
///
/// Error Handling:
/// - SQLite failures throw StorageError carrying the SQLite result code
/// - Malformed input (empty ids, empty replica) throws ValidationError
/// - A failed write rolls back its transaction and leaves the store unchanged
/// - Queries that find nothing return an empty vector or std::nullopt
class MemoryStorage {
public:
  /// Opens (or creates) the store.
  ///
  /// @param path SQLite path, ":memory:" for a private in-memory database
  /// @param replica_id Id of the local replica, stamped on writes made through the store
  /// @throws StorageError if the database cannot be opened or the schema cannot be created
  /// @throws ValidationError if replica_id is empty
  MemoryStorage(const char *path, CrdtReplicaId replica_id);

  ~MemoryStorage();

  MemoryStorage(const MemoryStorage &) = delete;
  MemoryStorage &operator=(const MemoryStorage &) = delete;

  const CrdtReplicaId &replica_id() const { return replica_id_; }

  /// Local write: merges `doc` into the stored copy and queues the result for sync.
  ///
  /// The stored document becomes pending with a fresh queue position unless the merge
  /// changed nothing.
  MergeOutcome put(const MemoryDocument &doc);

  /// Remote write: merges a snapshot received from the hub.
  ///
  /// The result is synced when it equals the snapshot, otherwise it stays (or becomes)
  /// pending because local state still holds something the hub lacks.
  MergeOutcome merge_remote(const MemoryDocument &doc);

  std::optional<MemoryDocument> get(const std::string &id);

  bool contains(const std::string &id);

  size_t count();

  /// All documents ordered by id.
  std::vector<MemoryDocument> all();

  /// Most recently updated first.
  std::vector<MemoryDocument> recent(size_t limit);

  std::vector<MemoryDocument> query_by_type(MemoryType type);

  /// Documents in which `tag` is currently present.
  std::vector<MemoryDocument> query_by_tag(const std::string &tag);

  /// Documents with importance >= `min_importance`, highest first.
  std::vector<MemoryDocument> query_by_importance(double min_importance);

  std::vector<MemoryDocument> query_by_content_hash(const std::string &hash);

  /// Episodic and working memories whose importance reached `threshold`, highest first.
  std::vector<MemoryDocument> promotion_candidates(double threshold, size_t limit);

  // Embeddings

  /// Stores an embedding. Returns false if one already exists for (content_hash, model).
  bool put_embedding(const EmbeddingDocument &embedding);

  /// Looks up an embedding by content hash, optionally restricted to one model.
  std::optional<EmbeddingDocument> get_embedding_by_hash(const std::string &hash,
                                                         const std::optional<std::string> &model = std::nullopt);

  /// Returns the embedding of the document's current content, computing it with `provider`
  /// on a miss.
  ///
  /// `doc` is merged with the stored copy first, so a newer stored content wins. Points the
  /// stored document's `embedding_ref` at the embedding. `provider` is called without
  /// holding the storage lock.
  EmbeddingDocument ensure_embedding(const MemoryDocument &doc, EmbeddingProvider &provider, const std::string &model);

  // Sync queue

  /// Up to `batch_size` pending documents, oldest queue position first (ties by id).
  std::vector<MemoryDocument> get_pending_sync(size_t batch_size);

  size_t pending_count();

  /// Flips the given documents from pending to synced in one transaction.
  ///
  /// Idempotent: ids that are unknown or already synced are skipped.
  /// @return number of documents flipped
  size_t mark_synced(const std::vector<std::string> &ids);

  /// Flips the pushed documents to synced, but only those whose queue position still
  /// equals the one in the pushed snapshot. A document rewritten after it was read for
  /// the push stays pending.
  /// @return number of documents flipped
  size_t mark_synced(const std::vector<MemoryDocument> &pushed);

  // Collections

  /// Merges every document of `collection` as a local write. Returns how many changed.
  size_t merge_collection(const MemoryCollection &collection);

  MemoryCollection export_collection();

private:
  /// RAII wrapper for sqlite3_stmt*
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  /// RAII transaction: rolls back unless commit() was called
  ///
  /// Write transactions start with BEGIN IMMEDIATE so the read of a read-merge-write
  /// already holds the write lock.
  class Transaction {
  public:
    explicit Transaction(MemoryStorage &storage, bool write = true);
    ~Transaction();
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    void commit();

  private:
    MemoryStorage &storage_;
    bool done_;
  };

  sqlite3 *db_;
  CrdtReplicaId replica_id_;
  std::mutex mutex_;

  void create_schema();

  /// Loads a full document; caller holds the lock
  std::optional<MemoryDocument> load_document(const std::string &id);

  /// Replaces the stored rows of `doc`; caller holds the lock inside a transaction
  void write_document(const MemoryDocument &doc);

  /// Runs an id-returning query and loads every document it names
  std::vector<MemoryDocument> load_all(Statement &stmt);

  /// `doc` merged with its stored copy; caller holds mutex_
  MemoryDocument merged_with_stored(const MemoryDocument &doc);

  MergeOutcome put_locked(const MemoryDocument &doc);

  /// Next position in the sync queue (monotonic, persisted)
  uint64_t next_pending_seq();

  sqlite3_stmt *prepare(const char *sql);

  void exec_or_throw(const char *sql);

  std::string get_error() const;
};

#endif // MEMORY_SQLITE_HPP
