// memory_document.hpp
#ifndef MEMORY_DOCUMENT_HPP
#define MEMORY_DOCUMENT_HPP

#include "crdt.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// Classification of a memory. Fixed at creation.
enum class MemoryType { Episodic, Semantic, Procedural, Working };

const char *memory_type_name(MemoryType type);
std::optional<MemoryType> parse_memory_type(const std::string &name);

/// Local replication state of a document. Not replicated itself.
enum class SyncStatus { Local, Pending, Synced };

const char *sync_status_name(SyncStatus status);
std::optional<SyncStatus> parse_sync_status(const std::string &name);

/// A single memory entry built from CRDT fields.
///
/// Identity (`id`, `memory_type`, `source_instance`, `created_at`) is fixed at creation.
/// Every other replicated field is a CRDT and merges independently, so any two replicas
/// that have seen the same updates hold equal documents.
///
/// `version`, `sync_status` and `pending_seq` are local bookkeeping: they are not compared
/// by `operator==` and never decide a merge.
///
/// Thread Safety:
/// A MemoryDocument is a plain value. Concurrent mutation of one instance must be
/// serialized by the caller; replicas exchange copies.
class MemoryDocument {
public:
  static constexpr double kDefaultImportance = 0.5;
  static constexpr double kDefaultConfidence = 0.5;

  /// Creates an empty document with an explicit identity.
  ///
  /// @throws ValidationError if `id` or `source_instance` is empty or `created_at` is not finite
  MemoryDocument(std::string id, MemoryType memory_type, CrdtReplicaId source_instance, double created_at);

  /// Creates a new document with a fresh UUID and initial content written by `replica`.
  static MemoryDocument create(const std::string &content, MemoryType memory_type, const CrdtReplicaId &replica,
                               std::optional<double> timestamp = std::nullopt);

  // Replicated fields
  LWWRegister<std::string> content;
  ORSet<std::string> tags;
  GSet<std::string> related;
  GSet<std::string> parents;
  GSet<std::string> evidence;
  LWWNumericRegister importance{kDefaultImportance};
  LWWNumericRegister confidence{kDefaultConfidence};
  GCounter access_count;
  LWWRegister<double> last_accessed;
  LWWRegister<std::string> embedding_ref;
  VectorClock vector_clock;

  const std::string &id() const { return id_; }
  MemoryType memory_type() const { return memory_type_; }
  const CrdtReplicaId &source_instance() const { return source_instance_; }
  double created_at() const { return created_at_; }

  /// Latest timestamp among the registers (or `created_at` if none was written).
  double updated_at() const;

  /// Current content, empty if never written.
  std::string content_text() const { return content.value_or(std::string()); }

  /// SHA-256 of the current content.
  std::string content_hash() const;

  // Typed mutators. Each stamps (timestamp, writer), ticks the vector clock of `writer`
  // and bumps the local version when it changes the document. `timestamp` defaults to
  // the wall clock. Return false when the write lost against a newer stored value.
  // All of them throw ValidationError on an empty writer or a non-finite number.

  bool set_content(const std::string &text, const CrdtReplicaId &writer, std::optional<double> timestamp = std::nullopt);
  bool set_importance(double value, const CrdtReplicaId &writer, std::optional<double> timestamp = std::nullopt);
  bool set_confidence(double value, const CrdtReplicaId &writer, std::optional<double> timestamp = std::nullopt);
  bool set_embedding_ref(const std::string &hash, const CrdtReplicaId &writer,
                         std::optional<double> timestamp = std::nullopt);

  OrTag add_tag(const std::string &tag, const CrdtReplicaId &writer);

  /// Removes the tags of `tag` observed by this copy. Concurrent adds elsewhere survive.
  bool remove_tag(const std::string &tag, const CrdtReplicaId &writer);

  bool add_related(const std::string &memory_id, const CrdtReplicaId &writer);
  bool add_parent(const std::string &memory_id, const CrdtReplicaId &writer);
  bool add_evidence(const std::string &item, const CrdtReplicaId &writer);

  /// Counts one access by `writer` and records when it happened.
  void record_access(const CrdtReplicaId &writer, std::optional<double> timestamp = std::nullopt);

  /// Merges every field of `other` into this document.
  ///
  /// @throws ValidationError if the ids differ
  void merge(const MemoryDocument &other);

  // Local bookkeeping
  uint64_t version() const { return version_; }
  void set_version(uint64_t version) { version_ = version; }
  SyncStatus sync_status() const { return sync_status_; }
  void set_sync_status(SyncStatus status) { sync_status_ = status; }

  /// Position in the local sync queue, assigned by storage when the document became pending.
  uint64_t pending_seq() const { return pending_seq_; }
  void set_pending_seq(uint64_t seq) { pending_seq_ = seq; }

  friend bool operator==(const MemoryDocument &lhs, const MemoryDocument &rhs);

private:
  void touch(const CrdtReplicaId &writer);

  std::string id_;
  MemoryType memory_type_;
  CrdtReplicaId source_instance_;
  double created_at_;

  uint64_t version_ = 1;
  SyncStatus sync_status_ = SyncStatus::Local;
  uint64_t pending_seq_ = 0;
};

static_assert(Mergeable<MemoryDocument>);

/// Vector embedding of a piece of content, addressed by the content's SHA-256.
///
/// Immutable: the same content and model always produce the same record, so no merge is needed.
struct EmbeddingDocument {
  std::string content_hash;
  std::string content;
  std::string model;
  std::vector<float> vector;

  /// @throws ValidationError if `vector` is empty or `model` is empty
  static EmbeddingDocument create(const std::string &content, std::vector<float> vector, const std::string &model);

  size_t dimensions() const { return vector.size(); }

  /// Cosine similarity with `other`; 0 on dimension mismatch or zero norm.
  double cosine_similarity(const std::vector<float> &other) const;

  bool operator==(const EmbeddingDocument &) const = default;
};

/// External embedding computation (content, model -> vector). May block on I/O.
class EmbeddingProvider {
public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &content, const std::string &model) = 0;
};

/// In-memory set of documents keyed by id; `put` merges same-id documents.
class MemoryCollection {
public:
  MemoryCollection() = default;

  /// Inserts `doc` or merges it into the stored copy. Returns the id.
  const std::string &put(const MemoryDocument &doc);

  std::optional<MemoryDocument> get(const std::string &id) const;

  bool contains(const std::string &id) const { return documents_.contains(id); }

  size_t size() const { return documents_.size(); }

  bool empty() const { return documents_.empty(); }

  /// All documents ordered by id.
  std::vector<MemoryDocument> all() const;

  std::vector<std::string> ids() const;

  /// Union of both collections; same-id documents are merged.
  void merge(const MemoryCollection &other);

  std::vector<MemoryDocument> query_by_type(MemoryType type) const;
  std::vector<MemoryDocument> query_by_tag(const std::string &tag) const;
  std::vector<MemoryDocument> query_by_importance(double min_importance) const;

  /// Most recently updated first.
  std::vector<MemoryDocument> recent(size_t limit) const;

  /// Highest importance first.
  std::vector<MemoryDocument> most_important(size_t limit) const;

  friend bool operator==(const MemoryCollection &lhs, const MemoryCollection &rhs) {
    return lhs.documents_ == rhs.documents_;
  }

private:
  CrdtSortedMap<std::string, MemoryDocument> documents_;
};

static_assert(Mergeable<MemoryCollection>);

#endif // MEMORY_DOCUMENT_HPP
