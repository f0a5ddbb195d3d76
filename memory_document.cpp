// memory_document.cpp
#include "memory_document.hpp"
#include "memory_errors.hpp"
#include "memory_ids.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace {

double resolve_timestamp(std::optional<double> timestamp) {
  double ts = timestamp ? *timestamp : now_seconds();
  if (!std::isfinite(ts)) {
    throw ValidationError("Timestamp must be finite");
  }
  return ts;
}

void require_writer(const CrdtReplicaId &writer) {
  if (writer.empty()) {
    throw ValidationError("Writer replica id must not be empty");
  }
}

void require_finite(double value, const char *field) {
  if (!std::isfinite(value)) {
    throw ValidationError(std::string(field) + " must be a finite number");
  }
}

} // namespace

const char *memory_type_name(MemoryType type) {
  switch (type) {
  case MemoryType::Episodic:
    return "episodic";
  case MemoryType::Semantic:
    return "semantic";
  case MemoryType::Procedural:
    return "procedural";
  case MemoryType::Working:
    return "working";
  }
  return "episodic";
}

std::optional<MemoryType> parse_memory_type(const std::string &name) {
  if (name == "episodic")
    return MemoryType::Episodic;
  if (name == "semantic")
    return MemoryType::Semantic;
  if (name == "procedural")
    return MemoryType::Procedural;
  if (name == "working")
    return MemoryType::Working;
  return std::nullopt;
}

const char *sync_status_name(SyncStatus status) {
  switch (status) {
  case SyncStatus::Local:
    return "local";
  case SyncStatus::Pending:
    return "pending";
  case SyncStatus::Synced:
    return "synced";
  }
  return "local";
}

std::optional<SyncStatus> parse_sync_status(const std::string &name) {
  if (name == "local")
    return SyncStatus::Local;
  if (name == "pending")
    return SyncStatus::Pending;
  if (name == "synced")
    return SyncStatus::Synced;
  return std::nullopt;
}

// MemoryDocument implementation

MemoryDocument::MemoryDocument(std::string id, MemoryType memory_type, CrdtReplicaId source_instance, double created_at)
    : id_(std::move(id)), memory_type_(memory_type), source_instance_(std::move(source_instance)),
      created_at_(created_at) {
  if (id_.empty()) {
    throw ValidationError("Memory id must not be empty");
  }
  if (source_instance_.empty()) {
    throw ValidationError("Source instance must not be empty");
  }
  require_finite(created_at_, "created_at");
}

MemoryDocument MemoryDocument::create(const std::string &content, MemoryType memory_type, const CrdtReplicaId &replica,
                                      std::optional<double> timestamp) {
  double ts = resolve_timestamp(timestamp);
  MemoryDocument doc(generate_memory_id(), memory_type, replica, ts);
  doc.set_content(content, replica, ts);
  doc.version_ = 1;
  return doc;
}

double MemoryDocument::updated_at() const {
  double latest = created_at_;
  auto consider = [&latest](bool has_value, double ts) {
    if (has_value) {
      latest = std::max(latest, ts);
    }
  };
  consider(content.has_value(), content.timestamp());
  consider(importance.has_value(), importance.timestamp());
  consider(confidence.has_value(), confidence.timestamp());
  consider(last_accessed.has_value(), last_accessed.timestamp());
  consider(embedding_ref.has_value(), embedding_ref.timestamp());
  return latest;
}

std::string MemoryDocument::content_hash() const { return ::content_hash(content_text()); }

void MemoryDocument::touch(const CrdtReplicaId &writer) {
  vector_clock.tick(writer);
  version_++;
}

bool MemoryDocument::set_content(const std::string &text, const CrdtReplicaId &writer,
                                 std::optional<double> timestamp) {
  require_writer(writer);
  double ts = resolve_timestamp(timestamp);
  if (!content.set(text, ts, writer)) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::set_importance(double value, const CrdtReplicaId &writer, std::optional<double> timestamp) {
  require_writer(writer);
  require_finite(value, "importance");
  double ts = resolve_timestamp(timestamp);
  if (!importance.set(value, ts, writer)) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::set_confidence(double value, const CrdtReplicaId &writer, std::optional<double> timestamp) {
  require_writer(writer);
  require_finite(value, "confidence");
  double ts = resolve_timestamp(timestamp);
  if (!confidence.set(value, ts, writer)) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::set_embedding_ref(const std::string &hash, const CrdtReplicaId &writer,
                                       std::optional<double> timestamp) {
  require_writer(writer);
  double ts = resolve_timestamp(timestamp);
  if (!embedding_ref.set(hash, ts, writer)) {
    return false;
  }
  touch(writer);
  return true;
}

OrTag MemoryDocument::add_tag(const std::string &tag, const CrdtReplicaId &writer) {
  require_writer(writer);
  OrTag minted = tags.add(tag, writer);
  touch(writer);
  return minted;
}

bool MemoryDocument::remove_tag(const std::string &tag, const CrdtReplicaId &writer) {
  require_writer(writer);
  if (tags.remove_all(tag).empty()) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::add_related(const std::string &memory_id, const CrdtReplicaId &writer) {
  require_writer(writer);
  if (!related.add(memory_id)) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::add_parent(const std::string &memory_id, const CrdtReplicaId &writer) {
  require_writer(writer);
  if (!parents.add(memory_id)) {
    return false;
  }
  touch(writer);
  return true;
}

bool MemoryDocument::add_evidence(const std::string &item, const CrdtReplicaId &writer) {
  require_writer(writer);
  if (!evidence.add(item)) {
    return false;
  }
  touch(writer);
  return true;
}

void MemoryDocument::record_access(const CrdtReplicaId &writer, std::optional<double> timestamp) {
  require_writer(writer);
  double ts = resolve_timestamp(timestamp);
  access_count.increment(writer);
  last_accessed.set(ts, ts, writer);
  touch(writer);
}

void MemoryDocument::merge(const MemoryDocument &other) {
  if (other.id_ != id_) {
    throw ValidationError("Cannot merge memory " + other.id_ + " into " + id_);
  }

  // Identity is written once; pick deterministically if two creators ever disagree
  auto identity = [](const MemoryDocument &doc) {
    return std::make_tuple(doc.created_at_, doc.source_instance_, static_cast<int>(doc.memory_type_));
  };
  if (identity(other) < identity(*this)) {
    created_at_ = other.created_at_;
    source_instance_ = other.source_instance_;
    memory_type_ = other.memory_type_;
  }

  content.merge(other.content);
  tags.merge(other.tags);
  related.merge(other.related);
  parents.merge(other.parents);
  evidence.merge(other.evidence);
  importance.merge(other.importance);
  confidence.merge(other.confidence);
  access_count.merge(other.access_count);
  last_accessed.merge(other.last_accessed);
  embedding_ref.merge(other.embedding_ref);
  vector_clock.merge(other.vector_clock);

  version_ = std::max(version_, other.version_);
}

bool operator==(const MemoryDocument &lhs, const MemoryDocument &rhs) {
  return lhs.id_ == rhs.id_ && lhs.memory_type_ == rhs.memory_type_ && lhs.source_instance_ == rhs.source_instance_ &&
         lhs.created_at_ == rhs.created_at_ && lhs.content == rhs.content && lhs.tags == rhs.tags &&
         lhs.related == rhs.related && lhs.parents == rhs.parents && lhs.evidence == rhs.evidence &&
         lhs.importance == rhs.importance && lhs.confidence == rhs.confidence &&
         lhs.access_count == rhs.access_count && lhs.last_accessed == rhs.last_accessed &&
         lhs.embedding_ref == rhs.embedding_ref && lhs.vector_clock == rhs.vector_clock;
}

// EmbeddingDocument implementation

EmbeddingDocument EmbeddingDocument::create(const std::string &content, std::vector<float> vector,
                                            const std::string &model) {
  if (vector.empty()) {
    throw ValidationError("Embedding vector must not be empty");
  }
  if (model.empty()) {
    throw ValidationError("Embedding model must not be empty");
  }
  EmbeddingDocument doc;
  doc.content_hash = ::content_hash(content);
  doc.content = content;
  doc.model = model;
  doc.vector = std::move(vector);
  return doc;
}

double EmbeddingDocument::cosine_similarity(const std::vector<float> &other) const {
  if (vector.size() != other.size() || vector.empty()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < vector.size(); i++) {
    dot += static_cast<double>(vector[i]) * other[i];
    norm_a += static_cast<double>(vector[i]) * vector[i];
    norm_b += static_cast<double>(other[i]) * other[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

// MemoryCollection implementation

const std::string &MemoryCollection::put(const MemoryDocument &doc) {
  auto it = documents_.find(doc.id());
  if (it == documents_.end()) {
    it = documents_.emplace(doc.id(), doc).first;
  } else {
    it->second.merge(doc);
  }
  return it->first;
}

std::optional<MemoryDocument> MemoryCollection::get(const std::string &id) const {
  auto it = documents_.find(id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<MemoryDocument> MemoryCollection::all() const {
  std::vector<MemoryDocument> result;
  result.reserve(documents_.size());
  for (const auto &[_, doc] : documents_) {
    result.push_back(doc);
  }
  return result;
}

std::vector<std::string> MemoryCollection::ids() const {
  std::vector<std::string> result;
  result.reserve(documents_.size());
  for (const auto &[id, _] : documents_) {
    result.push_back(id);
  }
  return result;
}

void MemoryCollection::merge(const MemoryCollection &other) {
  for (const auto &[_, doc] : other.documents_) {
    put(doc);
  }
}

std::vector<MemoryDocument> MemoryCollection::query_by_type(MemoryType type) const {
  std::vector<MemoryDocument> result;
  for (const auto &[_, doc] : documents_) {
    if (doc.memory_type() == type) {
      result.push_back(doc);
    }
  }
  return result;
}

std::vector<MemoryDocument> MemoryCollection::query_by_tag(const std::string &tag) const {
  std::vector<MemoryDocument> result;
  for (const auto &[_, doc] : documents_) {
    if (doc.tags.contains(tag)) {
      result.push_back(doc);
    }
  }
  return result;
}

std::vector<MemoryDocument> MemoryCollection::query_by_importance(double min_importance) const {
  std::vector<MemoryDocument> result;
  for (const auto &[_, doc] : documents_) {
    if (doc.importance.value() >= min_importance) {
      result.push_back(doc);
    }
  }
  return result;
}

std::vector<MemoryDocument> MemoryCollection::recent(size_t limit) const {
  std::vector<MemoryDocument> result = all();
  std::stable_sort(result.begin(), result.end(),
                   [](const MemoryDocument &a, const MemoryDocument &b) { return a.updated_at() > b.updated_at(); });
  if (result.size() > limit) {
    result.erase(result.begin() + static_cast<std::ptrdiff_t>(limit), result.end());
  }
  return result;
}

std::vector<MemoryDocument> MemoryCollection::most_important(size_t limit) const {
  std::vector<MemoryDocument> result = all();
  std::stable_sort(result.begin(), result.end(), [](const MemoryDocument &a, const MemoryDocument &b) {
    return a.importance.value() > b.importance.value();
  });
  if (result.size() > limit) {
    result.erase(result.begin() + static_cast<std::ptrdiff_t>(limit), result.end());
  }
  return result;
}
