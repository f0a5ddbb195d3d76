// crdt.hpp
#ifndef CRDT_HPP
#define CRDT_HPP

#include <cstdint>

// Define this if you want to override the default collection types
// Basically define these before including this header and ensure this define is set before this header is included
// in any other files that include this file
#ifndef CRDT_COLLECTIONS_DEFINED
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <set>
#include <vector>

template <typename T> using CrdtVector = std::vector<T>;

using CrdtKey = std::string;

template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using CrdtMap = std::unordered_map<K, V, Hash, KeyEqual>;

template <typename K, typename V, typename Comparator = std::less<K>> using CrdtSortedMap = std::map<K, V, Comparator>;

template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using CrdtSet = std::unordered_set<K, Hash, KeyEqual>;

template <typename T, typename Comparator = std::less<T>> using CrdtSortedSet = std::set<T, Comparator>;

// Replicas are identified by opaque strings (agent instance ids, session ids, ...)
using CrdtReplicaId = std::string;
#endif

#include <algorithm>
#include <compare>
#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <utility>

/// Capability shared by every convergent type in this library.
///
/// `merge` must be a join: commutative, associative and idempotent. Equality compares
/// the replicated state only, so that the semilattice laws can be checked directly.
template <typename T>
concept Mergeable = std::copyable<T> && requires(T a, const T &b) {
  { a.merge(b) } -> std::same_as<void>;
  { a == b } -> std::convertible_to<bool>;
};

/// Pure join of two mergeable values.
template <Mergeable T> [[nodiscard]] T merged(T lhs, const T &rhs) {
  lhs.merge(rhs);
  return lhs;
}

// -----------------------------------------
// VectorClock
// -----------------------------------------

/// Causal relationship between two vector clocks.
enum class ClockOrdering { Before, After, Concurrent, Equal };

inline const char *clock_ordering_name(ClockOrdering ordering) {
  switch (ordering) {
  case ClockOrdering::Before:
    return "before";
  case ClockOrdering::After:
    return "after";
  case ClockOrdering::Concurrent:
    return "concurrent";
  case ClockOrdering::Equal:
    return "equal";
  }
  return "unknown";
}

/// Represents a vector clock for detecting causal order between replicas.
///
/// Entries that are absent count as zero.
class VectorClock {
public:
  VectorClock() = default;

  /// Increments the entry of `replica` and returns its new value.
  ///
  /// The resulting clock strictly dominates the previous one.
  uint64_t tick(const CrdtReplicaId &replica) { return ++clock_[replica]; }

  /// Retrieves the counter recorded for `replica`.
  uint64_t get(const CrdtReplicaId &replica) const {
    auto it = clock_.find(replica);
    return it == clock_.end() ? 0 : it->second;
  }

  /// Sets the counter of `replica` (used when loading from disk).
  void set(const CrdtReplicaId &replica, uint64_t value) {
    if (value == 0) {
      clock_.erase(replica);
    } else {
      clock_[replica] = value;
    }
  }

  /// Pointwise max. The result dominates both inputs.
  void merge(const VectorClock &other) {
    for (const auto &[replica, value] : other.clock_) {
      auto &local = clock_[replica];
      local = std::max(local, value);
    }
  }

  /// Compares the causal history of this clock with `other`.
  ///
  /// Complexity: O(n + m)
  ClockOrdering compare(const VectorClock &other) const {
    bool less = false;
    bool greater = false;

    for (const auto &[replica, value] : clock_) {
      uint64_t theirs = other.get(replica);
      if (value < theirs) {
        less = true;
      } else if (value > theirs) {
        greater = true;
      }
    }
    for (const auto &[replica, value] : other.clock_) {
      if (!clock_.contains(replica) && value > 0) {
        less = true;
      }
    }

    if (less && greater)
      return ClockOrdering::Concurrent;
    if (less)
      return ClockOrdering::Before;
    if (greater)
      return ClockOrdering::After;
    return ClockOrdering::Equal;
  }

  bool happened_before(const VectorClock &other) const { return compare(other) == ClockOrdering::Before; }

  bool concurrent(const VectorClock &other) const { return compare(other) == ClockOrdering::Concurrent; }

  /// True when this clock is greater than or equal to `other` in every entry.
  bool dominates(const VectorClock &other) const {
    auto ordering = compare(other);
    return ordering == ClockOrdering::After || ordering == ClockOrdering::Equal;
  }

  const CrdtMap<CrdtReplicaId, uint64_t> &entries() const { return clock_; }

  bool empty() const { return clock_.empty(); }

  friend bool operator==(const VectorClock &lhs, const VectorClock &rhs) {
    return lhs.compare(rhs) == ClockOrdering::Equal;
  }

private:
  CrdtMap<CrdtReplicaId, uint64_t> clock_;
};

// -----------------------------------------
// GSet
// -----------------------------------------

/// Grow-only set. Elements can only be added; merge is set union.
template <typename T, typename Hash = std::hash<T>> class GSet {
public:
  GSet() = default;

  /// Inserts `element`. Returns true if it was not present yet.
  bool add(const T &element) { return elements_.insert(element).second; }

  bool contains(const T &element) const { return elements_.contains(element); }

  /// Elements in ascending order (stable output for indexing and tests).
  CrdtVector<T> elements() const {
    CrdtVector<T> result(elements_.begin(), elements_.end());
    std::sort(result.begin(), result.end());
    return result;
  }

  size_t size() const { return elements_.size(); }

  bool empty() const { return elements_.empty(); }

  void merge(const GSet &other) {
    for (const auto &element : other.elements_) {
      elements_.insert(element);
    }
  }

  friend bool operator==(const GSet &lhs, const GSet &rhs) { return lhs.elements_ == rhs.elements_; }

private:
  CrdtSet<T, Hash> elements_;
};

// -----------------------------------------
// ORSet
// -----------------------------------------

/// Unique identifier minted by every ORSet add.
struct OrTag {
  CrdtReplicaId replica;
  uint64_t counter = 0;

  auto operator<=>(const OrTag &) const = default;
  bool operator==(const OrTag &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const OrTag &tag) {
    os << "(" << tag.replica << ", " << tag.counter << ")";
    return os;
  }
};

struct OrTagHash {
  std::size_t operator()(const OrTag &tag) const {
    std::size_t seed = std::hash<CrdtReplicaId>()(tag.replica);
    seed ^= std::hash<uint64_t>()(tag.counter) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

using OrTagSet = CrdtSet<OrTag, OrTagHash>;

/// Observed-remove set with add-wins semantics.
///
/// Every add mints a fresh tag; a remove deletes only the tags the caller observed.
/// Removed tags are remembered so that merging with a stale copy does not bring an
/// element back, while an add the remover never saw survives the merge.
template <typename T, typename Hash = std::hash<T>> class ORSet {
public:
  ORSet() = default;

  /// Adds `element` under a new tag `(replica, counter)` and returns the tag.
  ///
  /// The counter is per set, not per replica, and merges as a max. Tags stay unique only
  /// while each replica mints from one copy at a time: two stale copies edited by the
  /// same replica can mint the same tag, and a remove on one then hides the other's add.
  OrTag add(const T &element, const CrdtReplicaId &replica) {
    OrTag tag{replica, ++counter_};
    entries_[element].added.insert(tag);
    return tag;
  }

  /// Adds `element` under an explicit tag (used when loading from disk).
  void add_with_tag(const T &element, const OrTag &tag) {
    entries_[element].added.insert(tag);
    counter_ = std::max(counter_, tag.counter);
  }

  /// Removes the given tags of `element`. Unknown elements and tags are ignored.
  void remove(const T &element, const CrdtVector<OrTag> &observed) {
    auto it = entries_.find(element);
    if (it == entries_.end()) {
      return;
    }
    for (const auto &tag : observed) {
      if (it->second.added.contains(tag)) {
        it->second.removed.insert(tag);
      }
    }
  }

  /// Removes every tag of `element` currently visible and returns them.
  CrdtVector<OrTag> remove_all(const T &element) {
    CrdtVector<OrTag> observed = tags(element);
    remove(element, observed);
    return observed;
  }

  /// Marks a tag as removed without the add being present (used when loading from disk).
  void remove_with_tag(const T &element, const OrTag &tag) {
    auto &entry = entries_[element];
    entry.added.insert(tag);
    entry.removed.insert(tag);
    counter_ = std::max(counter_, tag.counter);
  }

  /// Live tags of `element`, sorted.
  CrdtVector<OrTag> tags(const T &element) const {
    CrdtVector<OrTag> result;
    auto it = entries_.find(element);
    if (it == entries_.end()) {
      return result;
    }
    for (const auto &tag : it->second.added) {
      if (!it->second.removed.contains(tag)) {
        result.push_back(tag);
      }
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  bool contains(const T &element) const {
    auto it = entries_.find(element);
    return it != entries_.end() && it->second.live();
  }

  /// Present elements in ascending order.
  CrdtVector<T> elements() const {
    CrdtVector<T> result;
    for (const auto &[element, entry] : entries_) {
      if (entry.live()) {
        result.push_back(element);
      }
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  size_t size() const {
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const auto &kv) { return kv.second.live(); }));
  }

  bool empty() const { return size() == 0; }

  /// Per-element union of added and removed tags; presence is recomputed from the result.
  void merge(const ORSet &other) {
    for (const auto &[element, entry] : other.entries_) {
      auto &local = entries_[element];
      local.added.insert(entry.added.begin(), entry.added.end());
      local.removed.insert(entry.removed.begin(), entry.removed.end());
    }
    counter_ = std::max(counter_, other.counter_);
  }

  /// Visits every (element, tag, removed) triple, including removed tags.
  template <typename Visitor> void for_each_tag(Visitor &&visit) const {
    for (const auto &[element, entry] : entries_) {
      for (const auto &tag : entry.added) {
        visit(element, tag, entry.removed.contains(tag));
      }
    }
  }

  uint64_t counter() const { return counter_; }

  // The tag counter is bookkeeping for minting, not replicated state
  friend bool operator==(const ORSet &lhs, const ORSet &rhs) {
    auto non_empty = [](const auto &entries) {
      return std::count_if(entries.begin(), entries.end(), [](const auto &kv) { return !kv.second.added.empty(); });
    };
    if (non_empty(lhs.entries_) != non_empty(rhs.entries_))
      return false;
    for (const auto &[element, entry] : lhs.entries_) {
      if (entry.added.empty())
        continue;
      auto it = rhs.entries_.find(element);
      if (it == rhs.entries_.end() || it->second.added != entry.added || it->second.removed != entry.removed)
        return false;
    }
    return true;
  }

private:
  struct Entry {
    OrTagSet added;
    OrTagSet removed;

    bool live() const {
      for (const auto &tag : added) {
        if (!removed.contains(tag))
          return true;
      }
      return false;
    }
  };

  CrdtMap<T, Entry, Hash> entries_;
  uint64_t counter_ = 0;
};

// -----------------------------------------
// LWWRegister
// -----------------------------------------

/// Default last-writer-wins rule: higher timestamp wins, writer id breaks ties.
struct DefaultLwwRule {
  constexpr bool operator()(double local_ts, const CrdtReplicaId &local_writer, double remote_ts,
                            const CrdtReplicaId &remote_writer) const {
    if (remote_ts > local_ts) {
      return true;
    } else if (remote_ts < local_ts) {
      return false;
    } else {
      return remote_writer > local_writer;
    }
  }
};

/// Last-writer-wins register holding `(value, timestamp, writer)`.
template <typename T> class LWWRegister {
public:
  LWWRegister() = default;

  LWWRegister(T value, double timestamp, CrdtReplicaId writer)
      : value_(std::move(value)), timestamp_(timestamp), writer_(std::move(writer)) {}

  /// Overwrites the register iff `(timestamp, writer)` is greater than the stored pair.
  ///
  /// Returns true if the value was replaced.
  bool set(T value, double timestamp, const CrdtReplicaId &writer) {
    if (!wins(value, timestamp, writer)) {
      return false;
    }
    value_ = std::move(value);
    timestamp_ = timestamp;
    writer_ = writer;
    return true;
  }

  /// Keeps the dominating triple; the result does not depend on merge direction.
  void merge(const LWWRegister &other) {
    if (!other.value_) {
      return;
    }
    if (wins(*other.value_, other.timestamp_, other.writer_)) {
      value_ = other.value_;
      timestamp_ = other.timestamp_;
      writer_ = other.writer_;
    }
  }

  const std::optional<T> &get() const { return value_; }

  T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

  bool has_value() const { return value_.has_value(); }

  double timestamp() const { return timestamp_; }

  const CrdtReplicaId &writer() const { return writer_; }

  friend bool operator==(const LWWRegister &lhs, const LWWRegister &rhs) {
    return lhs.value_ == rhs.value_ && lhs.timestamp_ == rhs.timestamp_ && lhs.writer_ == rhs.writer_;
  }

private:
  bool wins(const T &value, double timestamp, const CrdtReplicaId &writer) const {
    if (!value_) {
      return true;
    }
    DefaultLwwRule rule;
    if (rule(timestamp_, writer_, timestamp, writer)) {
      return true;
    }
    if (timestamp == timestamp_ && writer == writer_) {
      // Same writer reused a timestamp; order by value so every replica agrees
      if constexpr (std::totally_ordered<T>) {
        return *value_ < value;
      }
    }
    return false;
  }

  std::optional<T> value_;
  double timestamp_ = 0.0;
  CrdtReplicaId writer_;
};

/// LWW register for numeric scores. Reads fall back to a default while unset.
class LWWNumericRegister : public LWWRegister<double> {
public:
  explicit LWWNumericRegister(double default_value = 0.0) : default_value_(default_value) {}

  double value() const { return value_or(default_value_); }

  double default_value() const { return default_value_; }

private:
  double default_value_;
};

// -----------------------------------------
// GCounter
// -----------------------------------------

/// Grow-only counter: one monotone slot per replica, value is the sum.
class GCounter {
public:
  GCounter() = default;

  void increment(const CrdtReplicaId &replica, uint64_t amount = 1) { counts_[replica] += amount; }

  uint64_t value() const {
    uint64_t total = 0;
    for (const auto &[_, count] : counts_) {
      total += count;
    }
    return total;
  }

  uint64_t get(const CrdtReplicaId &replica) const {
    auto it = counts_.find(replica);
    return it == counts_.end() ? 0 : it->second;
  }

  /// Sets the slot of `replica` (used when loading from disk).
  void set(const CrdtReplicaId &replica, uint64_t count) {
    if (count == 0) {
      counts_.erase(replica);
    } else {
      counts_[replica] = count;
    }
  }

  /// Pointwise max per replica.
  void merge(const GCounter &other) {
    for (const auto &[replica, count] : other.counts_) {
      auto &local = counts_[replica];
      local = std::max(local, count);
    }
  }

  const CrdtMap<CrdtReplicaId, uint64_t> &entries() const { return counts_; }

  friend bool operator==(const GCounter &lhs, const GCounter &rhs) {
    for (const auto &[replica, count] : lhs.counts_) {
      if (rhs.get(replica) != count)
        return false;
    }
    for (const auto &[replica, count] : rhs.counts_) {
      if (lhs.get(replica) != count)
        return false;
    }
    return true;
  }

private:
  CrdtMap<CrdtReplicaId, uint64_t> counts_;
};

static_assert(Mergeable<VectorClock>);
static_assert(Mergeable<GSet<CrdtKey>>);
static_assert(Mergeable<ORSet<CrdtKey>>);
static_assert(Mergeable<LWWRegister<CrdtKey>>);
static_assert(Mergeable<LWWNumericRegister>);
static_assert(Mergeable<GCounter>);

#endif // CRDT_HPP
