#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sea/Json.hpp"
#include "sea/Path.hpp"
#include "sea/Tracer.hpp"

namespace sea {

class GetterCache;
class StoreMetrics;

// Receiver handed to a getter body: the traced state plus sibling getters.
class GetterContext {
public:
  const Tracer& state() const noexcept { return tracer_; }
  const Value& get(const std::string& path) const { return tracer_.get(path); }
  bool has(const std::string& path) const { return tracer_.has(path); }

  // Value of a sibling getter. The sibling's dependencies become ours.
  Value getter(const std::string& name);

  const std::string& name() const noexcept { return name_; }

private:
  friend class GetterCache;
  GetterContext(GetterCache& cache, const Value& state, std::uint64_t version,
                PathSet& paths, PathSet& reads, std::string name);

  GetterCache& cache_;
  const Value& stateRoot_;
  std::uint64_t version_;
  PathSet& paths_;
  PathSet& reads_;
  Tracer tracer_;
  std::string name_;
};

using GetterFn = std::function<Value(GetterContext&)>;

struct CacheEntry {
  Value value;
  std::uint64_t version = 0;
  PathSet trackedPaths;   // every traversed prefix
  // Values at the paths actually read; nullopt when the path was absent.
  std::map<std::string, std::optional<Value>> pathSnapshot;
};

/**
 * Lazily computed, path-tracked getter values for one store. The table of
 * getters is fixed when the store is defined; entries fill in on first read.
 */
class GetterCache {
public:
  explicit GetterCache(StoreMetrics* metrics = nullptr);

  void define(const std::string& name, GetterFn fn);
  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;

  // Throws std::out_of_range for unknown names and std::logic_error when a
  // getter reaches itself through sibling reads. When `outerPaths` /
  // `outerReads` are given, the getter's dependencies are merged into them.
  const Value& read(const std::string& name, const Value& state, std::uint64_t version,
                    PathSet* outerPaths = nullptr, PathSet* outerReads = nullptr);

  // Called after a commit: entries tracking one of the changed top-level
  // keys are re-checked against `state` and dropped when a read value
  // differs. Returns the number dropped.
  std::size_t invalidate(const std::set<std::string>& changedTopKeys,
                         const Value& state, std::uint64_t version);

  const CacheEntry* entry(const std::string& name) const;

private:
  struct Slot {
    GetterFn fn;
    std::optional<CacheEntry> entry;
    bool computing = false;
  };

  bool isValid(CacheEntry& e, const Value& state, std::uint64_t version);

  std::map<std::string, Slot> slots_;
  path::PathTable paths_;
  StoreMetrics* metrics_;
};

} // namespace sea
