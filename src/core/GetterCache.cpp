#include "sea/GetterCache.hpp"
#include "sea/util/Logger.hpp"
#include "sea/util/Metrics.hpp"

#include <stdexcept>

namespace sea {

GetterContext::GetterContext(GetterCache& cache, const Value& state, std::uint64_t version,
                             PathSet& paths, PathSet& reads, std::string name)
  : cache_(cache), stateRoot_(state), version_(version), paths_(paths), reads_(reads),
    tracer_(state, paths, &reads), name_(std::move(name)) {}

Value GetterContext::getter(const std::string& name) {
  return json::clone(cache_.read(name, stateRoot_, version_, &paths_, &reads_));
}

GetterCache::GetterCache(StoreMetrics* metrics) : metrics_(metrics) {}

void GetterCache::define(const std::string& name, GetterFn fn) {
  Slot s;
  s.fn = std::move(fn);
  slots_[name] = std::move(s);
}

bool GetterCache::contains(const std::string& name) const {
  return slots_.count(name) > 0;
}

std::vector<std::string> GetterCache::names() const {
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (auto& kv : slots_) out.push_back(kv.first);
  return out;
}

const CacheEntry* GetterCache::entry(const std::string& name) const {
  auto it = slots_.find(name);
  if (it == slots_.end() || !it->second.entry) return nullptr;
  return &*it->second.entry;
}

bool GetterCache::isValid(CacheEntry& e, const Value& state, std::uint64_t version) {
  if (e.version == version) return true;

  for (auto& kv : e.pathSnapshot) {
    const Value* live = path::find(state, paths_.segments(kv.first));
    if (!json::equal(live, kv.second)) return false;
  }
  e.version = version;
  return true;
}

namespace {

void mergeInto(const CacheEntry& e, PathSet* outerPaths, PathSet* outerReads) {
  if (outerPaths) outerPaths->insert(e.trackedPaths.begin(), e.trackedPaths.end());
  if (outerReads) {
    for (auto& kv : e.pathSnapshot) outerReads->insert(kv.first);
  }
}

struct ComputingGuard {
  explicit ComputingGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~ComputingGuard() { flag_ = false; }
  bool& flag_;
};
} // namespace

const Value& GetterCache::read(const std::string& name, const Value& state, std::uint64_t version,
                               PathSet* outerPaths, PathSet* outerReads) {
  auto it = slots_.find(name);
  if (it == slots_.end()) throw std::out_of_range("unknown getter '" + name + "'");
  Slot& slot = it->second;

  if (slot.entry && isValid(*slot.entry, state, version)) {
    if (metrics_) metrics_->incGetterHits();
    mergeInto(*slot.entry, outerPaths, outerReads);
    return slot.entry->value;
  }

  if (slot.computing) throw std::logic_error("circular getter dependency through '" + name + "'");

  // Paths are collected from scratch on every computation so a dependency
  // set that shrinks (conditional reads) is never tracked stale.
  slot.entry.reset();
  CacheEntry fresh;
  PathSet reads;
  {
    ComputingGuard guard(slot.computing);
    GetterContext ctx(*this, state, version, fresh.trackedPaths, reads, name);
    fresh.value = slot.fn(ctx);
  }

  for (auto& p : reads) {
    const Value* live = path::find(state, paths_.segments(p));
    fresh.pathSnapshot.emplace(p, live ? std::optional<Value>(json::clone(*live)) : std::nullopt);
  }
  fresh.version = version;

  if (metrics_) metrics_->incGetterRecomputes();
  util::logger().log(util::LogLevel::Trace, "Getter recomputed",
                     { {"getter", name}, {"paths", std::to_string(fresh.trackedPaths.size())} });

  mergeInto(fresh, outerPaths, outerReads);
  slot.entry = std::move(fresh);
  return slot.entry->value;
}

std::size_t GetterCache::invalidate(const std::set<std::string>& changedTopKeys,
                                    const Value& state, std::uint64_t version) {
  std::size_t dropped = 0;
  for (auto& kv : slots_) {
    auto& entry = kv.second.entry;
    if (!entry) continue;

    bool touched = false;
    for (auto& p : entry->trackedPaths) {
      const auto& segs = paths_.segments(p);
      if (!segs.empty() && changedTopKeys.count(segs.front())) {
        touched = true;
        break;
      }
    }
    if (!touched || isValid(*entry, state, version)) continue;

    entry.reset();
    ++dropped;
    if (metrics_) metrics_->incGetterInvalidated();
  }
  return dropped;
}

} // namespace sea
