#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sea {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // Returns 0 for names never touched.
  double counter(const std::string& name) const;

  // Snapshots (cheap copies) for debug/admin endpoints.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util

// -----------------------------------------------------------------------------
// Per-store counters
// -----------------------------------------------------------------------------

struct StoreMetricsSnapshot {
  uint64_t commits           = 0;   // mutations that bumped the version
  uint64_t noops             = 0;   // setState/patch calls that changed nothing
  uint64_t droppedReentrant  = 0;   // updates dropped by the isUpdating guard
  uint64_t notifications     = 0;   // notification passes (one per commit or batch flush)

  uint64_t getterHits        = 0;
  uint64_t getterRecomputes  = 0;
  uint64_t getterInvalidated = 0;   // entries dropped eagerly by a commit

  uint64_t actions           = 0;
  uint64_t actionErrors      = 0;
  uint64_t listenerErrors    = 0;
  uint64_t persistErrors     = 0;
};

class StoreMetrics {
public:
  void incCommits()           { commits_.fetch_add(1, std::memory_order_relaxed); }
  void incNoops()             { noops_.fetch_add(1, std::memory_order_relaxed); }
  void incDroppedReentrant()  { droppedReentrant_.fetch_add(1, std::memory_order_relaxed); }
  void incNotifications()     { notifications_.fetch_add(1, std::memory_order_relaxed); }

  void incGetterHits()        { getterHits_.fetch_add(1, std::memory_order_relaxed); }
  void incGetterRecomputes()  { getterRecomputes_.fetch_add(1, std::memory_order_relaxed); }
  void incGetterInvalidated() { getterInvalidated_.fetch_add(1, std::memory_order_relaxed); }

  void incActions()           { actions_.fetch_add(1, std::memory_order_relaxed); }
  void incActionErrors()      { actionErrors_.fetch_add(1, std::memory_order_relaxed); }
  void incListenerErrors()    { listenerErrors_.fetch_add(1, std::memory_order_relaxed); }
  void incPersistErrors()     { persistErrors_.fetch_add(1, std::memory_order_relaxed); }

  StoreMetricsSnapshot snapshot() const {
    StoreMetricsSnapshot s;
    s.commits           = commits_.load(std::memory_order_relaxed);
    s.noops             = noops_.load(std::memory_order_relaxed);
    s.droppedReentrant  = droppedReentrant_.load(std::memory_order_relaxed);
    s.notifications     = notifications_.load(std::memory_order_relaxed);

    s.getterHits        = getterHits_.load(std::memory_order_relaxed);
    s.getterRecomputes  = getterRecomputes_.load(std::memory_order_relaxed);
    s.getterInvalidated = getterInvalidated_.load(std::memory_order_relaxed);

    s.actions           = actions_.load(std::memory_order_relaxed);
    s.actionErrors      = actionErrors_.load(std::memory_order_relaxed);
    s.listenerErrors    = listenerErrors_.load(std::memory_order_relaxed);
    s.persistErrors     = persistErrors_.load(std::memory_order_relaxed);
    return s;
  }

private:
  std::atomic<uint64_t> commits_{0};
  std::atomic<uint64_t> noops_{0};
  std::atomic<uint64_t> droppedReentrant_{0};
  std::atomic<uint64_t> notifications_{0};

  std::atomic<uint64_t> getterHits_{0};
  std::atomic<uint64_t> getterRecomputes_{0};
  std::atomic<uint64_t> getterInvalidated_{0};

  std::atomic<uint64_t> actions_{0};
  std::atomic<uint64_t> actionErrors_{0};
  std::atomic<uint64_t> listenerErrors_{0};
  std::atomic<uint64_t> persistErrors_{0};
};

// -----------------------------------------------------------------------------
// Optional convenience macros
// -----------------------------------------------------------------------------
#define SEA_METRIC_INC(name, d) ::sea::util::MetricRegistry::instance().increment((name), (d))
#define SEA_METRIC_HIT(name)    ::sea::util::MetricRegistry::instance().increment((name), 1.0)
#define SEA_METRIC_SET(name, v) ::sea::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace sea
