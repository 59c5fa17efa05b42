#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "sea/ActionDispatcher.hpp"
#include "sea/ActionEvent.hpp"
#include "sea/Draft.hpp"
#include "sea/GetterCache.hpp"
#include "sea/Json.hpp"
#include "sea/StoreOptions.hpp"
#include "sea/util/Metrics.hpp"

namespace sea {

class Registry;

namespace persist { class PersistAdapter; }

// What a key resolves to through Store::read / Store::write.
enum class MemberKind { None, State, Getter, Action, Property };

const char* toString(MemberKind kind);

/**
 * A named, versioned state object. Every committed mutation bumps the
 * version, drops dependent getter entries and notifies fine-grained setters
 * (changed-keys partial) and then subscribers (new/old state), both in
 * registration order.
 *
 * Stores are created by a Registry and must be used from one thread.
 */
class Store : public std::enable_shared_from_this<Store> {
public:
  using Unsubscribe    = std::function<void()>;
  using Subscriber     = std::function<void(const Value& newState, const Value& oldState)>;
  using PatchListener  = std::function<void(const Value& partial)>;
  using ObserveFn      = std::function<void(const std::vector<std::string>& changedPaths)>;
  using ActionListener = std::function<void(const ActionEvent&)>;
  using Updater        = std::function<Value(const Value& prev)>;
  using DraftFn        = std::function<void(Draft&)>;

  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  const std::string& id() const noexcept { return id_; }
  std::uint64_t version() const noexcept { return version_; }

  // Deep copy of the current state.
  Value getState() const;
  // Live state; valid until the next mutation.
  const Value& state() const noexcept { return state_; }

  Value get(const std::string& path) const;   // null when absent
  bool has(const std::string& path) const;

  Value initialState() const;

  void setState(const Value& partial);
  void setState(const Updater& fn);

  // Objects are deep-merged; arrays and scalars replace.
  void patch(const Value& partial);
  // The function edits a draft; only written, actually different top-level
  // keys are committed. A throwing function leaves the state untouched.
  void patch(const DraftFn& fn);

  void reset();

  Unsubscribe subscribe(Subscriber cb);
  Unsubscribe onPatch(PatchListener cb);
  Unsubscribe observe(std::vector<std::string> paths, ObserveFn onChange);
  Unsubscribe onAction(ActionListener cb);

  Value getter(const std::string& name);
  const CacheEntry* cacheEntry(const std::string& name) const { return getters_.entry(name); }

  Value dispatch(const std::string& action, Value args = json::array());
  void dispatchAsync(const std::string& action, Value args, AsyncHandler handler = {});

  // Dispatch table: getters and actions first, then plugin properties, then
  // live state keys.
  MemberKind kindOf(const std::string& key) const;
  Value read(const std::string& key);
  void write(const std::string& key, Value v);

  // Plugin contributions.
  void defineProperty(const std::string& key, Value v);
  const Value* property(const std::string& key) const;
  void defineAction(const std::string& key, ActionFn fn);
  void defineAsyncAction(const std::string& key, AsyncActionFn fn);

  std::vector<std::string> getterNames() const { return getters_.names(); }
  std::vector<std::string> actionNames() const { return dispatcher_.names(); }

  std::shared_ptr<Registry> registry() const { return registry_.lock(); }
  StoreMetricsSnapshot metrics() const { return metrics_.snapshot(); }

private:
  friend class Registry;
  friend class ActionDispatcher;
  friend class persist::PersistAdapter;

  enum class CommitMode { Merge, Replace };

  // Holds updating_ for one operation; the outermost one applies writes
  // queued by setStateWhenIdle on release.
  class UpdatingGuard;

  Store(std::string id, std::weak_ptr<Registry> registry, Value initial,
        ActionDispatcher::Settings actionSettings);

  static std::shared_ptr<Store> build(const std::string& id, const std::shared_ptr<Registry>& registry,
                                      StoreOptions& opts, Value initial);

  // Applies `candidate` (top-level key -> new value). Returns false when
  // nothing differed.
  bool commit(Value candidate, CommitMode mode);
  void notify(const Value& partial, const Value& prev);
  bool enter(const char* op);

  // Shallow merge without version bump or notification (persistence).
  void hydrate(const Value& saved);

  void defer(Value prev, const std::set<std::string>& keys);
  void flushBatch();

  void emitAction(const ActionEvent& ev);

  // setState now, or right after the running update when called from inside
  // one (bookkeeping writes such as loading flags must not be dropped).
  void setStateWhenIdle(Value partial);
  void drainDeferredWrites();

  template <typename Fn>
  Unsubscribe addListener(std::map<std::uint64_t, Fn>& table, Fn cb);

  std::string id_;
  std::weak_ptr<Registry> registry_;

  Value state_;
  Value initial_;
  std::uint64_t version_ = 0;
  bool updating_ = false;
  std::vector<Value> deferredWrites_;

  StoreMetrics metrics_;
  GetterCache getters_;
  ActionDispatcher dispatcher_;
  std::map<std::string, Value> properties_;

  std::uint64_t nextListenerId_ = 1;
  std::map<std::uint64_t, Subscriber> subscribers_;
  std::map<std::uint64_t, PatchListener> setters_;

  bool batchPending_ = false;
  Value batchPrev_;
  std::set<std::string> batchKeys_;

  std::unique_ptr<persist::PersistAdapter> persist_;
};

} // namespace sea
