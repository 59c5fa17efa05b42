#include "sea/Store.hpp"
#include "sea/Path.hpp"
#include "sea/Registry.hpp"
#include "sea/persist/PersistAdapter.hpp"
#include "sea/util/Logger.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace sea {

const char* toString(MemberKind kind) {
  switch (kind) {
    case MemberKind::State:    return "state";
    case MemberKind::Getter:   return "getter";
    case MemberKind::Action:   return "action";
    case MemberKind::Property: return "property";
    case MemberKind::None:     break;
  }
  return "none";
}

namespace {

std::string keyOf(const Value& name) {
  return std::string(name.GetString(), name.GetStringLength());
}

// Calls every listener registered when the pass starts, skipping the ones
// removed along the way. Failures are logged and counted, never propagated.
template <typename Table, typename Call>
void fanOut(const Table& table, StoreMetrics& metrics, const std::string& storeId,
            const char* what, Call call) {
  std::vector<std::uint64_t> ids;
  ids.reserve(table.size());
  for (auto& kv : table) ids.push_back(kv.first);

  for (auto id : ids) {
    auto it = table.find(id);
    if (it == table.end()) continue;
    auto cb = it->second;   // the listener may unsubscribe itself
    try {
      call(cb);
    } catch (const std::exception& e) {
      metrics.incListenerErrors();
      util::logger().log(util::LogLevel::Error, std::string(what) + " threw",
                         { {"store", storeId}, {"error", e.what()} });
    } catch (...) {
      metrics.incListenerErrors();
      util::logger().log(util::LogLevel::Error, std::string(what) + " threw",
                         { {"store", storeId}, {"error", "non-standard exception"} });
    }
  }
}

} // namespace

class Store::UpdatingGuard {
public:
  explicit UpdatingGuard(Store& store) : store_(store), prev_(store.updating_) { store_.updating_ = true; }
  ~UpdatingGuard() {
    store_.updating_ = prev_;
    if (!prev_) store_.drainDeferredWrites();
  }

  UpdatingGuard(const UpdatingGuard&) = delete;
  UpdatingGuard& operator=(const UpdatingGuard&) = delete;

private:
  Store& store_;
  bool prev_;
};

Store::Store(std::string id, std::weak_ptr<Registry> registry, Value initial,
             ActionDispatcher::Settings actionSettings)
  : id_(std::move(id)),
    registry_(std::move(registry)),
    state_(json::clone(initial)),
    initial_(std::move(initial)),
    getters_(&metrics_),
    dispatcher_(*this, std::move(actionSettings)) {}

Store::~Store() = default;

std::shared_ptr<Store> Store::build(const std::string& id, const std::shared_ptr<Registry>& registry,
                                    StoreOptions& opts, Value initial) {
  const util::Config& cfg = registry->config();
  ActionDispatcher::Settings settings;
  settings.trackLoading  = cfg.trackLoading;
  settings.loadingSuffix = cfg.loadingSuffix;

  std::shared_ptr<Store> store(new Store(id, registry, std::move(initial), std::move(settings)));

  for (auto& kv : opts.getters)      store->getters_.define(kv.first, kv.second);
  for (auto& kv : opts.actions)      store->dispatcher_.define(kv.first, kv.second);
  for (auto& kv : opts.asyncActions) store->dispatcher_.defineAsync(kv.first, kv.second);

  if (opts.persist) {
    std::string key = opts.persist->key.empty() ? cfg.persistKeyPrefix + id : opts.persist->key;
    store->persist_ = std::make_unique<persist::PersistAdapter>(std::move(*opts.persist), std::move(key));
    store->persist_->attach(*store);
  }
  return store;
}

// ----------------- reads -----------------

Value Store::getState() const { return json::clone(state_); }

Value Store::get(const std::string& p) const {
  const Value* v = path::find(state_, p);
  return v ? json::clone(*v) : Value();
}

bool Store::has(const std::string& p) const {
  return path::find(state_, p) != nullptr;
}

Value Store::initialState() const { return json::clone(initial_); }

Value Store::getter(const std::string& name) {
  return json::clone(getters_.read(name, state_, version_));
}

// ----------------- writes -----------------

bool Store::enter(const char* op) {
  if (!updating_) return true;
  metrics_.incDroppedReentrant();
  util::logger().log(util::LogLevel::Debug, "Re-entrant update dropped",
                     { {"store", id_}, {"op", op} });
  return false;
}

void Store::setState(const Value& partial) {
  if (!partial.IsObject()) throw std::invalid_argument("setState expects an object");
  if (!enter("setState")) return;
  UpdatingGuard guard(*this);
  commit(json::clone(partial), CommitMode::Merge);
}

void Store::setState(const Updater& fn) {
  if (!fn) throw std::invalid_argument("setState updater must be callable");
  if (!enter("setState")) return;
  UpdatingGuard guard(*this);

  Value partial = fn(state_);
  if (partial.IsNull()) return;
  if (!partial.IsObject()) throw std::invalid_argument("setState updater must return an object");
  commit(std::move(partial), CommitMode::Merge);
}

void Store::patch(const Value& partial) {
  if (!partial.IsObject()) throw std::invalid_argument("patch expects an object");
  if (!enter("patch")) return;
  UpdatingGuard guard(*this);

  Value candidate = json::object();
  for (auto& m : partial.GetObject()) {
    const std::string key = keyOf(m.name);
    const Value* cur = json::member(state_, key);
    if (cur && cur->IsObject() && m.value.IsObject()) {
      json::setMember(candidate, key, json::mergeDeep(*cur, m.value));
    } else {
      json::setMember(candidate, key, json::clone(m.value));
    }
  }
  commit(std::move(candidate), CommitMode::Merge);
}

void Store::patch(const DraftFn& fn) {
  if (!fn) throw std::invalid_argument("patch function must be callable");
  if (!enter("patch")) return;
  UpdatingGuard guard(*this);

  Draft draft(state_);
  fn(draft);
  commit(draft.take(), CommitMode::Merge);
}

void Store::reset() {
  if (!enter("reset")) return;
  UpdatingGuard guard(*this);
  commit(json::clone(initial_), CommitMode::Replace);
}

bool Store::commit(Value candidate, CommitMode mode) {
  std::set<std::string> keys;
  for (auto& m : candidate.GetObject()) {
    const Value* cur = json::member(state_, keyOf(m.name));
    if (!cur || !json::equal(*cur, m.value)) keys.insert(keyOf(m.name));
  }
  if (mode == CommitMode::Replace) {
    for (auto& m : state_.GetObject()) {
      if (!json::member(candidate, keyOf(m.name))) keys.insert(keyOf(m.name));
    }
  }

  if (keys.empty()) {
    metrics_.incNoops();
    util::logger().log(util::LogLevel::Trace, "No-op update", { {"store", id_} });
    return false;
  }

  auto& alloc = json::allocator();
  Value prev;
  prev.Swap(state_);
  state_.SetObject();

  // Untouched keys keep their position; changed ones are replaced in place,
  // removed ones (Replace) are skipped, new ones are appended.
  for (auto& m : prev.GetObject()) {
    Value name(m.name, alloc);
    if (!keys.count(keyOf(m.name))) {
      Value copy(m.value, alloc);
      state_.AddMember(name, copy, alloc);
      continue;
    }
    auto it = candidate.FindMember(m.name);
    if (it != candidate.MemberEnd()) state_.AddMember(name, it->value, alloc);
  }
  for (auto& m : candidate.GetObject()) {
    const std::string key = keyOf(m.name);
    if (!keys.count(key) || json::member(prev, key)) continue;
    Value name(m.name, alloc);
    state_.AddMember(name, m.value, alloc);
  }

  Value partial = json::object();
  for (auto& k : keys) {
    const Value* v = json::member(state_, k);
    json::setMember(partial, k, v ? json::clone(*v) : Value());
  }

  ++version_;
  metrics_.incCommits();
  const std::size_t dropped = getters_.invalidate(keys, state_, version_);
  if (dropped) SEA_METRIC_INC("sea.getter.invalidated", static_cast<double>(dropped));

  util::logger().log(util::LogLevel::Trace, "State committed",
                     { {"store", id_}, {"version", std::to_string(version_)},
                       {"keys", std::to_string(keys.size())}, {"dropped", std::to_string(dropped)} });

  auto reg = registry_.lock();
  if (reg && reg->batching()) {
    defer(std::move(prev), keys);
  } else {
    notify(partial, prev);
  }
  return true;
}

void Store::notify(const Value& partial, const Value& prev) {
  metrics_.incNotifications();
  fanOut(setters_, metrics_, id_, "Patch listener",
         [&](const PatchListener& cb) { cb(partial); });
  fanOut(subscribers_, metrics_, id_, "Subscriber",
         [&](const Subscriber& cb) { cb(state_, prev); });
}

void Store::setStateWhenIdle(Value partial) {
  if (!updating_) {
    setState(partial);
    return;
  }
  deferredWrites_.push_back(std::move(partial));
  util::logger().log(util::LogLevel::Debug, "Write queued until the running update ends",
                     { {"store", id_} });
}

void Store::drainDeferredWrites() {
  // Each setState below opens its own guard and drains anything it queues.
  while (!deferredWrites_.empty() && !updating_) {
    Value partial = std::move(deferredWrites_.front());
    deferredWrites_.erase(deferredWrites_.begin());
    try {
      setState(partial);
    } catch (const std::exception& e) {
      util::logger().log(util::LogLevel::Error, "Queued write failed",
                         { {"store", id_}, {"error", e.what()} });
    } catch (...) {
      util::logger().log(util::LogLevel::Error, "Queued write failed",
                         { {"store", id_}, {"error", "non-standard exception"} });
    }
  }
}

void Store::hydrate(const Value& saved) {
  for (auto& m : saved.GetObject()) {
    json::setMember(state_, keyOf(m.name), json::clone(m.value));
  }
}

// ----------------- batching -----------------

void Store::defer(Value prev, const std::set<std::string>& keys) {
  if (!batchPending_) {
    batchPending_ = true;
    batchPrev_ = std::move(prev);
    if (auto reg = registry_.lock()) reg->enqueueFlush(shared_from_this());
  }
  batchKeys_.insert(keys.begin(), keys.end());
}

void Store::flushBatch() {
  if (!batchPending_) return;
  batchPending_ = false;

  Value prev;
  prev.Swap(batchPrev_);
  std::set<std::string> keys;
  keys.swap(batchKeys_);

  // Keys written back to their pre-batch value are not reported.
  Value partial = json::object();
  for (auto& k : keys) {
    const Value* now    = json::member(state_, k);
    const Value* before = json::member(prev, k);
    if (!now && !before) continue;
    if (now && before && json::equal(*now, *before)) continue;
    json::setMember(partial, k, now ? json::clone(*now) : Value());
  }

  if (partial.MemberCount() == 0) {
    util::logger().log(util::LogLevel::Debug, "Batch left state unchanged", { {"store", id_} });
    return;
  }

  UpdatingGuard guard(*this);
  notify(partial, prev);
}

// ----------------- listeners -----------------

template <typename Fn>
Store::Unsubscribe Store::addListener(std::map<std::uint64_t, Fn>& table, Fn cb) {
  if (!cb) throw std::invalid_argument("listener must be callable");
  const std::uint64_t id = nextListenerId_++;
  table.emplace(id, std::move(cb));

  std::weak_ptr<Store> weak = weak_from_this();
  auto* tbl = &table;
  return [weak, tbl, id]() {
    if (auto self = weak.lock()) tbl->erase(id);
  };
}

Store::Unsubscribe Store::subscribe(Subscriber cb) {
  return addListener(subscribers_, std::move(cb));
}

Store::Unsubscribe Store::onPatch(PatchListener cb) {
  return addListener(setters_, std::move(cb));
}

Store::Unsubscribe Store::observe(std::vector<std::string> paths, ObserveFn onChange) {
  if (!onChange) throw std::invalid_argument("observe callback must be callable");

  struct Watch {
    std::vector<std::string> paths;
    std::vector<std::optional<Value>> last;
  };
  auto watch = std::make_shared<Watch>();
  for (auto& p : paths) {
    std::string norm = path::normalize(p);
    if (norm.empty()) continue;
    const Value* v = path::find(state_, norm);
    watch->last.push_back(v ? std::optional<Value>(json::clone(*v)) : std::nullopt);
    watch->paths.push_back(std::move(norm));
  }

  return onPatch([this, watch, onChange](const Value& partial) {
    std::vector<std::string> changed;
    for (std::size_t i = 0; i < watch->paths.size(); ++i) {
      if (!json::member(partial, path::topLevel(watch->paths[i]))) continue;
      const Value* now = path::find(state_, watch->paths[i]);
      if (json::equal(now, watch->last[i])) continue;
      watch->last[i] = now ? std::optional<Value>(json::clone(*now)) : std::nullopt;
      changed.push_back(watch->paths[i]);
    }
    if (!changed.empty()) onChange(changed);
  });
}

Store::Unsubscribe Store::onAction(ActionListener cb) {
  if (!cb) throw std::invalid_argument("listener must be callable");
  auto reg = registry_.lock();
  if (!reg) throw std::logic_error("store '" + id_ + "' outlived its registry");

  std::string storeId = id_;
  return reg->onAction([storeId, cb](const ActionEvent& ev) {
    if (ev.storeId == storeId) cb(ev);
  });
}

void Store::emitAction(const ActionEvent& ev) {
  if (auto reg = registry_.lock()) {
    reg->emitAction(ev);
    return;
  }
  util::logger().log(util::LogLevel::Debug, "Action event dropped; registry is gone",
                     { {"store", id_}, {"action", ev.name} });
}

// ----------------- actions -----------------

Value Store::dispatch(const std::string& action, Value args) {
  return dispatcher_.invoke(action, std::move(args));
}

void Store::dispatchAsync(const std::string& action, Value args, AsyncHandler handler) {
  dispatcher_.invokeAsync(action, std::move(args), std::move(handler));
}

// ----------------- dispatch table -----------------

MemberKind Store::kindOf(const std::string& key) const {
  if (getters_.contains(key))     return MemberKind::Getter;
  if (dispatcher_.contains(key))  return MemberKind::Action;
  if (properties_.count(key))     return MemberKind::Property;
  if (json::member(state_, key))  return MemberKind::State;
  return MemberKind::None;
}

Value Store::read(const std::string& key) {
  switch (kindOf(key)) {
    case MemberKind::Getter:   return getter(key);
    case MemberKind::Property: return json::clone(properties_.at(key));
    case MemberKind::State:    return json::clone(*json::member(state_, key));
    case MemberKind::Action:
      throw std::invalid_argument("'" + key + "' is an action; use dispatch");
    case MemberKind::None:     break;
  }
  return Value();
}

void Store::write(const std::string& key, Value v) {
  switch (kindOf(key)) {
    case MemberKind::Getter:
      throw std::invalid_argument("getter '" + key + "' is read-only");
    case MemberKind::Action:
      throw std::invalid_argument("action '" + key + "' cannot be assigned");
    case MemberKind::Property:
      properties_[key] = std::move(v);
      return;
    case MemberKind::State:
    case MemberKind::None:
      break;
  }
  patch([&](Draft& d) { d.set(key, std::move(v)); });
}

void Store::defineProperty(const std::string& key, Value v) {
  if (getters_.contains(key) || dispatcher_.contains(key)) {
    throw std::invalid_argument("property '" + key + "' collides with a getter or action");
  }
  properties_[key] = std::move(v);
  util::logger().log(util::LogLevel::Debug, "Property defined", { {"store", id_}, {"key", key} });
}

const Value* Store::property(const std::string& key) const {
  auto it = properties_.find(key);
  return it == properties_.end() ? nullptr : &it->second;
}

void Store::defineAction(const std::string& key, ActionFn fn) {
  if (!fn) throw std::invalid_argument("action '" + key + "' must be callable");
  if (getters_.contains(key)) throw std::invalid_argument("action '" + key + "' collides with a getter");
  dispatcher_.define(key, std::move(fn));
  util::logger().log(util::LogLevel::Debug, "Action defined", { {"store", id_}, {"action", key} });
}

void Store::defineAsyncAction(const std::string& key, AsyncActionFn fn) {
  if (!fn) throw std::invalid_argument("action '" + key + "' must be callable");
  if (getters_.contains(key)) throw std::invalid_argument("action '" + key + "' collides with a getter");
  dispatcher_.defineAsync(key, std::move(fn));
  util::logger().log(util::LogLevel::Debug, "Async action defined", { {"store", id_}, {"action", key} });
}

} // namespace sea
