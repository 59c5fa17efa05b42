#include "sea/Registry.hpp"
#include "sea/Errors.hpp"
#include "sea/OptionsValidator.hpp"
#include "sea/util/Logger.hpp"
#include "sea/util/Metrics.hpp"

#include <stdexcept>
#include <utility>

namespace sea {

std::shared_ptr<Registry> Registry::create() {
  return std::shared_ptr<Registry>(new Registry(util::Config{}));
}

std::shared_ptr<Registry> Registry::create(const util::Config& cfg) {
  util::configureLogging(cfg);
  return std::shared_ptr<Registry>(new Registry(cfg));
}

Registry::Registry(util::Config cfg) : config_(std::move(cfg)) {}

Registry::~Registry() = default;

bool Registry::use(std::shared_ptr<Plugin> plugin) {
  if (!plugin) throw std::invalid_argument("plugin must not be null");
  const std::string name = plugin->name();
  if (hasPlugin(name)) {
    util::logger().log(util::LogLevel::Warn, "Plugin already installed", { {"plugin", name} });
    return false;
  }

  plugins_.push_back(plugin);
  plugin->install(*this);
  util::logger().log(util::LogLevel::Info, "Plugin installed", { {"plugin", name} });
  return true;
}

bool Registry::hasPlugin(const std::string& name) const {
  for (auto& p : plugins_) {
    if (p->name() == name) return true;
  }
  return false;
}

std::shared_ptr<Store> Registry::defineStore(const std::string& id, StoreOptions opts) {
  if (auto existing = getStore(id)) {
    util::logger().log(util::LogLevel::Debug, "Store already defined; reusing", { {"store", id} });
    return existing;
  }
  return build(id, opts);
}

std::shared_ptr<Store> Registry::createStore(const std::string& id, StoreOptions opts) {
  if (stores_.count(id)) throw ConfigError(id, "a store with this id already exists");
  return build(id, opts);
}

std::shared_ptr<Store> Registry::build(const std::string& id, StoreOptions& opts) {
  if (id.empty()) throw ConfigError(id, "store id must not be empty");

  Value initial = opts.state ? opts.state() : json::object();
  OptionsValidator::validate(id, opts, initial);

  auto store = Store::build(id, shared_from_this(), opts, std::move(initial));
  stores_[id] = store;
  SEA_METRIC_HIT("sea.registry.stores_created");
  SEA_METRIC_SET("sea.registry.stores", static_cast<double>(stores_.size()));
  util::logger().log(util::LogLevel::Info, "Store created",
                     { {"store", id}, {"getters", std::to_string(opts.getters.size())},
                       {"actions", std::to_string(opts.actions.size() + opts.asyncActions.size())} });

  // Copy: a hook may install another plugin.
  auto plugins = plugins_;
  for (auto& p : plugins) {
    try {
      p->storeCreated(*store);
    } catch (const std::exception& e) {
      util::logger().log(util::LogLevel::Error, "Plugin storeCreated hook threw",
                         { {"plugin", p->name()}, {"store", id}, {"error", e.what()} });
    } catch (...) {
      util::logger().log(util::LogLevel::Error, "Plugin storeCreated hook threw",
                         { {"plugin", p->name()}, {"store", id}, {"error", "non-standard exception"} });
    }
  }
  return store;
}

std::shared_ptr<Store> Registry::getStore(const std::string& id) const {
  auto it = stores_.find(id);
  return it == stores_.end() ? nullptr : it->second;
}

std::vector<std::string> Registry::storeIds() const {
  std::vector<std::string> ids;
  ids.reserve(stores_.size());
  for (auto& kv : stores_) ids.push_back(kv.first);
  return ids;
}

Registry::Unsubscribe Registry::onAction(ActionListener cb) {
  if (!cb) throw std::invalid_argument("listener must be callable");
  const std::uint64_t id = nextListenerId_++;
  actionListeners_.emplace(id, std::move(cb));

  std::weak_ptr<Registry> weak = weak_from_this();
  return [weak, id]() {
    if (auto self = weak.lock()) self->actionListeners_.erase(id);
  };
}

void Registry::emitAction(const ActionEvent& ev) {
  std::vector<std::uint64_t> ids;
  ids.reserve(actionListeners_.size());
  for (auto& kv : actionListeners_) ids.push_back(kv.first);

  for (auto id : ids) {
    auto it = actionListeners_.find(id);
    if (it == actionListeners_.end()) continue;
    auto cb = it->second;
    try {
      cb(ev);
    } catch (const std::exception& e) {
      if (auto store = getStore(ev.storeId)) store->metrics_.incListenerErrors();
      util::logger().log(util::LogLevel::Error, "Action listener threw",
                         { {"store", ev.storeId}, {"action", ev.name}, {"error", e.what()} });
    } catch (...) {
      if (auto store = getStore(ev.storeId)) store->metrics_.incListenerErrors();
      util::logger().log(util::LogLevel::Error, "Action listener threw",
                         { {"store", ev.storeId}, {"action", ev.name}, {"error", "non-standard exception"} });
    }
  }
}

void Registry::batch(const std::function<void()>& fn) {
  if (!fn) return;
  ++batchDepth_;
  try {
    fn();
  } catch (...) {
    if (--batchDepth_ == 0) flushBatches();
    throw;
  }
  if (--batchDepth_ == 0) flushBatches();
}

void Registry::enqueueFlush(std::shared_ptr<Store> store) {
  pendingFlush_.push_back(std::move(store));
}

void Registry::flushBatches() {
  // A listener may open another batch; whatever it queues is flushed by it.
  std::vector<std::shared_ptr<Store>> pending;
  pending.swap(pendingFlush_);
  for (auto& store : pending) store->flushBatch();
}

} // namespace sea
