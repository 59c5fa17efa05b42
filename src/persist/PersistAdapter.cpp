#include "sea/persist/PersistAdapter.hpp"
#include "sea/Path.hpp"
#include "sea/Store.hpp"
#include "sea/util/Logger.hpp"
#include "sea/util/Metrics.hpp"

#include <stdexcept>

namespace sea::persist {

PersistAdapter::PersistAdapter(PersistOptions opts, std::string key)
  : opts_(std::move(opts)), key_(std::move(key)) {
  if (!opts_.storage) throw std::invalid_argument("PersistAdapter needs a storage medium");
}

void PersistAdapter::attach(Store& store) {
  hydrate(store);
  // The adapter lives inside the store, so the reference cannot dangle.
  store.subscribe([this, &store](const Value& newState, const Value&) { save(store, newState); });
}

void PersistAdapter::hydrate(Store& store) const {
  std::optional<std::string> saved;
  try {
    saved = opts_.storage->get(key_);
  } catch (const std::exception& e) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be read",
                       { {"store", store.id()}, {"key", key_}, {"error", e.what()} });
    return;
  } catch (...) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be read",
                       { {"store", store.id()}, {"key", key_}, {"error", "non-standard exception"} });
    return;
  }

  if (!saved || saved->empty()) {
    if (opts_.hydrateInitial) save(store, store.state());
    return;
  }

  Value restored;
  try {
    restored = opts_.deserialize ? opts_.deserialize(*saved) : json::fromString(*saved);
  } catch (const std::exception& e) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be parsed",
                       { {"store", store.id()}, {"key", key_}, {"error", e.what()} });
    return;
  } catch (...) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be parsed",
                       { {"store", store.id()}, {"key", key_}, {"error", "non-standard exception"} });
    return;
  }

  if (!restored.IsObject()) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state is not an object; ignored",
                       { {"store", store.id()}, {"key", key_} });
    return;
  }

  store.hydrate(restored);
  util::logger().log(util::LogLevel::Info, "Store hydrated",
                     { {"store", store.id()}, {"key", key_},
                       {"keys", std::to_string(restored.MemberCount())} });
}

Value PersistAdapter::extract(const Value& state) const {
  if (opts_.paths.empty()) return json::clone(state);

  Value out = json::object();
  for (auto& p : opts_.paths) {
    const Value* v = path::find(state, p);
    if (v) path::assign(out, p, json::clone(*v));
  }
  return out;
}

void PersistAdapter::save(Store& store, const Value& state) const {
  try {
    Value out = extract(state);
    const std::string blob = opts_.serialize ? opts_.serialize(out) : json::stringify(out);
    opts_.storage->set(key_, blob);
  } catch (const std::exception& e) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be written",
                       { {"store", store.id()}, {"key", key_}, {"error", e.what()} });
  } catch (...) {
    store.metrics_.incPersistErrors();
    SEA_METRIC_HIT("sea.persist.errors");
    util::logger().log(util::LogLevel::Warn, "Persisted state could not be written",
                       { {"store", store.id()}, {"key", key_}, {"error", "non-standard exception"} });
  }
}

} // namespace sea::persist
