#pragma once

#include <memory>
#include <string>

#include "sea/Json.hpp"
#include "sea/persist/PersistOptions.hpp"

namespace sea {
class Store;
}

namespace sea::persist {

/**
 * Binds one store to a storage medium: hydrates it once on attach, then
 * writes the (allow-listed) state after every change. Medium and codec
 * failures are logged as warnings and counted in the store's metrics.
 */
class PersistAdapter {
public:
  PersistAdapter(PersistOptions opts, std::string key);

  // Hydrate, optionally seed the medium, then subscribe for writes.
  void attach(Store& store);

  // Allow-listed copy of `state` (the whole state when no paths are set).
  Value extract(const Value& state) const;

  void save(Store& store, const Value& state) const;

  const std::string& key() const noexcept { return key_; }

private:
  void hydrate(Store& store) const;

  PersistOptions opts_;
  std::string key_;
};

} // namespace sea::persist
