#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "sea/ActionDispatcher.hpp"
#include "sea/GetterCache.hpp"
#include "sea/Json.hpp"
#include "sea/persist/PersistOptions.hpp"

namespace sea {

// Produces the initial state object. Called once per store; the result is
// also kept as the snapshot reset() returns to.
using StateFactory = std::function<Value()>;

struct StoreOptions {
  StateFactory state;
  std::map<std::string, GetterFn> getters;
  std::map<std::string, ActionFn> actions;
  std::map<std::string, AsyncActionFn> asyncActions;
  std::optional<persist::PersistOptions> persist;
};

} // namespace sea
