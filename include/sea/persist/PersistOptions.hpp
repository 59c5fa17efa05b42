#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sea/Json.hpp"
#include "sea/persist/StorageMedium.hpp"

namespace sea::persist {

using SerializeFn   = std::function<std::string(const Value&)>;
using DeserializeFn = std::function<Value(const std::string&)>;

struct PersistOptions {
  std::shared_ptr<StorageMedium> storage;

  // Empty -> Config::persistKeyPrefix + store id.
  std::string key;

  // Allow-list of paths to save; empty saves the whole state.
  std::vector<std::string> paths;

  SerializeFn   serialize;     // default: json::stringify
  DeserializeFn deserialize;   // default: json::fromString

  // Write the initial state when nothing is stored yet.
  bool hydrateInitial = false;
};

} // namespace sea::persist
