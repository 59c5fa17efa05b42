#include "sea/OptionsValidator.hpp"
#include "sea/Errors.hpp"
#include "sea/util/Logger.hpp"

#include <set>
#include <string>

namespace sea {

void OptionsValidator::validate(const std::string& id, const StoreOptions& opts, const Value& initial) {
  if (id.empty()) throw ConfigError(id, "store id must not be empty");

  validateState(id, initial);
  validateMembers(id, opts, initial);
  if (opts.persist) validatePersist(id, *opts.persist);

  util::logger().log(util::LogLevel::Debug, "Store options validated", { {"store", id} });
}

void OptionsValidator::validateState(const std::string& id, const Value& initial) {
  if (!initial.IsObject()) {
    throw ConfigError(id, "state factory must produce an object");
  }
}

void OptionsValidator::validateMembers(const std::string& id, const StoreOptions& opts, const Value& initial) {
  std::set<std::string> seen;
  auto claim = [&](const std::string& name, const char* kind, bool callable) {
    if (name.empty()) throw ConfigError(id, std::string(kind) + " name must not be empty");
    if (!callable) throw ConfigError(id, std::string(kind) + " '" + name + "' has no function");
    if (!seen.insert(name).second) {
      throw ConfigError(id, "'" + name + "' is defined more than once across getters and actions");
    }
    if (json::member(initial, name)) {
      throw ConfigError(id, std::string(kind) + " '" + name + "' collides with a state key");
    }
  };

  for (auto& kv : opts.getters)      claim(kv.first, "getter", static_cast<bool>(kv.second));
  for (auto& kv : opts.actions)      claim(kv.first, "action", static_cast<bool>(kv.second));
  for (auto& kv : opts.asyncActions) claim(kv.first, "async action", static_cast<bool>(kv.second));
}

void OptionsValidator::validatePersist(const std::string& id, const persist::PersistOptions& opts) {
  if (!opts.storage) throw ConfigError(id, "persistence needs a storage medium");
  for (auto& p : opts.paths) {
    if (p.empty()) throw ConfigError(id, "persist paths must not be empty");
  }
}

} // namespace sea
