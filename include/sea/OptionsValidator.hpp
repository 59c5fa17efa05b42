#pragma once

#include <string>

#include "sea/Json.hpp"
#include "sea/StoreOptions.hpp"

namespace sea {

// Definition-time checks for StoreOptions. Every failure is a ConfigError.
class OptionsValidator {
public:
  static void validate(const std::string& id, const StoreOptions& opts, const Value& initial);

  static void validateState(const std::string& id, const Value& initial);
  static void validateMembers(const std::string& id, const StoreOptions& opts, const Value& initial);
  static void validatePersist(const std::string& id, const persist::PersistOptions& opts);
};

} // namespace sea
