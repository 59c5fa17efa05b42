#pragma once

#include <stdexcept>
#include <string>

namespace sea {

// Raised at store definition time: bad id, bad options, duplicate strict create.
class ConfigError : public std::runtime_error {
public:
  ConfigError(const std::string& storeId, const std::string& what)
    : std::runtime_error("[sea] store '" + storeId + "': " + what), storeId_(storeId) {}

  const std::string& storeId() const noexcept { return storeId_; }

private:
  std::string storeId_;
};

} // namespace sea
