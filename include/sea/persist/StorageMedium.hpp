#pragma once

#include <optional>
#include <string>

namespace sea::persist {

// Key/value medium behind a persisted store. Implementations may throw on I/O
// failure; the adapter logs and carries on in memory.
class StorageMedium {
public:
  StorageMedium() = default;
  virtual ~StorageMedium() = default;

  StorageMedium(const StorageMedium&) = delete;
  StorageMedium& operator=(const StorageMedium&) = delete;

  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual void set(const std::string& key, const std::string& value) = 0;
};

} // namespace sea::persist
