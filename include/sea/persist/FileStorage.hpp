#pragma once

#include <string>

#include "sea/persist/StorageMedium.hpp"

namespace sea::persist {

/**
 * One file per key inside `dir`. Writes go to "<file>.tmp" first and are
 * renamed over the target, so a crash never leaves a half-written blob.
 * Keys may only contain [A-Za-z0-9_.-]; anything else throws
 * std::invalid_argument.
 */
class FileStorage : public StorageMedium {
public:
  explicit FileStorage(std::string dir);

  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;

  const std::string& dir() const noexcept { return dir_; }
  std::string fileFor(const std::string& key) const;

private:
  std::string dir_;
};

} // namespace sea::persist
