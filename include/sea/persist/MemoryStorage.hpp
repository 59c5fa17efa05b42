#pragma once

#include <map>
#include <mutex>
#include <string>

#include "sea/persist/StorageMedium.hpp"

namespace sea::persist {

class MemoryStorage : public StorageMedium {
public:
  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;

  void erase(const std::string& key);
  std::size_t size() const;
  std::size_t writes() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> data_;
  std::size_t writes_ = 0;
};

} // namespace sea::persist
