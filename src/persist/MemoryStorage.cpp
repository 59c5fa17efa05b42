#include "sea/persist/MemoryStorage.hpp"

namespace sea::persist {

std::optional<std::string> MemoryStorage::get(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

void MemoryStorage::set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lk(mu_);
  data_[key] = value;
  ++writes_;
}

void MemoryStorage::erase(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  data_.erase(key);
}

std::size_t MemoryStorage::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return data_.size();
}

std::size_t MemoryStorage::writes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return writes_;
}

} // namespace sea::persist
