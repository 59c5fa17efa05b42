#pragma once

#include <string>
#include <vector>

#include "sea/Json.hpp"

namespace sea {

/**
 * Write-intercepting view over a store's state, handed to function-form
 * patches. The first write under a top-level key copies that key's subtree;
 * reads see the copies. Nothing reaches the store until the patch returns.
 */
class Draft {
public:
  explicit Draft(const Value& base);

  Draft(const Draft&) = delete;
  Draft& operator=(const Draft&) = delete;

  const Value& get(const std::string& path) const;   // json::null() when absent
  bool has(const std::string& path) const;

  void set(const std::string& path, Value v);

  // Mutable slot at `path` (created as null when missing), for in-place edits
  // such as PushBack on an array.
  Value& edit(const std::string& path);

  // Top-level keys written so far, in first-write order.
  const std::vector<std::string>& touched() const noexcept { return touched_; }

  // Partial object holding the written top-level keys; leaves the draft empty.
  Value take();

private:
  Value& own(const std::string& topKey);

  const Value& base_;
  Value overlay_;
  std::vector<std::string> touched_;
};

} // namespace sea
