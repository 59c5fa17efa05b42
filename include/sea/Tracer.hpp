#pragma once

#include <set>
#include <string>
#include <vector>

#include "sea/Json.hpp"

namespace sea {

using PathSet = std::set<std::string>;

/**
 * Read-only view over a state tree that records every path it is asked for.
 * A read of "a.b.c" records "a", "a.b" and "a.b.c" into `paths`, and the
 * full path "a.b.c" alone into `reads` (when given). Nested tracers returned
 * by at() are scoped to a sub-path and record into the same sets; scoping
 * itself only records the traversed prefixes.
 */
class Tracer {
public:
  Tracer(const Value& root, PathSet& paths, PathSet* reads = nullptr);

  const Value& get(const std::string& path) const;   // json::null() when absent
  bool has(const std::string& path) const;
  Tracer at(const std::string& path) const;

  std::string scope() const;
  const PathSet& paths() const noexcept { return *paths_; }

private:
  Tracer(const Value& root, PathSet& paths, PathSet* reads, std::vector<std::string> scope);

  std::vector<std::string> resolve(const std::string& path) const;
  void record(const std::vector<std::string>& segs, bool terminal) const;

  const Value* root_;
  PathSet* paths_;
  PathSet* reads_;
  std::vector<std::string> scope_;
};

} // namespace sea
