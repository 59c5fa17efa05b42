#include "sea/Tracer.hpp"
#include "sea/Path.hpp"

namespace sea {

Tracer::Tracer(const Value& root, PathSet& paths, PathSet* reads)
  : root_(&root), paths_(&paths), reads_(reads) {}

Tracer::Tracer(const Value& root, PathSet& paths, PathSet* reads, std::vector<std::string> scope)
  : root_(&root), paths_(&paths), reads_(reads), scope_(std::move(scope)) {}

std::vector<std::string> Tracer::resolve(const std::string& path) const {
  auto segs = scope_;
  for (auto& s : path::split(path)) segs.push_back(std::move(s));
  return segs;
}

void Tracer::record(const std::vector<std::string>& segs, bool terminal) const {
  // scope prefixes were recorded when this tracer was handed out
  std::string cur = path::join(segs, scope_.size());
  for (std::size_t i = scope_.size(); i < segs.size(); ++i) {
    cur = path::child(cur, segs[i]);
    paths_->insert(cur);
  }
  if (terminal && reads_) reads_->insert(path::join(segs));
}

const Value& Tracer::get(const std::string& path) const {
  auto segs = resolve(path);
  record(segs, true);
  const Value* v = path::find(*root_, segs);
  return v ? *v : json::null();
}

bool Tracer::has(const std::string& path) const {
  auto segs = resolve(path);
  record(segs, true);
  return path::find(*root_, segs) != nullptr;
}

Tracer Tracer::at(const std::string& path) const {
  auto segs = resolve(path);
  record(segs, false);
  return Tracer(*root_, *paths_, reads_, std::move(segs));
}

std::string Tracer::scope() const {
  return path::join(scope_);
}

} // namespace sea
